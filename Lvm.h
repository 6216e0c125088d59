///////////////////////////////////////////////////////////////////////////////
///
/// @file Lvm.h
///
/// LVM2 volume group scan, activation and deactivation.
///
/// Copyright (c) 2005-2015 Parallels IP Holdings GmbH
///
/// This file is part of Virtuozzo Core. Virtuozzo Core is free
/// software; you can redistribute it and/or modify it under the terms
/// of the GNU General Public License as published by the Free Software
/// Foundation; either version 2 of the License, or (at your option) any
/// later version.
///
/// This program is distributed in the hope that it will be useful,
/// but WITHOUT ANY WARRANTY; without even the implied warranty of
/// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
/// GNU General Public License for more details.
///
/// You should have received a copy of the GNU General Public License
/// along with this program; if not, write to the Free Software
/// Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
/// 02110-1301, USA.
///
/// Our contact details: Parallels IP Holdings GmbH, Vordergasse 59, 8200
/// Schaffhausen, Switzerland.
///
///////////////////////////////////////////////////////////////////////////////
#ifndef LVM_H
#define LVM_H

#include <QList>
#include <QSet>
#include <QStringList>

#include "Expected.h"
#include "Util.h"

namespace Lvm
{

// Device-mapper name: dashes inside names are doubled, parts joined by one dash.
QString getMapperName(const QString &group, const QString &volume);

////////////////////////////////////////////////////////////
// Logical

struct Logical
{
	Logical(const QString &name, const QString &mapper):
		m_name(name), m_mapper(mapper)
	{
	}

	const QString& getName() const
	{
		return m_name;
	}

	const QString& getMapper() const
	{
		return m_mapper;
	}

	QString getDevice() const
	{
		return QString("/dev/mapper/") + m_mapper;
	}

	bool operator==(const Logical &other) const
	{
		return m_name == other.m_name && m_mapper == other.m_mapper;
	}

private:
	QString m_name;
	QString m_mapper;
};

////////////////////////////////////////////////////////////
// Group

struct Group
{
	explicit Group(const QString &name):
		m_name(name)
	{
	}

	const QString& getName() const
	{
		return m_name;
	}

	const QList<Logical>& getVolumes() const
	{
		return m_volumes;
	}

	void addVolume(const QString &name)
	{
		m_volumes << Logical(name, getMapperName(m_name, name));
	}

	QString toString() const;

private:
	QString m_name;
	QList<Logical> m_volumes;
};

typedef QList<Group> GroupList;

// Inactive volumes from lvscan --verbose, except those in excluded groups.
GroupList parseLvscan(const QByteArray &out, const QSet<QString> &excluded);

// Output of vgs/pvs with --noheadings -o vg_name.
QSet<QString> parseNames(const QByteArray &out);

////////////////////////////////////////////////////////////
// Handler

struct Handler
{
	explicit Handler(const CallAdapter &adapter):
		m_adapter(adapter)
	{
	}

	// Volume groups known to the host before the image is attached.
	Expected<QSet<QString> > snapshotHost() const;

	Expected<GroupList> rescan(const QStringList &physicals, const QSet<QString> &host) const;
	Expected<void> activate(const GroupList &groups) const;
	void deactivate(const GroupList &groups) const;

private:
	Expected<void> checkCollision(const QString &physical, const QSet<QString> &host) const;

	CallAdapter m_adapter;
};

} // namespace Lvm

#endif // LVM_H
