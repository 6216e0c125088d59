///////////////////////////////////////////////////////////////////////////////
///
/// @file Mount.h
///
/// Mounting image filesystems and unmounting them in reverse order.
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
#ifndef MOUNT_H
#define MOUNT_H

#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>

#include <boost/optional.hpp>

#include "Expected.h"
#include "Config.h"
#include "Util.h"

namespace Mount
{

////////////////////////////////////////////////////////////
// Entry

struct Entry
{
	Entry(const QString &path, bool created):
		m_path(path), m_created(created)
	{
	}

	QString m_path;
	// Directory was created by us and is removed after unmount.
	bool m_created;
};

////////////////////////////////////////////////////////////
// Set

// Mountpoints in order of creation. Unwound in reverse.
struct Set
{
	void append(const QString &path, bool created)
	{
		m_entries << Entry(path, created);
	}

	const QList<Entry>& getEntries() const
	{
		return m_entries;
	}

	bool isEmpty() const
	{
		return m_entries.isEmpty();
	}

	Entry takeLast()
	{
		return m_entries.takeLast();
	}

private:
	QList<Entry> m_entries;
};

// Guest mountpoint (/var, /boot...) and the device to put there.
typedef QPair<QString, QString> Target;

////////////////////////////////////////////////////////////
// Manager

struct Manager
{
	Manager(const CallAdapter &adapter, const Config::Settings &settings, Set &set):
		m_adapter(adapter), m_loopbackRoot(settings.m_loopbackRoot),
		m_retry(settings.m_retry), m_set(set)
	{
	}

	// Without mountpoint, mounts to <loopback root>/<device name>.
	Expected<QString> mountPartition(const QString &device,
			const boost::optional<QString> &mountpoint = boost::none);

	// /proc, /dev and /sys for the tree at root.
	Expected<QStringList> mountPseudo(const QString &root);

	// Mount secondary guest filesystems into the tree at root.
	Expected<void> remount(const QString &root, QList<Target> targets);

	Expected<void> unmount(const QString &mountpoint) const;

	// Unmount everything in the set, last first. Continues on failures.
	bool unmountAll();

private:
	Expected<void> mount(const QStringList &args) const;
	Expected<void> umount(const QString &mountpoint) const;
	Expected<QString> mountAt(const QStringList &options, const QString &source, const QString &mountpoint);

	CallAdapter m_adapter;
	QString m_loopbackRoot;
	Config::Retries m_retry;
	Set &m_set;
};

} // namespace Mount

#endif // MOUNT_H
