///////////////////////////////////////////////////////////////////////////////
///
/// @file Fstab.h
///
/// Guest fstab parsing and root/boot partition resolution.
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
#ifndef FSTAB_H
#define FSTAB_H

#include <QList>
#include <QString>
#include <QStringList>
#include <QByteArray>

#include <boost/optional.hpp>

#include "Expected.h"
#include "Mount.h"
#include "Partition.h"

namespace Fstab
{

////////////////////////////////////////////////////////////
// Entry

struct Entry
{
	QString toString() const;

	QString m_source;
	QString m_mountpoint;
	QString m_type;
	QString m_options;
	int m_dump;
	int m_pass;
};

typedef QList<Entry> EntryList;

enum SourceKind
{
	SOURCE_UUID,
	SOURCE_LABEL,
	SOURCE_MAPPER,
	SOURCE_DEVICE,
	SOURCE_OTHER
};

SourceKind getSourceKind(const QString &source);

// First <root>/etc/fstab that exists.
Expected<QString> locate(const QStringList &roots);

EntryList parse(const QByteArray &data);
Expected<EntryList> read(const QString &path);

// Partition matched by an fstab source. Skipped types never match.
boost::optional<QString> findPartition(const QString &source,
		const Partition::Map &partitions, const QStringList &skip);

////////////////////////////////////////////////////////////
// Resolution

struct Resolution
{
	QString m_rootPartition;
	QString m_rootMount;
	boost::optional<QString> m_bootPartition;
	boost::optional<QString> m_bootMount;
	// Other resolved filesystems, mounted into the root tree.
	QList<Mount::Target> m_secondary;

	QString toString() const;
};

Expected<Resolution> resolve(const EntryList &entries,
		const Partition::Map &partitions, const QStringList &skip);

} // namespace Fstab

#endif // FSTAB_H
