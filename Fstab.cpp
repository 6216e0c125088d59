///////////////////////////////////////////////////////////////////////////////
///
/// @file Fstab.cpp
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
#include <QDir>
#include <QFile>
#include <QRegExp>

#include "Fstab.h"
#include "StringTable.h"
#include "Util.h"

namespace Fstab
{

namespace
{
enum {FSTAB_FIELDS = 6};

const char ROOT[] = "/";
const char BOOT[] = "/boot";
const char MAPPER[] = "/dev/mapper/";

} // namespace

////////////////////////////////////////////////////////////
// Entry

QString Entry::toString() const
{
	return QString("%1 %2 %3 %4 %5 %6").arg(m_source, m_mountpoint, m_type, m_options)
		.arg(m_dump).arg(m_pass);
}

SourceKind getSourceKind(const QString &source)
{
	if (source.startsWith("UUID="))
		return SOURCE_UUID;
	if (source.startsWith("LABEL="))
		return SOURCE_LABEL;
	if (source.startsWith(MAPPER))
		return SOURCE_MAPPER;
	if (source.startsWith("/dev/"))
		return SOURCE_DEVICE;
	return SOURCE_OTHER;
}

Expected<QString> locate(const QStringList &roots)
{
	Q_FOREACH(const QString &root, roots)
	{
		QString path = QDir::cleanPath(root + "/etc/fstab");
		if (QFile::exists(path))
		{
			Logger::info(QString("Found fstab at %1").arg(path));
			return path;
		}
	}
	return Expected<QString>::fromMessage(IDS_ERR_FSTAB_NOT_FOUND, ERR_FSTAB_NOT_FOUND);
}

EntryList parse(const QByteArray &data)
{
	EntryList entries;
	QStringList lines = QString::fromUtf8(data).split('\n');
	Q_FOREACH(const QString &line, lines)
	{
		if (line.trimmed().startsWith('#'))
			continue;
		QStringList fields = line.split(QRegExp("\\s+"), QString::SkipEmptyParts);
		if (fields.size() < FSTAB_FIELDS)
			continue;
		Entry entry;
		entry.m_source = fields[0];
		entry.m_mountpoint = fields[1];
		entry.m_type = fields[2];
		entry.m_options = fields[3];
		entry.m_dump = fields[4].toInt();
		entry.m_pass = fields[5].toInt();
		entries << entry;
	}
	return entries;
}

Expected<EntryList> read(const QString &path)
{
	QFile file(path);
	if (!file.open(QIODevice::ReadOnly))
	{
		return Expected<EntryList>::fromMessage(QString("%1: %2")
				.arg(path).arg(file.errorString()), ERR_FSTAB_NOT_FOUND);
	}
	return parse(file.readAll());
}

boost::optional<QString> findPartition(const QString &source,
		const Partition::Map &partitions, const QStringList &skip)
{
	SourceKind kind = getSourceKind(source);
	QString value = source.section('=', 1);
	QString mapper = source.mid(qstrlen(MAPPER));

	Partition::Map::const_iterator it;
	for (it = partitions.constBegin(); it != partitions.constEnd(); ++it)
	{
		const Partition::Record &record = it.value();
		if (skip.contains(record.m_fsType))
			continue;
		switch (kind)
		{
		case SOURCE_UUID:
			if (!record.m_uuid.isEmpty() && record.m_uuid == value)
				return it.key();
			break;
		case SOURCE_LABEL:
			if (record.m_label && *record.m_label == value)
				return it.key();
			break;
		case SOURCE_MAPPER:
			if (!mapper.isEmpty() && it.key().contains(mapper))
				return it.key();
			break;
		default:
			return boost::none;
		}
	}
	return boost::none;
}

////////////////////////////////////////////////////////////
// Resolution

QString Resolution::toString() const
{
	QStringList lines;
	lines << QString("/ on %1 (%2)").arg(m_rootPartition, m_rootMount);
	if (m_bootPartition)
		lines << QString("/boot on %1 (%2)").arg(*m_bootPartition, m_bootMount.get_value_or("-"));
	Q_FOREACH(const Mount::Target &t, m_secondary)
		lines << QString("%1 on %2").arg(t.first, t.second);
	return lines.join("\n");
}

Expected<Resolution> resolve(const EntryList &entries,
		const Partition::Map &partitions, const QStringList &skip)
{
	Resolution result;
	bool root = false;
	Q_FOREACH(const Entry &entry, entries)
	{
		if (skip.contains(entry.m_type) || entry.m_mountpoint == "none")
			continue;

		boost::optional<QString> partition = findPartition(entry.m_source, partitions, skip);
		if (entry.m_mountpoint == ROOT)
		{
			if (!partition)
				continue;
			result.m_rootPartition = *partition;
			result.m_rootMount = partitions.value(*partition).m_mountpoint.get_value_or(QString());
			root = true;
		}
		else if (entry.m_mountpoint == BOOT)
		{
			if (!partition)
			{
				Logger::warning(QString("Unable to find partition of /boot (%1)").arg(entry.m_source));
				continue;
			}
			result.m_bootPartition = *partition;
			result.m_bootMount = partitions.value(*partition).m_mountpoint;
			result.m_secondary << Mount::Target(entry.m_mountpoint, *partition);
		}
		else if (partition)
			result.m_secondary << Mount::Target(entry.m_mountpoint, *partition);
	}

	if (!root)
		return Expected<Resolution>::fromMessage(IDS_ERR_ROOT_NOT_FOUND, ERR_ROOT_NOT_FOUND);
	if (!result.m_bootPartition)
		Logger::info("No separate /boot partition");
	return result;
}

} // namespace Fstab
