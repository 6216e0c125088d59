///////////////////////////////////////////////////////////////////////////////
///
/// @file Partition.cpp
///
/// Partition table and filesystem analysis.
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
#include <QRegExp>

#include "Partition.h"
#include "Config.h"
#include "StringTable.h"

namespace Partition
{

namespace
{
const char PARTED[] = "parted";
const char SFDISK[] = "sfdisk";
const char BLKID[] = "blkid";
const char LSBLK[] = "lsblk";

// blkid -p exits with 2 when nothing was detected.
enum {BLKID_NOTHING_FOUND = 2};

QString afterColon(const QString &line)
{
	return line.section(':', 1).trimmed();
}

} // namespace

QString getUsageName(Usage usage)
{
	switch (usage)
	{
	case USAGE_STANDARD:
		return "standard";
	case USAGE_ROOT:
		return "root";
	case USAGE_BOOT:
		return "boot";
	default:
		return "na";
	}
}

////////////////////////////////////////////////////////////
// Record

QString Record::toString() const
{
	QStringList fields;
	fields << m_device
		<< QString("type=%1").arg(m_fsType.isEmpty() ? "-" : m_fsType)
		<< QString("uuid=%1").arg(m_uuid.isEmpty() ? "-" : m_uuid)
		<< QString("usage=%1").arg(getUsageName(m_usage));
	if (m_label && !m_label->isEmpty())
		fields << QString("label=%1").arg(*m_label);
	if (m_bootable)
		fields << "bootable";
	if (m_lvm)
		fields << "lvm";
	if (!m_fstabMount.isEmpty())
		fields << QString("fstab=%1").arg(m_fstabMount);
	if (m_mountpoint)
		fields << QString("mounted=%1").arg(*m_mountpoint);
	return fields.join(" ");
}

////////////////////////////////////////////////////////////
// Parted

QString Parted::toString() const
{
	QStringList lines;
	lines << QString("Model: %1").arg(m_model)
		<< QString("Disk: %1").arg(m_disk)
		<< QString("Partition Table: %1").arg(m_table)
		<< QString("Disk Flags: %1").arg(m_diskFlags);
	Q_FOREACH(const QStringList &row, m_rows)
		lines << row.join(" ");
	return lines.join("\n");
}

Parted parseParted(const QByteArray &out)
{
	Parted parted;
	QStringList lines = QString::fromUtf8(out).split('\n');
	Q_FOREACH(const QString &line, lines)
	{
		if (line.contains("Model:"))
			parted.m_model = afterColon(line);
		// Before "Disk", which is a prefix.
		else if (line.contains("Disk Flags:"))
			parted.m_diskFlags = afterColon(line);
		else if (line.contains("Disk"))
			parted.m_disk = afterColon(line);
		else if (line.contains("Partition Table:"))
			parted.m_table = afterColon(line);
		else
		{
			QStringList tokens = line.split(QRegExp("\\s+"), QString::SkipEmptyParts);
			if (tokens.isEmpty())
				continue;
			bool number = false;
			tokens.first().toUInt(&number);
			if (number)
				parted.m_rows << tokens;
		}
	}
	return parted;
}

////////////////////////////////////////////////////////////
// sfdisk -d
//
// /dev/nbd0p1 : start=        2048, size=     2097152, type=83, bootable

SfdiskMap parseSfdisk(const QString &device, const QByteArray &out)
{
	SfdiskMap result;
	QStringList lines = QString::fromUtf8(out).split('\n');
	Q_FOREACH(const QString &line, lines)
	{
		if (!line.startsWith(device))
			continue;

		QString key = line.section(':', 0, 0).trimmed();
		Sfdisk entry;
		QStringList items = line.section(':', 1).split(',');
		Q_FOREACH(const QString &item, items)
		{
			QString name = item.section('=', 0, 0).trimmed();
			QString value = item.section('=', 1).trimmed();
			if (name == "start")
				entry.m_start = value.toULongLong();
			else if (name == "size")
				entry.m_size = value.toULongLong();
			else if (name == "Id" || name == "type")
				entry.m_id = value;
			else if (name == "bootable")
				entry.m_bootable = true;
			else
				Logger::info(QString("sfdisk: ignoring '%1'").arg(item.trimmed()));
		}
		result.insert(key, entry);
	}
	return result;
}

Properties parseBlkid(const QByteArray &out)
{
	Properties result;
	QStringList lines = QString::fromUtf8(out).split('\n', QString::SkipEmptyParts);
	Q_FOREACH(const QString &line, lines)
	{
		int pos = line.indexOf('=');
		if (pos <= 0)
			continue;
		result.insert(line.left(pos).trimmed(), line.mid(pos + 1).trimmed());
	}
	return result;
}

////////////////////////////////////////////////////////////
// Analyzer

Expected<Parted> Analyzer::collectParted(const QString &device) const
{
	Expected<QByteArray> out = m_adapter.execute(PARTED, QStringList() << device << "print");
	if (!out.isOk())
		return out;
	return parseParted(out.get());
}

Expected<SfdiskMap> Analyzer::collectSfdisk(const QString &device) const
{
	Expected<QByteArray> out = m_adapter.execute(SFDISK, QStringList() << "-d" << device);
	if (!out.isOk())
		return out;
	SfdiskMap result = parseSfdisk(device, out.get());
	if (result.isEmpty())
	{
		return Expected<SfdiskMap>::fromMessage(
				QString(IDS_ERR_CANNOT_GET_PART_LIST).arg(device), ERR_COMMAND_FAILED);
	}
	return result;
}

Expected<Properties> Analyzer::collectBlkid(const QString &partition) const
{
	QStringList args;
	args << "-po" << "udev" << partition;
	Expected<Exec::Result> res = m_adapter.run(BLKID, args);
	if (!res.isOk())
		return res;
	if (res.get().m_code == BLKID_NOTHING_FOUND)
		return Properties();
	if (res.get().m_code != 0)
	{
		return Expected<Properties>::fromMessage(QString(IDS_ERR_SUBPROGRAM_RETURN_CODE)
				.arg(BLKID).arg(args.join(" ")).arg(res.get().m_code), ERR_COMMAND_FAILED);
	}
	return parseBlkid(res.get().m_out);
}

Expected<QString> Analyzer::collectLabel(const QString &partition) const
{
	Expected<QByteArray> out = m_adapter.execute(LSBLK,
			QStringList() << "-n" << "-o" << "LABEL" << partition);
	if (!out.isOk())
		return out;
	return QString::fromUtf8(out.get()).trimmed();
}

Expected<Record> Analyzer::inspect(const QString &partition) const
{
	Expected<Properties> blkid = collectBlkid(partition);
	if (!blkid.isOk())
		return blkid;

	Record record(partition);
	record.m_blkid = blkid.get();
	record.m_fsType = blkid.get().value("ID_FS_TYPE");
	record.m_uuid = blkid.get().value("ID_FS_UUID");
	if (blkid.get().contains("ID_FS_LABEL"))
		record.m_label = blkid.get().value("ID_FS_LABEL");

	Expected<QString> label = collectLabel(partition);
	if (label.isOk())
	{
		if (!label.get().isEmpty())
			record.m_label = label.get();
	}
	else
		Logger::warning(label.getMessage());

	Logger::info(QString("Partition %1").arg(record.toString()));
	return record;
}

////////////////////////////////////////////////////////////
// Classifier

Classifier::Classifier(const Config::Settings &settings):
	m_filesystems(settings.m_filesystemTypes),
	m_logical(settings.m_logicalVolumeTypes),
	m_skip(settings.m_partitionsToSkip)
{
}

Expected<Usage> Classifier::classify(const Record &record) const
{
	if (record.m_fsType.isEmpty())
	{
		Logger::warning(QString("No filesystem detected on %1").arg(record.m_device));
		return USAGE_NA;
	}
	if (m_filesystems.contains(record.m_fsType) || m_logical.contains(record.m_fsType))
		return USAGE_STANDARD;
	if (m_skip.contains(record.m_fsType))
		return USAGE_NA;
	return Expected<Usage>::fromMessage(QString(IDS_ERR_FS_UNSUPPORTED)
			.arg(record.m_fsType).arg(record.m_device), ERR_UNSUPPORTED_PARTITION);
}

} // namespace Partition
