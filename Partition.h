///////////////////////////////////////////////////////////////////////////////
///
/// @file Partition.h
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
#ifndef PARTITION_H
#define PARTITION_H

#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QByteArray>

#include <boost/optional.hpp>

#include "Expected.h"
#include "Util.h"

namespace Config
{
struct Settings;
} // namespace Config

namespace Partition
{

enum Usage
{
	USAGE_NA,
	USAGE_STANDARD,
	USAGE_ROOT,
	USAGE_BOOT
};

QString getUsageName(Usage usage);

typedef QMap<QString, QString> Properties;

////////////////////////////////////////////////////////////
// Record

struct Record
{
	explicit Record(const QString &device = QString()):
		m_device(device), m_usage(USAGE_NA), m_bootable(false),
		m_start(0), m_size(0), m_lvm(false)
	{
	}

	QString toString() const;

	QString m_device;
	QString m_fsType;
	QString m_uuid;
	boost::optional<QString> m_label;
	Usage m_usage;
	bool m_bootable;
	quint64 m_start;
	quint64 m_size;
	QString m_id;
	// Set only while mounted.
	boost::optional<QString> m_mountpoint;
	// Mountpoint in guest fstab for secondary filesystems (/var, /home...).
	QString m_fstabMount;
	bool m_lvm;
	Properties m_blkid;
};

// Keyed by device path.
typedef QMap<QString, Record> Map;

////////////////////////////////////////////////////////////
// Parted

struct Parted
{
	QString toString() const;

	QString m_model;
	QString m_disk;
	QString m_diskFlags;
	QString m_table;
	QList<QStringList> m_rows;
};

////////////////////////////////////////////////////////////
// Sfdisk

struct Sfdisk
{
	Sfdisk(): m_start(0), m_size(0), m_bootable(false)
	{
	}

	quint64 m_start;
	quint64 m_size;
	QString m_id;
	bool m_bootable;
};

typedef QMap<QString, Sfdisk> SfdiskMap;

Parted parseParted(const QByteArray &out);
SfdiskMap parseSfdisk(const QString &device, const QByteArray &out);
Properties parseBlkid(const QByteArray &out);

////////////////////////////////////////////////////////////
// Analyzer

struct Analyzer
{
	explicit Analyzer(const CallAdapter &adapter):
		m_adapter(adapter)
	{
	}

	Expected<Parted> collectParted(const QString &device) const;
	Expected<SfdiskMap> collectSfdisk(const QString &device) const;
	Expected<Properties> collectBlkid(const QString &partition) const;
	Expected<QString> collectLabel(const QString &partition) const;

	// Record filled from blkid and lsblk.
	Expected<Record> inspect(const QString &partition) const;

private:
	CallAdapter m_adapter;
};

////////////////////////////////////////////////////////////
// Classifier

struct Classifier
{
	explicit Classifier(const Config::Settings &settings);

	Expected<Usage> classify(const Record &record) const;

	bool isLogicalVolume(const Record &record) const
	{
		return m_logical.contains(record.m_fsType);
	}

	bool isSkipped(const Record &record) const
	{
		return m_skip.contains(record.m_fsType);
	}

private:
	QStringList m_filesystems;
	QStringList m_logical;
	QStringList m_skip;
};

} // namespace Partition

#endif // PARTITION_H
