///////////////////////////////////////////////////////////////////////////////
///
/// @file Descriptor.h
///
/// Everything learned about an image during preparation.
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
#ifndef DESCRIPTOR_H
#define DESCRIPTOR_H

#include <QList>
#include <QString>
#include <QStringList>
#include <QByteArray>

#include <boost/optional.hpp>

#include "ImageInfo.h"
#include "Mbr.h"
#include "Partition.h"
#include "Lvm.h"
#include "Fstab.h"
#include "Guest.h"
#include "Bootloader.h"

namespace Image
{

////////////////////////////////////////////////////////////
// Verdict

struct Verdict
{
	Verdict(): m_pass(false)
	{
	}

	bool m_pass;
	QStringList m_reasons;
};

////////////////////////////////////////////////////////////
// Descriptor

// Everything learned about one image during a migration run.
struct Descriptor
{
	explicit Descriptor(const QString &path):
		m_path(path)
	{
	}

	QString toString() const;

	QString m_path;
	boost::optional<Info> m_info;
	boost::optional<QString> m_device;

	QByteArray m_mbrBytes;
	Mbr::Table m_mbr;
	Partition::Parted m_parted;
	Partition::SfdiskMap m_sfdisk;
	Partition::Map m_partitions;
	Lvm::GroupList m_groups;

	boost::optional<QString> m_fstabPath;
	Fstab::EntryList m_fstab;
	boost::optional<Fstab::Resolution> m_resolution;

	Guest::Release m_release;
	boost::optional<Bootloader::Info> m_bootloader;
	QList<Guest::Interface> m_network;
	QString m_plugin;

	boost::optional<Verdict> m_verdict;
};

} // namespace Image

#endif // DESCRIPTOR_H
