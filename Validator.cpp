///////////////////////////////////////////////////////////////////////////////
///
/// @file Validator.cpp
///
/// Cloud import prerequisites check.
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
#include "Validator.h"
#include "Config.h"
#include "StringTable.h"

namespace Validator
{

namespace
{

void checkBootType(const Image::Descriptor &d, const Rules &rules, QStringList &reasons)
{
	if (!d.m_bootloader || !d.m_bootloader->m_bootType)
	{
		reasons << IDS_CHECK_BOOT_TYPE_UNKNOWN;
		return;
	}
	const QString &type = *d.m_bootloader->m_bootType;
	if (!rules.m_validBootTypes.contains(type))
		reasons << QString(IDS_CHECK_BOOT_TYPE).arg(type);
}

void checkMbr(const Image::Descriptor &d, QStringList &reasons)
{
	if (!d.m_mbr.m_valid)
		reasons << IDS_CHECK_MBR_INVALID;
	else if (!d.m_mbr.hasBootable())
		reasons << IDS_CHECK_NO_BOOTABLE;
}

void checkFstab(const Image::Descriptor &d, QStringList &reasons)
{
	if (!d.m_fstabPath)
	{
		reasons << IDS_CHECK_NO_FSTAB;
		return;
	}
	Q_FOREACH(const Fstab::Entry &entry, d.m_fstab)
	{
		switch (Fstab::getSourceKind(entry.m_source))
		{
		case Fstab::SOURCE_UUID:
		case Fstab::SOURCE_LABEL:
		case Fstab::SOURCE_MAPPER:
			// Swap counts here, it only has to exist.
			if (!Fstab::findPartition(entry.m_source, d.m_partitions, QStringList()))
			{
				reasons << QString(IDS_CHECK_FSTAB_UNRESOLVED)
					.arg(entry.m_source, entry.m_mountpoint);
			}
			break;
		case Fstab::SOURCE_DEVICE:
			reasons << QString(IDS_CHECK_FSTAB_DEVICE).arg(entry.m_source, entry.m_mountpoint);
			break;
		default:
			// tmpfs, proc, nfs shares...
			break;
		}
	}
}

void checkBootloader(const Image::Descriptor &d, QStringList &reasons)
{
	if (!d.m_bootloader)
	{
		reasons << IDS_CHECK_NO_BOOTLOADER;
		return;
	}
	const Bootloader::Info &info = *d.m_bootloader;
	QStringList lines = info.getBootLines();
	if (lines.isEmpty())
	{
		reasons << QString(IDS_CHECK_NO_BOOT_LINES).arg(info.m_path);
		return;
	}
	Q_FOREACH(const QString &line, lines)
	{
		bool ok = info.m_flavour == Bootloader::GRUB2
			? line.contains("--fs-uuid")
			: line.contains("root=UUID=") || line.contains("root=/dev/mapper/");
		if (!ok)
			reasons << QString(IDS_CHECK_BOOT_LINE).arg(line);
	}
}

void checkOs(const Image::Descriptor &d, const Rules &rules, QStringList &reasons)
{
	QString name = d.m_release.value("NAME").toUpper();
	if (!rules.m_validOs.contains(name))
		reasons << QString(IDS_CHECK_OS).arg(name.isEmpty() ? QString("unknown") : name);
}

// Format, vmdk flavour and size limits of the import service.
void checkImage(const Image::Descriptor &d, const Rules &rules, QStringList &reasons)
{
	if (!d.m_info)
	{
		reasons << IDS_CHECK_IMAGE_UNKNOWN;
		return;
	}
	const Image::Info &info = *d.m_info;
	if (!rules.m_validImageFormats.contains(info.getFormat()))
		reasons << QString(IDS_CHECK_IMAGE_FORMAT).arg(info.getFormat());
	else if (info.getFormat() == "vmdk")
	{
		QString subtype = info.getSubtype().get_value_or("unknown");
		if (!rules.m_validVmdkTypes.contains(subtype))
			reasons << QString(IDS_CHECK_IMAGE_SUBTYPE).arg(subtype, rules.m_validVmdkTypes.join(", "));
	}

	const quint64 GB = Q_UINT64_C(1) << 30;
	if (info.getVirtualSize() > rules.m_maxImageSizeGb * GB)
	{
		reasons << QString(IDS_CHECK_IMAGE_SIZE)
			.arg(QString::number((double)info.getVirtualSize() / GB, 'f', 2))
			.arg(rules.m_maxImageSizeGb);
	}
}

void checkNetwork(const Image::Descriptor &d, QStringList &reasons)
{
	Q_FOREACH(const Guest::Interface &iface, d.m_network)
	{
		Q_FOREACH(const QString &mac, iface.m_macs)
			reasons << QString(IDS_CHECK_MAC).arg(iface.m_file, mac);
	}
}

} // namespace

////////////////////////////////////////////////////////////
// Rules

Rules::Rules(const Config::Settings &settings):
	m_validBootTypes(settings.m_validBootTypes),
	m_validImageFormats(settings.m_validImageFormats),
	m_validVmdkTypes(settings.m_validVmdkTypes),
	m_maxImageSizeGb(settings.m_maxImageSizeGb)
{
	Q_FOREACH(const QString &os, settings.m_validOs)
		m_validOs << os.toUpper();
}

Image::Verdict validate(const Image::Descriptor &descriptor, const Rules &rules)
{
	Image::Verdict verdict;
	checkBootType(descriptor, rules, verdict.m_reasons);
	checkMbr(descriptor, verdict.m_reasons);
	checkFstab(descriptor, verdict.m_reasons);
	checkBootloader(descriptor, verdict.m_reasons);
	checkOs(descriptor, rules, verdict.m_reasons);
	checkNetwork(descriptor, verdict.m_reasons);
	checkImage(descriptor, rules, verdict.m_reasons);
	verdict.m_pass = verdict.m_reasons.isEmpty();
	return verdict;
}

} // namespace Validator
