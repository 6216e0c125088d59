///////////////////////////////////////////////////////////////////////////////
///
/// @file Mbr.cpp
///
/// Master boot record decoding.
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
#include <QFile>
#include <QStringList>

#include "Mbr.h"
#include "Util.h"
#include "StringTable.h"

namespace Mbr
{

namespace
{

struct TypeName
{
	quint8 id;
	const char *name;
};

const TypeName TYPE_NAMES[] =
{
	{0x00, "Empty"},
	{0x01, "FAT12"},
	{0x02, "XENIX root"},
	{0x03, "XENIX usr"},
	{0x04, "FAT16 <32M"},
	{0x05, "Extended"},
	{0x06, "FAT16"},
	{0x07, "HPFS/NTFS"},
	{0x08, "AIX"},
	{0x09, "AIX bootable"},
	{0x0a, "OS/2 Boot Manag"},
	{0x0b, "W95 FAT32"},
	{0x0c, "W95 FAT32 (LBA)"},
	{0x0e, "W95 FAT16 (LBA)"},
	{0x0f, "W95 Extd (LBA)"},
	{0x10, "OPUS"},
	{0x11, "Hidden FAT12"},
	{0x12, "Compaq diagnost"},
	{0x14, "Hidden FAT16 <32>"},
	{0x16, "Hidden FAT16"},
	{0x17, "Hidden HPFS/NTFS"},
	{0x18, "AST SmartSleep"},
	{0x1b, "Hidden W95 FAT32"},
	{0x1c, "Hidden W95 FAT32"},
	{0x1e, "Hidden W95 FAT16"},
	{0x24, "NEC DOS"},
	{0x39, "Plan 9"},
	{0x3c, "PartitionMagic"},
	{0x40, "Venix 80286"},
	{0x41, "PPC PReP Boot"},
	{0x42, "SFS"},
	{0x4d, "QNX4.x"},
	{0x4e, "QNX4.x 2nd part"},
	{0x4f, "QNX4.x 3rd part"},
	{0x50, "OnTrack DM"},
	{0x51, "OnTrack DM6 Aux"},
	{0x52, "CP/M"},
	{0x53, "OnTrack DM6 Aux"},
	{0x54, "OnTrackDM6"},
	{0x55, "EZ-Drive"},
	{0x56, "Golden Bow"},
	{0x5c, "Priam Edisk"},
	{0x61, "SpeedStor"},
	{0x63, "GNU HURD or Sys"},
	{0x64, "Novell Netware"},
	{0x65, "Novell Netware"},
	{0x70, "DiskSecure Mult"},
	{0x75, "PC/IX"},
	{0x80, "Old Minix"},
	{0x81, "Minix / old Lin"},
	{0x82, "Linux swap / Solaris x86"},
	{0x83, "Linux"},
	{0x84, "OS/2 hidden C:"},
	{0x85, "Linux extended"},
	{0x86, "NTFS volume set"},
	{0x87, "NTFS volume set"},
	{0x88, "Linux plaintext"},
	{0x8e, "Linux LVM"},
	{0x93, "Amoeba"},
	{0x94, "Amoeba BBT"},
	{0x9f, "BSD/OS"},
	{0xa0, "IBM Thinkpad hi"},
	{0xa5, "FreeBSD"},
	{0xa6, "OpenBSD"},
	{0xa7, "NeXTSTEP"},
	{0xa8, "Darwin UFS"},
	{0xa9, "NetBSD"},
	{0xab, "Darwin boot"},
	{0xaf, "HFS / HFS+"},
	{0xb7, "BSDI fs"},
	{0xb8, "BSDI swap"},
	{0xbb, "Boot Wizard hid"},
	{0xbe, "Solaris boot"},
	{0xbf, "Solaris"},
	{0xc1, "DRDOS/sec (FAT-12)"},
	{0xc4, "DRDOS/sec (FAT-16)"},
	{0xc6, "DRDOS/sec (FAT-16B)"},
	{0xc7, "Syrinx"},
	{0xda, "Non-FS data"},
	{0xdb, "CP/M / CTOS / ."},
	{0xde, "Dell Utility"},
	{0xdf, "BootIt"},
	{0xe1, "DOS access"},
	{0xe3, "DOS R/O"},
	{0xe4, "SpeedStor"},
	{0xeb, "BeOS fs"},
	{0xee, "GPT"},
	{0xef, "EFI (FAT-12/16/"},
	{0xf0, "Linux/PA-RISC b"},
	{0xf1, "SpeedStor"},
	{0xf2, "DOS secondary"},
	{0xf4, "SpeedStor"},
	{0xfb, "VMware VMFS"},
	{0xfc, "VMware VMKCORE"},
	{0xfd, "Linux raid auto"},
	{0xfe, "LANstep"},
	{0xff, "BBT"}
};

} // namespace

QString getTypeName(quint8 id)
{
	for (size_t i = 0; i < sizeof(TYPE_NAMES) / sizeof(TYPE_NAMES[0]); ++i)
	{
		if (TYPE_NAMES[i].id == id)
			return TYPE_NAMES[i].name;
	}
	return "unknown";
}

////////////////////////////////////////////////////////////
// Table

bool Table::hasBootable() const
{
	Q_FOREACH(const Slot &slot, m_slots)
	{
		if (slot.m_boot)
			return true;
	}
	return false;
}

QString Table::toString() const
{
	if (!m_valid)
		return "invalid";
	QStringList lines;
	for (int i = 0; i < m_slots.size(); ++i)
	{
		const Slot &s = m_slots[i];
		lines << QString("%1: %2 %3 (%4)").arg(i)
			.arg(s.m_boot ? "*" : " ")
			.arg((uint)s.m_typeId, 2, 16, QChar('0'))
			.arg(s.m_type);
	}
	return lines.join("\n");
}

Table parse(const QByteArray &bytes)
{
	Table table;
	if (bytes.size() != MBR_SIZE ||
		(quint8)bytes[MBR_SIZE - 2] != 0x55 ||
		(quint8)bytes[MBR_SIZE - 1] != 0xAA)
	{
		Logger::info("No master boot record signature");
		return table;
	}

	table.m_valid = true;
	for (int i = 0; i < ENTRY_COUNT; ++i)
	{
		Slot slot;
		slot.m_raw = bytes.mid(TABLE_OFFSET + i * ENTRY_SIZE, ENTRY_SIZE);
		slot.m_boot = (quint8)slot.m_raw[0] == BOOT_FLAG;
		slot.m_typeId = (quint8)slot.m_raw[TYPE_OFFSET];
		slot.m_type = getTypeName(slot.m_typeId);
		table.m_slots << slot;
	}
	return table;
}

Expected<QByteArray> read(const QString &device)
{
	QFile file(device);
	if (!file.open(QIODevice::ReadOnly))
	{
		return Expected<QByteArray>::fromMessage(QString(IDS_ERR_MBR_READ)
				.arg(device) + ": " + file.errorString(), ERR_MBR_READ);
	}
	QByteArray bytes = file.read(MBR_SIZE);
	if (bytes.size() != MBR_SIZE)
	{
		return Expected<QByteArray>::fromMessage(QString(IDS_ERR_MBR_READ)
				.arg(device), ERR_MBR_READ);
	}
	return bytes;
}

} // namespace Mbr
