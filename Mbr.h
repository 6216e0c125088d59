///////////////////////////////////////////////////////////////////////////////
///
/// @file Mbr.h
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
#ifndef MBR_H
#define MBR_H

#include <QList>
#include <QString>
#include <QByteArray>

#include "Expected.h"

namespace Mbr
{

enum
{
	MBR_SIZE = 512,
	TABLE_OFFSET = 446,
	ENTRY_SIZE = 16,
	ENTRY_COUNT = 4,
	BOOT_FLAG = 0x80,
	TYPE_OFFSET = 4
};

////////////////////////////////////////////////////////////
// Slot

struct Slot
{
	Slot(): m_boot(false), m_typeId(0)
	{
	}

	bool m_boot;
	quint8 m_typeId;
	QString m_type;
	QByteArray m_raw;
};

////////////////////////////////////////////////////////////
// Table

struct Table
{
	Table(): m_valid(false)
	{
	}

	bool hasBootable() const;
	QString toString() const;

	bool m_valid;
	// Empty unless m_valid.
	QList<Slot> m_slots;
};

// Name of partition type id, "unknown" for unlisted ids.
QString getTypeName(quint8 id);

Table parse(const QByteArray &bytes);

Expected<QByteArray> read(const QString &device);

} // namespace Mbr

#endif // MBR_H
