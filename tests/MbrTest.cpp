///////////////////////////////////////////////////////////////////////////////
///
/// @file MbrTest.cpp
///
/// Unit tests for Mbr.
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
#include <gtest/gtest.h>

#include <QTemporaryDir>
#include <QFile>

#include "Mbr.h"

namespace
{

QByteArray makeMbr(bool signature)
{
	QByteArray bytes(Mbr::MBR_SIZE, '\0');
	if (signature)
	{
		bytes[Mbr::MBR_SIZE - 2] = (char)0x55;
		bytes[Mbr::MBR_SIZE - 1] = (char)0xAA;
	}
	return bytes;
}

void setSlot(QByteArray &bytes, int index, bool boot, quint8 type)
{
	int offset = Mbr::TABLE_OFFSET + index * Mbr::ENTRY_SIZE;
	bytes[offset] = boot ? (char)Mbr::BOOT_FLAG : '\0';
	bytes[offset + Mbr::TYPE_OFFSET] = (char)type;
}

} // namespace

TEST(MbrTest, BootableLinuxPartition)
{
	QByteArray bytes = makeMbr(true);
	setSlot(bytes, 0, true, 0x83);

	Mbr::Table table = Mbr::parse(bytes);
	ASSERT_TRUE(table.m_valid);
	ASSERT_EQ(Mbr::ENTRY_COUNT, table.m_slots.size());
	EXPECT_TRUE(table.m_slots[0].m_boot);
	EXPECT_EQ(0x83, table.m_slots[0].m_typeId);
	EXPECT_EQ(QString("Linux"), table.m_slots[0].m_type);
	EXPECT_EQ(Mbr::ENTRY_SIZE, table.m_slots[0].m_raw.size());
	for (int i = 1; i < Mbr::ENTRY_COUNT; ++i)
		EXPECT_FALSE(table.m_slots[i].m_boot);
	EXPECT_TRUE(table.hasBootable());
}

TEST(MbrTest, ValidOnlyWithSignature)
{
	EXPECT_TRUE(Mbr::parse(makeMbr(true)).m_valid);
	EXPECT_FALSE(Mbr::parse(makeMbr(false)).m_valid);

	for (int last = 0; last < 256; last += 17)
	{
		QByteArray bytes = makeMbr(true);
		bytes[Mbr::MBR_SIZE - 1] = (char)last;
		EXPECT_EQ(last == 0xAA, Mbr::parse(bytes).m_valid) << last;
	}

	QByteArray shortBytes = makeMbr(true).left(Mbr::MBR_SIZE - 1);
	EXPECT_FALSE(Mbr::parse(shortBytes).m_valid);
}

TEST(MbrTest, NoBootFlagAndTypeNames)
{
	QByteArray bytes = makeMbr(true);
	setSlot(bytes, 1, false, 0x8e);
	setSlot(bytes, 2, false, 0x82);

	Mbr::Table table = Mbr::parse(bytes);
	ASSERT_TRUE(table.m_valid);
	EXPECT_FALSE(table.hasBootable());
	EXPECT_EQ(QString("Empty"), table.m_slots[0].m_type);
	EXPECT_EQ(QString("Linux LVM"), table.m_slots[1].m_type);
	EXPECT_EQ(QString("unknown"), Mbr::getTypeName(0xfa));
}

TEST(MbrTest, ReadFromDevice)
{
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	QString path = dir.path() + "/disk";
	QByteArray bytes = makeMbr(true);
	bytes.append(QByteArray(4096, 'x'));
	QFile file(path);
	ASSERT_TRUE(file.open(QIODevice::WriteOnly));
	file.write(bytes);
	file.close();

	Expected<QByteArray> res = Mbr::read(path);
	ASSERT_TRUE(res.isOk());
	EXPECT_EQ(Mbr::MBR_SIZE, res.get().size());
	EXPECT_TRUE(Mbr::parse(res.get()).m_valid);

	Expected<QByteArray> missing = Mbr::read(dir.path() + "/none");
	ASSERT_FALSE(missing.isOk());
	EXPECT_EQ(ERR_MBR_READ, missing.getCode());
}
