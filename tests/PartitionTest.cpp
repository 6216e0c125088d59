///////////////////////////////////////////////////////////////////////////////
///
/// @file PartitionTest.cpp
///
/// Unit tests for Partition.
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

#include "Config.h"
#include "FakeCall.h"
#include "Partition.h"

namespace
{

const char SFDISK_OLD[] =
	"# partition table of /dev/nbd0\n"
	"unit: sectors\n"
	"\n"
	"/dev/nbd0p1 : start=     2048, size=  1024000, Id=83, bootable\n"
	"/dev/nbd0p2 : start=  1026048, size= 19945472, Id=8e\n"
	"/dev/nbd0p3 : start=        0, size=        0, Id= 0\n";

const char SFDISK_NEW[] =
	"label: dos\n"
	"label-id: 0x000b1c4d\n"
	"device: /dev/nbd1\n"
	"unit: sectors\n"
	"\n"
	"/dev/nbd1p1 : start=        2048, size=     2097152, type=83\n"
	"/dev/nbd1p2 : start=     2099200, size=    39843840, type=8e, bootable\n";

const char PARTED[] =
	"Model: Unknown (unknown)\n"
	"Disk /dev/nbd0: 10.7GB\n"
	"Sector size (logical/physical): 512B/512B\n"
	"Partition Table: msdos\n"
	"Disk Flags: \n"
	"\n"
	"Number  Start   End     Size    Type     File system  Flags\n"
	" 1      1049kB  525MB   524MB   primary  xfs          boot\n"
	" 2      525MB   10.7GB  10.2GB  primary               lvm\n";

const char BLKID[] =
	"ID_FS_UUID=7b1d2c5a-08c6-4a8b-9d3f-2b8a4c6e0f11\n"
	"ID_FS_UUID_ENC=7b1d2c5a-08c6-4a8b-9d3f-2b8a4c6e0f11\n"
	"ID_FS_LABEL=boot\n"
	"ID_FS_TYPE=xfs\n"
	"ID_FS_USAGE=filesystem\n";

Partition::Record makeRecord(const QString &type)
{
	Partition::Record record("/dev/nbd0p1");
	record.m_fsType = type;
	return record;
}

} // namespace

TEST(PartitionTest, SfdiskWithIdKeys)
{
	Partition::SfdiskMap map = Partition::parseSfdisk("/dev/nbd0", SFDISK_OLD);
	ASSERT_EQ(3, map.size());

	const Partition::Sfdisk &first = map["/dev/nbd0p1"];
	EXPECT_EQ(2048u, first.m_start);
	EXPECT_EQ(1024000u, first.m_size);
	EXPECT_EQ(QString("83"), first.m_id);
	EXPECT_TRUE(first.m_bootable);

	const Partition::Sfdisk &second = map["/dev/nbd0p2"];
	EXPECT_EQ(1026048u, second.m_start);
	EXPECT_EQ(19945472u, second.m_size);
	EXPECT_EQ(QString("8e"), second.m_id);
	EXPECT_FALSE(second.m_bootable);

	EXPECT_EQ(0u, map["/dev/nbd0p3"].m_size);
}

TEST(PartitionTest, SfdiskWithTypeKeys)
{
	Partition::SfdiskMap map = Partition::parseSfdisk("/dev/nbd1", SFDISK_NEW);
	ASSERT_EQ(2, map.size());
	EXPECT_FALSE(map["/dev/nbd1p1"].m_bootable);
	EXPECT_EQ(QString("83"), map["/dev/nbd1p1"].m_id);
	EXPECT_TRUE(map["/dev/nbd1p2"].m_bootable);
	EXPECT_EQ(39843840u, map["/dev/nbd1p2"].m_size);
	// "device: /dev/nbd1" is a header, not a partition.
	EXPECT_FALSE(map.contains("device"));
}

TEST(PartitionTest, Parted)
{
	Partition::Parted parted = Partition::parseParted(PARTED);
	EXPECT_EQ(QString("Unknown (unknown)"), parted.m_model);
	EXPECT_EQ(QString("10.7GB"), parted.m_disk);
	EXPECT_EQ(QString("msdos"), parted.m_table);
	EXPECT_TRUE(parted.m_diskFlags.isEmpty());
	ASSERT_EQ(2, parted.m_rows.size());
	EXPECT_EQ(QString("boot"), parted.m_rows[0].last());
	EXPECT_EQ(QString("2"), parted.m_rows[1].first());
}

TEST(PartitionTest, Blkid)
{
	Partition::Properties props = Partition::parseBlkid(BLKID);
	EXPECT_EQ(QString("xfs"), props.value("ID_FS_TYPE"));
	EXPECT_EQ(QString("boot"), props.value("ID_FS_LABEL"));
	EXPECT_EQ(5, props.size());
}

TEST(PartitionTest, InspectCombinesBlkidAndLsblk)
{
	fake_type fake(new FakeCall());
	fake->reply("blkid -po udev /dev/nbd0p1", FakeCall::Reply(0, BLKID));
	fake->reply("lsblk -n -o LABEL /dev/nbd0p1", FakeCall::Reply(0, "boot-fs\n"));
	Partition::Analyzer analyzer((CallAdapter(fake)));

	Expected<Partition::Record> record = analyzer.inspect("/dev/nbd0p1");
	ASSERT_TRUE(record.isOk());
	EXPECT_EQ(QString("xfs"), record.get().m_fsType);
	EXPECT_EQ(QString("7b1d2c5a-08c6-4a8b-9d3f-2b8a4c6e0f11"), record.get().m_uuid);
	ASSERT_TRUE(record.get().m_label);
	EXPECT_EQ(QString("boot-fs"), *record.get().m_label);
	EXPECT_FALSE(record.get().m_mountpoint);
}

TEST(PartitionTest, BlkidFindsNothing)
{
	fake_type fake(new FakeCall());
	fake->reply("blkid -po udev /dev/nbd0p3", FakeCall::Reply(2));
	Partition::Analyzer analyzer((CallAdapter(fake)));

	Expected<Partition::Record> record = analyzer.inspect("/dev/nbd0p3");
	ASSERT_TRUE(record.isOk());
	EXPECT_TRUE(record.get().m_fsType.isEmpty());
	EXPECT_FALSE(record.get().m_label);
}

TEST(PartitionTest, EmptySfdiskIsAnError)
{
	fake_type fake(new FakeCall());
	fake->reply("sfdisk -d /dev/nbd0", FakeCall::Reply(0, "unit: sectors\n"));
	Partition::Analyzer analyzer((CallAdapter(fake)));

	EXPECT_FALSE(analyzer.collectSfdisk("/dev/nbd0").isOk());
}

TEST(PartitionTest, Classify)
{
	Config::Settings settings;
	Partition::Classifier classifier(settings);

	Expected<Partition::Usage> usage = classifier.classify(makeRecord("ext4"));
	ASSERT_TRUE(usage.isOk());
	EXPECT_EQ(Partition::USAGE_STANDARD, usage.get());

	usage = classifier.classify(makeRecord("LVM2_member"));
	ASSERT_TRUE(usage.isOk());
	EXPECT_EQ(Partition::USAGE_STANDARD, usage.get());
	EXPECT_TRUE(classifier.isLogicalVolume(makeRecord("LVM2_member")));

	usage = classifier.classify(makeRecord("swap"));
	ASSERT_TRUE(usage.isOk());
	EXPECT_EQ(Partition::USAGE_NA, usage.get());

	usage = classifier.classify(makeRecord(""));
	ASSERT_TRUE(usage.isOk());
	EXPECT_EQ(Partition::USAGE_NA, usage.get());

	usage = classifier.classify(makeRecord("ntfs"));
	ASSERT_FALSE(usage.isOk());
	EXPECT_EQ(ERR_UNSUPPORTED_PARTITION, usage.getCode());
}
