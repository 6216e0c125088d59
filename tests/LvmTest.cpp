///////////////////////////////////////////////////////////////////////////////
///
/// @file LvmTest.cpp
///
/// Unit tests for Lvm.
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

#include "FakeCall.h"
#include "Lvm.h"

namespace
{

const char LVSCAN[] =
	"  ACTIVE            '/dev/vg01/lv_root' [10.00 GiB] inherit\n"
	"  inactive          '/dev/vg02/lv_data' [5.00 GiB] inherit\n";

const char LVSCAN_IMAGE[] =
	"  ACTIVE            '/dev/host_vg/root' [50.00 GiB] inherit\n"
	"  inactive          '/dev/ol/root' [17.00 GiB] inherit\n"
	"  inactive          '/dev/ol/swap' [2.00 GiB] inherit\n"
	"  inactive          '/dev/data-vg/lv-home' [4.00 GiB] inherit\n";

} // namespace

TEST(LvmTest, OnlyInactiveVolumesAreNew)
{
	Lvm::GroupList groups = Lvm::parseLvscan(LVSCAN, QSet<QString>());
	ASSERT_EQ(1, groups.size());
	EXPECT_EQ(QString("vg02"), groups[0].getName());
	ASSERT_EQ(1, groups[0].getVolumes().size());
	EXPECT_EQ(QString("lv_data"), groups[0].getVolumes()[0].getName());
	EXPECT_EQ(QString("vg02-lv_data"), groups[0].getVolumes()[0].getMapper());
	EXPECT_EQ(QString("/dev/mapper/vg02-lv_data"), groups[0].getVolumes()[0].getDevice());
}

TEST(LvmTest, MapperNameDoublesDashes)
{
	EXPECT_EQ(QString("data--vg-lv--home"), Lvm::getMapperName("data-vg", "lv-home"));
	EXPECT_EQ(QString("ol-root"), Lvm::getMapperName("ol", "root"));
}

TEST(LvmTest, GroupsVolumesAndExcludesHost)
{
	QSet<QString> host;
	host << "data-vg";
	Lvm::GroupList groups = Lvm::parseLvscan(LVSCAN_IMAGE, host);
	ASSERT_EQ(1, groups.size());
	EXPECT_EQ(QString("ol"), groups[0].getName());
	ASSERT_EQ(2, groups[0].getVolumes().size());
	EXPECT_EQ(QString("swap"), groups[0].getVolumes()[1].getName());
}

TEST(LvmTest, RescanSequence)
{
	fake_type fake(new FakeCall());
	fake->reply("pvs --noheadings -o vg_name /dev/nbd0p2", FakeCall::Reply(0, "  ol\n"));
	fake->reply("lvscan --verbose", FakeCall::Reply(0, LVSCAN_IMAGE));
	Lvm::Handler lvm((CallAdapter(fake)));

	QSet<QString> host;
	host << "host_vg";
	Expected<Lvm::GroupList> groups = lvm.rescan(QStringList() << "/dev/nbd0p2", host);
	ASSERT_TRUE(groups.isOk());
	EXPECT_EQ(2, groups.get().size());

	QStringList expected;
	expected << "pvscan --cache /dev/nbd0p2"
		<< "pvs --noheadings -o vg_name /dev/nbd0p2"
		<< "vgscan --verbose"
		<< "lvscan --verbose";
	EXPECT_EQ(expected, fake->getLog());
}

TEST(LvmTest, HostGroupNameCollisionFails)
{
	fake_type fake(new FakeCall());
	fake->reply("vgs --noheadings -o vg_name", FakeCall::Reply(0, "  ol\n  home\n"));
	fake->reply("pvs --noheadings -o vg_name /dev/nbd0p2", FakeCall::Reply(0, "  ol\n"));
	Lvm::Handler lvm((CallAdapter(fake)));

	Expected<QSet<QString> > host = lvm.snapshotHost();
	ASSERT_TRUE(host.isOk());
	EXPECT_EQ(2, host.get().size());

	Expected<Lvm::GroupList> groups = lvm.rescan(QStringList() << "/dev/nbd0p2", host.get());
	ASSERT_FALSE(groups.isOk());
	EXPECT_EQ(ERR_VG_COLLISION, groups.getCode());
	EXPECT_TRUE(fake->getLog("lvscan").isEmpty());
}

TEST(LvmTest, ActivationIsCheckedByOutput)
{
	Lvm::GroupList groups;
	groups << Lvm::Group("ol") << Lvm::Group("data");

	fake_type fake(new FakeCall());
	fake->reply("vgchange --activate y", FakeCall::Reply(0,
			"  1 logical volume(s) in volume group \"host_vg\" now active\n"
			"  2 logical volume(s) in volume group \"ol\" now active\n"));
	Lvm::Handler lvm((CallAdapter(fake)));

	Expected<void> res = lvm.activate(groups);
	ASSERT_FALSE(res.isOk());
	EXPECT_EQ(ERR_ACTIVATION_FAILED, res.getCode());
	EXPECT_TRUE(res.getMessage().contains("data"));

	EXPECT_TRUE(lvm.activate(Lvm::GroupList() << Lvm::Group("ol")).isOk());
}

TEST(LvmTest, ActivationMatchesWholeGroupName)
{
	fake_type fake(new FakeCall());
	fake->reply("vgchange --activate y", FakeCall::Reply(0,
			"  1 logical volume(s) in volume group \"vg01\" now active\n"
			"  1 logical volume(s) in volume group \"my-vg0\" now active\n"));
	Lvm::Handler lvm((CallAdapter(fake)));

	Expected<void> res = lvm.activate(Lvm::GroupList() << Lvm::Group("vg0"));
	ASSERT_FALSE(res.isOk());
	EXPECT_EQ(ERR_ACTIVATION_FAILED, res.getCode());

	EXPECT_TRUE(lvm.activate(Lvm::GroupList() << Lvm::Group("vg01") << Lvm::Group("my-vg0")).isOk());
}

TEST(LvmTest, DeactivateLogsFailuresAndContinues)
{
	Lvm::GroupList groups;
	groups << Lvm::Group("ol") << Lvm::Group("data");

	fake_type fake(new FakeCall());
	fake->reply("vgchange --activate n ol", FakeCall::Reply(5));
	Lvm::Handler lvm((CallAdapter(fake)));
	lvm.deactivate(groups);

	QStringList expected;
	expected << "vgchange --activate n ol" << "pvscan --cache"
		<< "vgchange --activate n data" << "pvscan --cache";
	EXPECT_EQ(expected, fake->getLog());
}
