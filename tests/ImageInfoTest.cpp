///////////////////////////////////////////////////////////////////////////////
///
/// @file ImageInfoTest.cpp
///
/// Unit tests for ImageInfo.
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
#include "ImageInfo.h"

namespace
{

const char QCOW2[] =
	"{\n"
	"    \"virtual-size\": 42949672960,\n"
	"    \"filename\": \"/var/lib/images/ol7.qcow2\",\n"
	"    \"cluster-size\": 65536,\n"
	"    \"format\": \"qcow2\",\n"
	"    \"actual-size\": 1876426752,\n"
	"    \"backing-filename\": \"base.qcow2\",\n"
	"    \"full-backing-filename\": \"/var/lib/images/base.qcow2\",\n"
	"    \"dirty-flag\": false\n"
	"}\n";

} // namespace

TEST(ImageInfoTest, ParseQcow2)
{
	Expected<Image::Info> info = Image::Parser::parse(QCOW2);
	ASSERT_TRUE(info.isOk());
	EXPECT_EQ(QString("/var/lib/images/ol7.qcow2"), info.get().getFilename());
	EXPECT_EQ(Q_UINT64_C(42949672960), info.get().getVirtualSize());
	EXPECT_EQ(Q_UINT64_C(1876426752), info.get().getActualSize());
	EXPECT_EQ(QString("qcow2"), info.get().getFormat());
	ASSERT_TRUE(info.get().getBackingFilename());
	EXPECT_EQ(QString("/var/lib/images/base.qcow2"), *info.get().getBackingFilename());
}

TEST(ImageInfoTest, MissingFieldsAndGarbage)
{
	Expected<Image::Info> noFormat = Image::Parser::parse(
			"{ \"virtual-size\": 1024, \"filename\": \"a.raw\" }");
	ASSERT_FALSE(noFormat.isOk());
	EXPECT_EQ(ERR_IMAGE_INFO, noFormat.getCode());

	Expected<Image::Info> garbage = Image::Parser::parse("qemu-img: Could not open 'a.raw'");
	ASSERT_FALSE(garbage.isOk());
	EXPECT_EQ(ERR_IMAGE_INFO, garbage.getCode());

	Expected<Image::Info> raw = Image::Parser::parse(
			"{ \"virtual-size\": 1024, \"filename\": \"a.raw\", \"format\": \"raw\" }");
	ASSERT_TRUE(raw.isOk());
	EXPECT_EQ(0u, raw.get().getActualSize());
	EXPECT_FALSE(raw.get().getBackingFilename());
}

TEST(ImageInfoTest, ParseVmdkCreateType)
{
	Expected<Image::Info> info = Image::Parser::parse(
			"{\n"
			"    \"virtual-size\": 21474836480,\n"
			"    \"filename\": \"/var/lib/images/ol7.vmdk\",\n"
			"    \"format\": \"vmdk\",\n"
			"    \"format-specific\": {\n"
			"        \"type\": \"vmdk\",\n"
			"        \"data\": { \"cid\": 1590427093, \"create-type\": \"streamOptimized\" }\n"
			"    }\n"
			"}\n");
	ASSERT_TRUE(info.isOk()) << QSTR2UTF8(info.getMessage());
	ASSERT_TRUE(info.get().getSubtype());
	EXPECT_EQ(QString("streamOptimized"), *info.get().getSubtype());

	EXPECT_FALSE(Image::Parser::parse(QCOW2).get().getSubtype());
}

TEST(ImageInfoTest, RunsQemuImg)
{
	fake_type fake(new FakeCall());
	fake->reply("qemu-img info --output=json /var/lib/images/ol7.qcow2", FakeCall::Reply(0, QCOW2));

	Expected<Image::Info> info = Image::Unit("/var/lib/images/ol7.qcow2").getInfo(CallAdapter(fake));
	ASSERT_TRUE(info.isOk());
	EXPECT_EQ(QString("qcow2"), info.get().getFormat());

	fake->reply("qemu-img info --output=json /none.img",
			FakeCall::Reply(1, "", "qemu-img: Could not open '/none.img': No such file or directory"));
	Expected<Image::Info> failed = Image::Unit("/none.img").getInfo(CallAdapter(fake));
	EXPECT_FALSE(failed.isOk());
}
