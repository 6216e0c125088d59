///////////////////////////////////////////////////////////////////////////////
///
/// @file ProgramOptionsTest.cpp
///
/// Unit tests for ProgramOptions.
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

#include "ProgramOptions.h"
#include "Util.h"

TEST(ProgramOptionsTest, ImageAndConfig)
{
	const char *argv[] = {"vdisk_migrate", "-v", "--config", "/etc/vdisk_migrate.json", "/images/ol7.qcow2"};
	Expected<ParsedCommand> parsed = OptionParser().parseCommand(5, argv);
	ASSERT_TRUE(parsed.isOk()) << QSTR2UTF8(parsed.getMessage());
	EXPECT_EQ(QString("/images/ol7.qcow2"), parsed.get().getImage());
	ASSERT_TRUE(parsed.get().getConfig());
	EXPECT_EQ(QString("/etc/vdisk_migrate.json"), *parsed.get().getConfig());
	EXPECT_TRUE(parsed.get().isVerbose());
	EXPECT_FALSE(parsed.get().isUsageIssued());
}

TEST(ProgramOptionsTest, HelpNeedsNoImage)
{
	const char *argv[] = {"vdisk_migrate", "--help"};
	Expected<ParsedCommand> parsed = OptionParser().parseCommand(2, argv);
	ASSERT_TRUE(parsed.isOk());
	EXPECT_TRUE(parsed.get().isUsageIssued());
	EXPECT_FALSE(parsed.get().getConfig());
}

TEST(ProgramOptionsTest, InvalidArguments)
{
	const char *noImage[] = {"vdisk_migrate", "-v"};
	Expected<ParsedCommand> parsed = OptionParser().parseCommand(2, noImage);
	ASSERT_FALSE(parsed.isOk());
	EXPECT_EQ(ERR_INVALID_ARGS, parsed.getCode());

	const char *unknown[] = {"vdisk_migrate", "--force", "/images/ol7.qcow2"};
	Expected<ParsedCommand> rejected = OptionParser().parseCommand(3, unknown);
	ASSERT_FALSE(rejected.isOk());
	EXPECT_EQ(ERR_INVALID_ARGS, rejected.getCode());
}
