///////////////////////////////////////////////////////////////////////////////
///
/// @file RetryTest.cpp
///
/// Unit tests for Retry.
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
#include "Retry.h"

namespace
{

// Fails the first n calls.
struct Flaky
{
	Flaky(int failures, int &calls): m_failures(failures), m_calls(&calls)
	{
	}

	Expected<int> operator()() const
	{
		int n = ++*m_calls;
		if (n <= m_failures)
			return Expected<int>::fromMessage(QString("busy %1").arg(n), ERR_COMMAND_FAILED);
		return n;
	}

private:
	int m_failures;
	int *m_calls;
};

} // namespace

TEST(RetryTest, SucceedsAfterTransientFailures)
{
	fake_type fake(new FakeCall());
	CallAdapter adapter(fake);
	int calls = 0;
	Flaky flaky(2, calls);

	Expected<int> res = Retry::withRetry<int>(Retry::Policy(3, 7), adapter, flaky);
	ASSERT_TRUE(res.isOk());
	EXPECT_EQ(3, res.get());
	EXPECT_EQ(2, fake->getSleeps().size());
	EXPECT_EQ(7u, fake->getSleeps().first());
}

TEST(RetryTest, ReportsLastErrorWhenExhausted)
{
	fake_type fake(new FakeCall());
	CallAdapter adapter(fake);
	int calls = 0;
	Flaky flaky(10, calls);

	Expected<int> res = Retry::withRetry<int>(Retry::Policy(3, 1), adapter, flaky);
	ASSERT_FALSE(res.isOk());
	EXPECT_EQ(ERR_RETRIES_EXHAUSTED, res.getCode());
	EXPECT_TRUE(res.getMessage().contains("busy 3"));
	EXPECT_EQ(3, calls);
	// No sleep after the last attempt.
	EXPECT_EQ(2, fake->getSleeps().size());
}

TEST(RetryTest, ZeroAttemptsStillRunsOnce)
{
	fake_type fake(new FakeCall());
	CallAdapter adapter(fake);
	int calls = 0;
	Flaky flaky(0, calls);

	Expected<int> res = Retry::withRetry<int>(Retry::Policy(0, 1), adapter, flaky);
	ASSERT_TRUE(res.isOk());
	EXPECT_EQ(1, calls);
	EXPECT_TRUE(fake->getSleeps().isEmpty());
}

TEST(CallAdapterTest, MissingCommandIsReported)
{
	fake_type fake(new FakeCall());
	fake->setMissing("parted");
	CallAdapter adapter(fake);

	Expected<Exec::Result> res = adapter.run("parted", QStringList() << "/dev/nbd0" << "print");
	ASSERT_FALSE(res.isOk());
	EXPECT_EQ(ERR_COMMAND_NOT_FOUND, res.getCode());
	EXPECT_TRUE(fake->getLog().isEmpty());
}

TEST(CallAdapterTest, ExecuteFailsOnNonZeroExit)
{
	fake_type fake(new FakeCall());
	fake->reply("mount /dev/nbd0p1 /mnt/nbd0p1", FakeCall::Reply(32, "", "wrong fs type"));
	CallAdapter adapter(fake);

	Expected<QByteArray> res = adapter.execute("mount", QStringList() << "/dev/nbd0p1" << "/mnt/nbd0p1");
	ASSERT_FALSE(res.isOk());
	EXPECT_EQ(ERR_COMMAND_FAILED, res.getCode());
	EXPECT_TRUE(res.getMessage().contains("wrong fs type"));

	Expected<int> code = adapter.runSilent("mount", QStringList() << "/dev/nbd0p1" << "/mnt/nbd0p1");
	ASSERT_TRUE(code.isOk());
	EXPECT_EQ(32, code.get());
}
