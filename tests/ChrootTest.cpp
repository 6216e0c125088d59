///////////////////////////////////////////////////////////////////////////////
///
/// @file ChrootTest.cpp
///
/// Unit tests for Chroot.
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

#include <cstdlib>
#include <fcntl.h>
#include <unistd.h>

#include <QDir>
#include <QTemporaryDir>

#include "Chroot.h"
#include "FakeCall.h"

namespace
{

CallAdapter makeHost()
{
	return CallAdapter(boost::shared_ptr<Call>(new Call()));
}

} // namespace

TEST(ChrootTest, RequiredDirectoriesAppendedOnce)
{
	EXPECT_EQ(QString(Chroot::REQUIRED_PATH), Chroot::rebuildPath(""));
	EXPECT_EQ(QString("/opt/bin:") + Chroot::REQUIRED_PATH,
			Chroot::rebuildPath("/opt/bin:/usr/bin:/opt/bin:/bin"));
	EXPECT_EQ(QString("/home/u/bin:/usr/local/bin:") + Chroot::REQUIRED_PATH,
			Chroot::rebuildPath("/home/u/bin::/usr/local/bin:/sbin"));
}

TEST(ChrootTest, LeaveWithoutEnterDoesNothing)
{
	fake_type fake(new FakeCall());
	Chroot::Context context;
	EXPECT_TRUE(Chroot::leave(CallAdapter(fake), context).isOk());
	EXPECT_TRUE(fake->getLog().isEmpty());
}

TEST(ChrootTest, EnterMissingRootRestoresState)
{
	QString cwd = QDir::currentPath();
	QByteArray path = qgetenv("PATH");

	Expected<Chroot::Context> context = Chroot::enter(makeHost(), "/nonexistent/guest/root");
	ASSERT_FALSE(context.isOk());
	EXPECT_EQ(ERR_CHROOT_FAILED, context.getCode());
	EXPECT_EQ(cwd, QDir::currentPath());
	EXPECT_EQ(path, qgetenv("PATH"));
}

TEST(ChrootTest, FailedChrootAfterChdirRollsBack)
{
	fake_type fake(new FakeCall());
	fake->reply("chroot /mnt/nbd0p1", FakeCall::Reply(1));
	QString cwd = QDir::currentPath();
	QByteArray path = qgetenv("PATH");

	Expected<Chroot::Context> context = Chroot::enter(CallAdapter(fake), "/mnt/nbd0p1");
	ASSERT_FALSE(context.isOk());
	EXPECT_EQ(ERR_CHROOT_FAILED, context.getCode());

	QStringList expected;
	expected << "open /" << "chdir /mnt/nbd0p1" << "chroot /mnt/nbd0p1"
		<< QString("chdir %1").arg(cwd);
	EXPECT_EQ(expected, fake->getLog());
	EXPECT_TRUE(fake->getOpen().isEmpty());
	EXPECT_EQ(path, qgetenv("PATH"));
}

TEST(ChrootTest, EnterThenLeaveSequence)
{
	fake_type fake(new FakeCall());
	QString cwd = QDir::currentPath();
	QByteArray path = qgetenv("PATH");

	Expected<Chroot::Context> context = Chroot::enter(CallAdapter(fake), "/mnt/nbd0p1");
	ASSERT_TRUE(context.isOk());
	EXPECT_EQ(1, fake->getOpen().size());
	EXPECT_EQ(Chroot::rebuildPath(QString::fromLocal8Bit(path)).toLocal8Bit(), qgetenv("PATH"));

	ASSERT_TRUE(Chroot::leave(CallAdapter(fake), context.get()).isOk());
	EXPECT_EQ(path, qgetenv("PATH"));
	EXPECT_EQ(-1, context.get().m_rootFd);
	EXPECT_TRUE(fake->getOpen().isEmpty());

	QStringList expected;
	expected << "open /" << "chdir /mnt/nbd0p1" << "chroot /mnt/nbd0p1"
		<< "fchdir 100" << "chroot ." << QString("chdir %1").arg(cwd);
	EXPECT_EQ(expected, fake->getLog());
}

TEST(ChrootTest, FailedEscapeIsReported)
{
	fake_type fake(new FakeCall());
	fake->reply("fchdir 100", FakeCall::Reply(1));
	QByteArray path = qgetenv("PATH");

	Expected<Chroot::Context> context = Chroot::enter(CallAdapter(fake), "/mnt/nbd0p1");
	ASSERT_TRUE(context.isOk());
	Expected<void> left = Chroot::leave(CallAdapter(fake), context.get());
	ASSERT_FALSE(left.isOk());
	EXPECT_EQ(ERR_CHROOT_EXIT_FAILED, left.getCode());
	EXPECT_TRUE(fake->getOpen().isEmpty());
	EXPECT_EQ(path, qgetenv("PATH"));
}

TEST(ChrootTest, RootDescriptorIsNotInherited)
{
	Call host;
	int fd = host.openDirectory("/");
	ASSERT_LE(0, fd);
	int flags = fcntl(fd, F_GETFD);
	host.close(fd);
	ASSERT_NE(-1, flags);
	EXPECT_TRUE(flags & FD_CLOEXEC);
}

TEST(ChrootTest, EnterThenLeaveRestoresState)
{
	if (geteuid() != 0)
		GTEST_SKIP() << "changing root requires root privileges";

	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	QString cwd = QDir::currentPath();
	QByteArray path = qgetenv("PATH");

	Expected<Chroot::Context> context = Chroot::enter(makeHost(), dir.path());
	ASSERT_TRUE(context.isOk());
	EXPECT_EQ(QString("/"), QDir::currentPath());

	ASSERT_TRUE(Chroot::leave(makeHost(), context.get()).isOk());
	EXPECT_EQ(cwd, QDir::currentPath());
	EXPECT_EQ(path, qgetenv("PATH"));
}
