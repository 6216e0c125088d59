///////////////////////////////////////////////////////////////////////////////
///
/// @file BootloaderTest.cpp
///
/// Unit tests for Bootloader.
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

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "Bootloader.h"

namespace
{

const char GRUB2[] =
	"set default=\"1\"\n"
	"### BEGIN /etc/grub.d/10_linux ###\n"
	"menuentry 'Oracle Linux Server (4.14.35-1902.el7uek.x86_64) 7.7' --class oracle {\n"
	"\tload_video\n"
	"\tinsmod xfs\n"
	"\tsearch --no-floppy --fs-uuid --set=root 7b1d2c5a-08c6\n"
	"\tlinux16 /vmlinuz-4.14.35-1902.el7uek.x86_64 root=/dev/mapper/ol-root ro\n"
	"\tinitrd16 /initramfs-4.14.35-1902.el7uek.x86_64.img\n"
	"}\n"
	"menuentry 'Oracle Linux Server (3.10.0-1062.el7.x86_64) 7.7' --class oracle {\n"
	"\tsearch --no-floppy --set=root /dev/sda1\n"
	"\tlinux16 /vmlinuz-3.10.0-1062.el7.x86_64 root=/dev/mapper/ol-root ro\n"
	"}\n";

const char LEGACY[] =
	"default=1\n"
	"timeout=5\n"
	"# kernel /vmlinuz-commented-out\n"
	"title Oracle Linux Server (4.1.12-124.el6uek.x86_64)\n"
	"\troot (hd0,0)\n"
	"\tkernel /vmlinuz-4.1.12-124.el6uek.x86_64 ro root=UUID=1111-2222\n"
	"\tinitrd /initramfs-4.1.12-124.el6uek.x86_64.img\n"
	"title Oracle Linux Server (2.6.32-754.el6.x86_64)\n"
	"\tkernel /vmlinuz-2.6.32-754.el6.x86_64 ro root=/dev/sda2\n";

void writeFile(const QString &path, const QByteArray &data)
{
	ASSERT_TRUE(QDir().mkpath(QFileInfo(path).path()));
	QFile file(path);
	ASSERT_TRUE(file.open(QIODevice::WriteOnly));
	file.write(data);
}

} // namespace

TEST(BootloaderTest, Grub2Entries)
{
	Bootloader::Info info = Bootloader::parse("/mnt/nbd0p1/grub2/grub.cfg", GRUB2);
	EXPECT_EQ(Bootloader::GRUB2, info.m_flavour);
	ASSERT_TRUE(info.m_bootType);
	EXPECT_EQ(QString(Bootloader::BOOT_BIOS), *info.m_bootType);
	ASSERT_EQ(2, info.m_entries.size());
	EXPECT_EQ(2, info.m_entries[0].m_lines.size());
	EXPECT_TRUE(info.m_entries[0].m_lines[0].startsWith("search"));

	QStringList lines = info.getBootLines();
	ASSERT_EQ(2, lines.size());
	EXPECT_TRUE(lines[0].contains("--fs-uuid"));
	EXPECT_FALSE(lines[1].contains("--fs-uuid"));

	EXPECT_EQ(QString("3.10.0-1062.el7.x86_64"), info.m_defaultKernel);
}

TEST(BootloaderTest, LegacyDefaultKernel)
{
	Bootloader::Info info = Bootloader::parse("/mnt/nbd0p1/grub/grub.conf", LEGACY);
	EXPECT_EQ(Bootloader::GRUB_LEGACY, info.m_flavour);
	ASSERT_EQ(2, info.m_entries.size());
	EXPECT_EQ(2, info.getBootLines().size());
	EXPECT_EQ(QString("2.6.32-754.el6.x86_64"), info.m_defaultKernel);
}

TEST(BootloaderTest, DefaultKernelNotFound)
{
	Bootloader::Info info = Bootloader::parse("/boot/grub/grub.conf", "title nothing\n");
	EXPECT_EQ(QString(Bootloader::KERNEL_NOT_FOUND), info.m_defaultKernel);
	EXPECT_TRUE(info.getBootLines().isEmpty());
}

TEST(BootloaderTest, BootTypeFromPath)
{
	EXPECT_EQ(QString(Bootloader::BOOT_UEFI),
			Bootloader::getBootType("/mnt/nbd0p1/efi/EFI/redhat/grub.cfg"));
	EXPECT_EQ(QString(Bootloader::BOOT_BIOS),
			Bootloader::getBootType("/mnt/nbd0p1/boot/grub2/grub.cfg"));
	EXPECT_EQ(QString(Bootloader::BOOT_BIOS),
			Bootloader::getBootType("/mnt/EFIdata/boot/grub2/grub.cfg"));
}

TEST(BootloaderTest, LocatePrefersGrubCfgAndShallowPaths)
{
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	QString root = dir.path();
	writeFile(root + "/boot/grub/grub.conf", LEGACY);
	writeFile(root + "/boot/efi/EFI/redhat/grub.cfg", GRUB2);
	writeFile(root + "/boot/grub2/grub.cfg", GRUB2);

	boost::optional<QString> path = Bootloader::locate(QStringList() << root);
	ASSERT_TRUE(path);
	EXPECT_EQ(root + "/boot/grub2/grub.cfg", *path);

	boost::optional<Bootloader::Info> info = Bootloader::load(QStringList() << root);
	ASSERT_TRUE(info);
	EXPECT_EQ(Bootloader::GRUB2, info->m_flavour);
}

TEST(BootloaderTest, LocateInSeparateBootPartition)
{
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	QString root = dir.path() + "/ol-root";
	QString boot = dir.path() + "/nbd0p1";
	ASSERT_TRUE(QDir().mkpath(root + "/etc"));
	writeFile(boot + "/grub/grub.conf", LEGACY);

	boost::optional<QString> path = Bootloader::locate(QStringList() << root << boot);
	ASSERT_TRUE(path);
	EXPECT_EQ(boot + "/grub/grub.conf", *path);

	EXPECT_FALSE(Bootloader::load(QStringList() << root));
}
