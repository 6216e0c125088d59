///////////////////////////////////////////////////////////////////////////////
///
/// @file Bootloader.h
///
/// Grub configuration discovery and parsing.
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
#ifndef BOOTLOADER_H
#define BOOTLOADER_H

#include <QList>
#include <QString>
#include <QStringList>
#include <QByteArray>

#include <boost/optional.hpp>

namespace Bootloader
{

extern const char BOOT_BIOS[];
extern const char BOOT_UEFI[];
extern const char KERNEL_NOT_FOUND[];

enum Flavour
{
	GRUB_LEGACY,
	GRUB2
};

////////////////////////////////////////////////////////////
// Entry

struct Entry
{
	explicit Entry(const QString &title):
		m_title(title)
	{
	}

	// menuentry or title line.
	QString m_title;
	QStringList m_lines;
};

////////////////////////////////////////////////////////////
// Info

struct Info
{
	Info(): m_flavour(GRUB_LEGACY), m_defaultKernel(KERNEL_NOT_FOUND)
	{
	}

	// Lines which point grub to the boot device: search for grub2, kernel for legacy.
	QStringList getBootLines() const;
	QString toString() const;

	QString m_path;
	boost::optional<QString> m_bootType;
	Flavour m_flavour;
	QList<Entry> m_entries;
	QString m_defaultKernel;
};

// grub.cfg, then grub.conf under <root>/boot, <root>/grub and <root>/grub2.
boost::optional<QString> locate(const QStringList &searchRoots);

QString getBootType(const QString &path);

Info parse(const QString &path, const QByteArray &data);

// None if no configuration is found or readable.
boost::optional<Info> load(const QStringList &searchRoots);

} // namespace Bootloader

#endif // BOOTLOADER_H
