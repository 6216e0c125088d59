///////////////////////////////////////////////////////////////////////////////
///
/// @file Bootloader.cpp
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
#include <algorithm>

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QRegExp>

#include "Bootloader.h"
#include "Util.h"

namespace Bootloader
{

extern const char BOOT_BIOS[] = "BIOS";
extern const char BOOT_UEFI[] = "UEFI";
extern const char KERNEL_NOT_FOUND[] = "not found";

namespace
{
const char *const CONFIG_NAMES[] = {"grub.cfg", "grub.conf"};
const char *const CONFIG_DIRS[] = {"boot", "grub", "grub2"};

// Shallow paths first: /boot/grub2/grub.cfg before /boot/efi/EFI/redhat/grub.cfg.
bool byDepth(const QString &first, const QString &second)
{
	int a = first.count('/'), b = second.count('/');
	if (a != b)
		return a < b;
	return first < second;
}

QString getKeyword(const QString &line)
{
	return line.section(QRegExp("\\s+"), 0, 0, QString::SectionSkipEmpty);
}

// 4.14.35-1902.el7uek.x86_64 out of "kernel /vmlinuz-4.14.35-1902.el7uek.x86_64 ro ..."
boost::optional<QString> getKernelVersion(const QString &line)
{
	QStringList tokens = line.split(QRegExp("\\s+"), QString::SkipEmptyParts);
	Q_FOREACH(const QString &token, tokens)
	{
		if (!token.contains("vmlinuz"))
			continue;
		QString name = QFileInfo(token).fileName();
		if (name.contains('-'))
			return name.section('-', 1);
	}
	return boost::none;
}

boost::optional<int> getDefaultIndex(const QStringList &lines, Flavour flavour)
{
	QRegExp legacyRE("^default\\s*=\\s*(\\d+)");
	QRegExp grub2RE("^set\\s+default\\s*=\\s*[\"']?([^\"'\\s]*)");
	Q_FOREACH(const QString &line, lines)
	{
		if (flavour == GRUB_LEGACY && legacyRE.indexIn(line) != -1)
			return legacyRE.cap(1).toInt();
		if (flavour == GRUB2 && grub2RE.indexIn(line) != -1)
		{
			bool ok = false;
			int index = grub2RE.cap(1).toInt(&ok);
			// saved_entry and titles are resolved at boot time.
			return ok ? index : 0;
		}
	}
	return boost::none;
}

QString getDefaultKernel(const Info &info, const QStringList &lines)
{
	boost::optional<int> index = getDefaultIndex(lines, info.m_flavour);
	if (info.m_flavour == GRUB2)
	{
		int n = index.get_value_or(0);
		if (n < 0 || n >= info.m_entries.size())
			return KERNEL_NOT_FOUND;
		Q_FOREACH(const QString &line, info.m_entries[n].m_lines)
		{
			if (!getKeyword(line).startsWith("linux"))
				continue;
			boost::optional<QString> version = getKernelVersion(line);
			if (version)
				return *version;
		}
		return KERNEL_NOT_FOUND;
	}

	if (!index)
		return KERNEL_NOT_FOUND;
	int count = 0;
	Q_FOREACH(const QString &line, lines)
	{
		if (getKeyword(line) != "kernel")
			continue;
		if (count++ == *index)
			return getKernelVersion(line).get_value_or(KERNEL_NOT_FOUND);
	}
	return KERNEL_NOT_FOUND;
}

} // namespace

////////////////////////////////////////////////////////////
// Info

QStringList Info::getBootLines() const
{
	QString keyword = m_flavour == GRUB2 ? "search" : "kernel";
	QStringList result;
	Q_FOREACH(const Entry &entry, m_entries)
	{
		Q_FOREACH(const QString &line, entry.m_lines)
		{
			if (getKeyword(line) == keyword)
				result << line;
		}
	}
	return result;
}

QString Info::toString() const
{
	QStringList lines;
	lines << QString("config: %1 (%2)").arg(m_path, m_flavour == GRUB2 ? "grub2" : "grub");
	lines << QString("boot type: %1").arg(m_bootType.get_value_or("unknown"));
	lines << QString("default kernel: %1").arg(m_defaultKernel);
	Q_FOREACH(const Entry &entry, m_entries)
	{
		lines << QString("  %1").arg(entry.m_title);
		Q_FOREACH(const QString &line, entry.m_lines)
			lines << QString("    %1").arg(line);
	}
	return lines.join("\n");
}

boost::optional<QString> locate(const QStringList &searchRoots)
{
	for (size_t n = 0; n < sizeof(CONFIG_NAMES) / sizeof(CONFIG_NAMES[0]); ++n)
	{
		Q_FOREACH(const QString &root, searchRoots)
		{
			for (size_t d = 0; d < sizeof(CONFIG_DIRS) / sizeof(CONFIG_DIRS[0]); ++d)
			{
				QString dir = QDir::cleanPath(root + "/" + CONFIG_DIRS[d]);
				QStringList found;
				QDirIterator it(dir, QStringList() << CONFIG_NAMES[n],
						QDir::Files, QDirIterator::Subdirectories);
				while (it.hasNext())
					found << it.next();
				if (found.isEmpty())
					continue;
				std::sort(found.begin(), found.end(), byDepth);
				Logger::info(QString("Found grub configuration %1").arg(found.first()));
				return found.first();
			}
		}
	}
	return boost::none;
}

QString getBootType(const QString &path)
{
	return path.split('/').contains("EFI") ? BOOT_UEFI : BOOT_BIOS;
}

Info parse(const QString &path, const QByteArray &data)
{
	Info info;
	info.m_path = path;
	info.m_bootType = getBootType(path);

	QStringList lines;
	Q_FOREACH(const QString &line, QString::fromUtf8(data).split('\n'))
	{
		QString trimmed = line.trimmed();
		if (!trimmed.isEmpty() && !trimmed.startsWith('#'))
			lines << trimmed;
	}

	Q_FOREACH(const QString &line, lines)
	{
		if (getKeyword(line) == "menuentry")
		{
			info.m_flavour = GRUB2;
			break;
		}
	}

	bool inEntry = false;
	Q_FOREACH(const QString &line, lines)
	{
		QString keyword = getKeyword(line);
		if (info.m_flavour == GRUB2)
		{
			if (keyword == "menuentry")
			{
				info.m_entries << Entry(line);
				inEntry = true;
			}
			else if (line == "}")
				inEntry = false;
			else if (inEntry && (keyword == "search" || keyword.startsWith("linux")))
				info.m_entries.last().m_lines << line;
		}
		else
		{
			if (keyword == "title")
				info.m_entries << Entry(line);
			else if (keyword == "kernel")
			{
				if (info.m_entries.isEmpty())
					info.m_entries << Entry(QString());
				info.m_entries.last().m_lines << line;
			}
		}
	}

	info.m_defaultKernel = getDefaultKernel(info, lines);
	return info;
}

boost::optional<Info> load(const QStringList &searchRoots)
{
	boost::optional<QString> path = locate(searchRoots);
	if (!path)
	{
		Logger::warning("No grub configuration found");
		return boost::none;
	}
	QFile file(*path);
	if (!file.open(QIODevice::ReadOnly))
	{
		Logger::warning(QString("Unable to read %1: %2").arg(*path).arg(file.errorString()));
		return boost::none;
	}
	Info info = parse(*path, file.readAll());
	Logger::info(info.toString());
	return info;
}

} // namespace Bootloader
