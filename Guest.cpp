///////////////////////////////////////////////////////////////////////////////
///
/// @file Guest.cpp
///
/// Guest os-release and network configuration inspection.
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
#include <QDir>
#include <QFile>
#include <QRegExp>

#include "Guest.h"
#include "StringTable.h"
#include "Util.h"

namespace Guest
{

namespace
{

const char *const RELEASE_FILES[] = {"etc/os-release", "usr/lib/os-release"};

////////////////////////////////////////////////////////////
// Source

// Where a distribution keeps interface configuration and how it pins a MAC.
struct Source
{
	const char *dir;
	const char *pattern;
	const char *key;
};

const Source NETWORK_SOURCES[] =
{
	{"etc/sysconfig/network-scripts", "ifcfg-*", "^(HWADDR|MACADDR)\\s*="},
	{"etc/NetworkManager/system-connections", "*", "^mac-address\\s*="},
	{"etc/netplan", "*.yaml", "^macaddress\\s*:"},
	{"etc/network", "interfaces", "^hwaddress\\b"},
	{"etc/systemd/network", "*.network", "^MACAddress\\s*="}
};

} // namespace

Release parseOsRelease(const QByteArray &data)
{
	Release release;
	QStringList lines = QString::fromUtf8(data).split('\n', QString::SkipEmptyParts);
	Q_FOREACH(const QString &line, lines)
	{
		int pos = line.indexOf('=');
		if (pos <= 0 || line.trimmed().startsWith('#'))
			continue;
		QString value = line.mid(pos + 1).trimmed();
		if (value.size() >= 2 && (value.startsWith('"') || value.startsWith('\'')) &&
			value.endsWith(value[0]))
		{
			value = value.mid(1, value.size() - 2);
		}
		release.insert(line.left(pos).trimmed(), value);
	}
	return release;
}

Expected<Release> detectOS(const QString &root)
{
	for (size_t i = 0; i < sizeof(RELEASE_FILES) / sizeof(RELEASE_FILES[0]); ++i)
	{
		QFile file(QDir::cleanPath(root + "/" + RELEASE_FILES[i]));
		if (!file.open(QIODevice::ReadOnly))
			continue;
		Release release = parseOsRelease(file.readAll());
		Logger::info(QString("%1: %2 %3").arg(file.fileName())
				.arg(release.value("NAME")).arg(release.value("VERSION_ID")));
		return release;
	}
	return Expected<Release>::fromMessage(QString(IDS_ERR_OS_RELEASE_NOT_FOUND).arg(root),
			ERR_UNSUPPORTED_OS);
}

QStringList findMacs(const QByteArray &data, const QRegExp &keyRE)
{
	QRegExp macRE("([0-9A-Fa-f]{2}[:-]){5}[0-9A-Fa-f]{2}");
	QStringList macs;
	QStringList lines = QString::fromUtf8(data).split('\n');
	Q_FOREACH(const QString &raw, lines)
	{
		QString line = raw.trimmed();
		if (line.startsWith('#') || keyRE.indexIn(line) == -1)
			continue;
		if (macRE.indexIn(line, keyRE.matchedLength()) != -1)
			macs << macRE.cap(0);
	}
	return macs;
}

QList<Interface> collectNetwork(const QString &root)
{
	QList<Interface> result;
	for (size_t i = 0; i < sizeof(NETWORK_SOURCES) / sizeof(NETWORK_SOURCES[0]); ++i)
	{
		const Source &source = NETWORK_SOURCES[i];
		QDir dir(QDir::cleanPath(root + "/" + source.dir));
		if (!dir.exists())
			continue;
		QRegExp keyRE(source.key, Qt::CaseInsensitive);
		QStringList names = dir.entryList(QStringList() << source.pattern, QDir::Files, QDir::Name);
		Q_FOREACH(const QString &name, names)
		{
			QFile file(dir.filePath(name));
			if (!file.open(QIODevice::ReadOnly))
			{
				Logger::warning(QString("Unable to read %1").arg(file.fileName()));
				continue;
			}
			// Reported relative to the guest root.
			Interface iface(QString("/%1/%2").arg(source.dir, name));
			iface.m_macs = findMacs(file.readAll(), keyRE);
			Logger::info(QString("Network configuration %1: %2")
					.arg(iface.m_file).arg(iface.m_macs.join(" ")));
			result << iface;
		}
	}
	return result;
}

} // namespace Guest
