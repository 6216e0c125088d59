///////////////////////////////////////////////////////////////////////////////
///
/// @file Guest.h
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
#ifndef GUEST_H
#define GUEST_H

#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QByteArray>
#include <QRegExp>

#include "Expected.h"

namespace Guest
{

typedef QMap<QString, QString> Release;

Release parseOsRelease(const QByteArray &data);

// etc/os-release, falling back to usr/lib/os-release.
Expected<Release> detectOS(const QString &root);

////////////////////////////////////////////////////////////
// Interface

// Network configuration file of the guest.
struct Interface
{
	explicit Interface(const QString &file):
		m_file(file)
	{
	}

	QString m_file;
	// Hard-coded MAC addresses.
	QStringList m_macs;
};

// MAC addresses set in the file by the given key.
QStringList findMacs(const QByteArray &data, const QRegExp &keyRE);

QList<Interface> collectNetwork(const QString &root);

} // namespace Guest

#endif // GUEST_H
