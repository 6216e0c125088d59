///////////////////////////////////////////////////////////////////////////////
///
/// @file Config.h
///
/// Tool settings with JSON configuration file overrides.
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
#ifndef CONFIG_H
#define CONFIG_H

#include <QString>
#include <QStringList>
#include <QByteArray>

#include <boost/property_tree/ptree.hpp>

#include "Expected.h"

namespace Config
{

////////////////////////////////////////////////////////////
// Backend

// Kernel block backend exposing the image file as a disk.
struct Backend
{
	Backend();

	QString m_module;
	QString m_moduleParams;
	QString m_tool;
	QString m_sysfsRoot;
	QString m_moduleRoot;
	QString m_deviceDir;
	QString m_devicePrefix;
	unsigned m_settleSeconds;
};

////////////////////////////////////////////////////////////
// Retries

struct Retries
{
	Retries();

	unsigned m_module;
	unsigned m_rmmod;
	unsigned m_link;
	unsigned m_unlink;
	unsigned m_mount;
	unsigned m_unmount;
	unsigned m_interval;
	unsigned m_unmountInterval;
};

////////////////////////////////////////////////////////////
// Settings

struct Settings
{
	Settings();

	QString m_loopbackRoot;
	Backend m_backend;
	Retries m_retry;

	QStringList m_filesystemTypes;
	QStringList m_logicalVolumeTypes;
	QStringList m_partitionsToSkip;
	QStringList m_validBootTypes;
	QStringList m_validOs;
	QStringList m_validImageFormats;
	QStringList m_validVmdkTypes;
	unsigned m_maxImageSizeGb;

	// Executable run inside the guest to rewrite its network configuration.
	QString m_networkHelper;
	bool m_progress;
	bool m_verbose;
};

////////////////////////////////////////////////////////////
// Loader

struct Loader
{
	static Expected<Settings> load(const QString &path);
	static Expected<Settings> parse(const QByteArray &data, const QString &origin = QString());

private:
	static void apply(const boost::property_tree::ptree &pt, Settings &settings);
};

} // namespace Config

#endif // CONFIG_H
