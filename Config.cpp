///////////////////////////////////////////////////////////////////////////////
///
/// @file Config.cpp
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
#include <limits>
#include <sstream>

#include <QFile>

#include <boost/optional.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "Config.h"
#include "StringTable.h"
#include "Util.h"

namespace pt = boost::property_tree;

namespace Config
{

namespace
{

// get_value() throws ptree_bad_data on a malformed value.
void readString(const pt::ptree &pt, const char *path, QString &value)
{
	boost::optional<const pt::ptree &> v = pt.get_child_optional(path);
	if (v)
		value = QString::fromStdString(v->get_value<std::string>());
}

// Read signed so that "-1" is rejected instead of wrapping around.
void readUnsigned(const pt::ptree &pt, const char *path, unsigned &value)
{
	boost::optional<const pt::ptree &> v = pt.get_child_optional(path);
	if (!v)
		return;
	long long n = v->get_value<long long>();
	if (n < 0 || n > (long long)std::numeric_limits<unsigned>::max())
	{
		throw pt::ptree_bad_data(std::string(path) + ": value out of range '"
				+ v->data() + "'", v->data());
	}
	value = (unsigned)n;
}

void readBool(const pt::ptree &pt, const char *path, bool &value)
{
	boost::optional<const pt::ptree &> v = pt.get_child_optional(path);
	if (v)
		value = v->get_value<bool>();
}

void readList(const pt::ptree &pt, const char *path, QStringList &value)
{
	boost::optional<const pt::ptree &> child = pt.get_child_optional(path);
	if (!child)
		return;
	QStringList list;
	Q_FOREACH(const pt::ptree::value_type &v, *child)
		list << QString::fromStdString(v.second.get_value<std::string>());
	value = list;
}

} // namespace

////////////////////////////////////////////////////////////
// Backend

Backend::Backend():
	m_module("nbd"), m_moduleParams("max_part=63"), m_tool("qemu-nbd"),
	m_sysfsRoot("/sys/class/block"), m_moduleRoot("/sys/module"),
	m_deviceDir("/dev"), m_devicePrefix("nbd"), m_settleSeconds(5)
{
}

////////////////////////////////////////////////////////////
// Retries

Retries::Retries():
	m_module(2), m_rmmod(4), m_link(2), m_unlink(3),
	m_mount(3), m_unmount(3), m_interval(1), m_unmountInterval(2)
{
}

////////////////////////////////////////////////////////////
// Settings

Settings::Settings():
	m_loopbackRoot("/mnt"), m_maxImageSizeGb(300), m_progress(true), m_verbose(false)
{
	m_filesystemTypes << "ext2" << "ext3" << "ext4" << "xfs" << "btrfs" << "ocfs2";
	m_logicalVolumeTypes << "LVM2_member";
	m_partitionsToSkip << "swap";
	m_validBootTypes << "BIOS" << "UEFI";
	m_validOs << "ORACLE LINUX SERVER" << "RHEL" << "CENTOS" << "UBUNTU";
	m_validImageFormats << "qcow2" << "vmdk";
	m_validVmdkTypes << "monolithicSparse" << "streamOptimized";
}

////////////////////////////////////////////////////////////
// Loader

void Loader::apply(const pt::ptree &pt, Settings &settings)
{
	readString(pt, "loopbackRoot", settings.m_loopbackRoot);

	Backend &b = settings.m_backend;
	readString(pt, "backend.module", b.m_module);
	readString(pt, "backend.moduleParams", b.m_moduleParams);
	readString(pt, "backend.tool", b.m_tool);
	readString(pt, "backend.sysfsRoot", b.m_sysfsRoot);
	readString(pt, "backend.moduleRoot", b.m_moduleRoot);
	readString(pt, "backend.deviceDir", b.m_deviceDir);
	readString(pt, "backend.devicePrefix", b.m_devicePrefix);
	readUnsigned(pt, "backend.settleSeconds", b.m_settleSeconds);

	Retries &r = settings.m_retry;
	readUnsigned(pt, "retry.moduleAttempts", r.m_module);
	readUnsigned(pt, "retry.rmmodAttempts", r.m_rmmod);
	readUnsigned(pt, "retry.linkAttempts", r.m_link);
	readUnsigned(pt, "retry.unlinkAttempts", r.m_unlink);
	readUnsigned(pt, "retry.mountAttempts", r.m_mount);
	readUnsigned(pt, "retry.unmountAttempts", r.m_unmount);
	readUnsigned(pt, "retry.interval", r.m_interval);
	readUnsigned(pt, "retry.unmountInterval", r.m_unmountInterval);

	readList(pt, "filesystemTypes", settings.m_filesystemTypes);
	readList(pt, "logicalVolumeTypes", settings.m_logicalVolumeTypes);
	readList(pt, "partitionsToSkip", settings.m_partitionsToSkip);
	readList(pt, "validBootTypes", settings.m_validBootTypes);
	readList(pt, "validOs", settings.m_validOs);
	readList(pt, "validImageFormats", settings.m_validImageFormats);
	readList(pt, "validVmdkTypes", settings.m_validVmdkTypes);
	readUnsigned(pt, "maxImageSizeGb", settings.m_maxImageSizeGb);

	readString(pt, "networkHelper", settings.m_networkHelper);
	readBool(pt, "progress", settings.m_progress);
}

Expected<Settings> Loader::parse(const QByteArray &data, const QString &origin)
{
	pt::ptree pt;
	std::istringstream stream(std::string(data.constData(), data.size()));
	Settings settings;
	try
	{
		read_json(stream, pt);
		apply(pt, settings);
	}
	catch (pt::ptree_error &e)
	{
		return Expected<Settings>::fromMessage(QString(IDS_ERR_CONFIG)
				.arg(origin).arg(QString::fromStdString(e.what())), ERR_CONFIG);
	}
	return settings;
}

Expected<Settings> Loader::load(const QString &path)
{
	QFile file(path);
	if (!file.open(QIODevice::ReadOnly))
	{
		return Expected<Settings>::fromMessage(QString(IDS_ERR_CONFIG)
				.arg(path).arg(file.errorString()), ERR_CONFIG);
	}
	Logger::info(QString("Configuration: %1").arg(path));
	return parse(file.readAll(), path);
}

} // namespace Config
