///////////////////////////////////////////////////////////////////////////////
///
/// @file Mount.cpp
///
/// Mounting image filesystems and unmounting them in reverse order.
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
#include <QFileInfo>

#include <boost/bind.hpp>

#include "Mount.h"
#include "Retry.h"
#include "StringTable.h"

namespace Mount
{

namespace
{
const char MOUNT[] = "mount";
const char UMOUNT[] = "umount";

// /var before /var/log.
bool byMountpoint(const Target &first, const Target &second)
{
	return first.first < second.first;
}

} // namespace

Expected<void> Manager::mount(const QStringList &args) const
{
	Expected<QByteArray> out = m_adapter.execute(MOUNT, args);
	if (!out.isOk())
		return out;
	return Expected<void>();
}

Expected<void> Manager::umount(const QString &mountpoint) const
{
	// Could have gone away in between attempts.
	if (!m_adapter.isMountpoint(mountpoint))
		return Expected<void>();
	Expected<QByteArray> out = m_adapter.execute(UMOUNT, QStringList() << mountpoint);
	if (!out.isOk())
		return out;
	return Expected<void>();
}

Expected<QString> Manager::mountAt(const QStringList &options, const QString &source,
		const QString &mountpoint)
{
	bool created = false;
	if (!m_adapter.exists(mountpoint))
	{
		if (!m_adapter.mkpath(mountpoint))
		{
			return Expected<QString>::fromMessage(QString(IDS_ERR_CANNOT_MOUNT)
					.arg(source).arg(mountpoint), ERR_MOUNT_FAILED);
		}
		created = true;
	}

	QStringList args = QStringList(options) << source << mountpoint;
	Expected<void> res = Retry::withRetry<void>(
			Retry::Policy(m_retry.m_mount, m_retry.m_interval), m_adapter,
			boost::bind(&Manager::mount, this, args));
	if (!res.isOk())
	{
		if (created)
			m_adapter.rmdir(mountpoint);
		return Expected<QString>::fromMessage(QString(IDS_ERR_CANNOT_MOUNT)
				.arg(source).arg(mountpoint) + ": " + res.getMessage(), ERR_MOUNT_FAILED);
	}

	m_set.append(mountpoint, created);
	Logger::info(QString("Mounted %1 on %2").arg(source).arg(mountpoint));
	return mountpoint;
}

Expected<QString> Manager::mountPartition(const QString &device,
		const boost::optional<QString> &mountpoint)
{
	QString path = mountpoint ? *mountpoint
			: QDir::cleanPath(m_loopbackRoot + "/" + QFileInfo(device).fileName());
	return mountAt(QStringList(), device, path);
}

Expected<QStringList> Manager::mountPseudo(const QString &root)
{
	QStringList result;
	Expected<QString> res = mountAt(QStringList() << "-t" << "proc", "proc",
			QDir::cleanPath(root + "/proc"));
	if (!res.isOk())
		return res;
	result << res.get();

	const char *binds[] = {"/dev", "/sys"};
	for (size_t i = 0; i < sizeof(binds) / sizeof(binds[0]); ++i)
	{
		res = mountAt(QStringList() << "-o" << "bind", binds[i],
				QDir::cleanPath(root + binds[i]));
		if (!res.isOk())
			return res;
		result << res.get();
	}
	return result;
}

Expected<void> Manager::remount(const QString &root, QList<Target> targets)
{
	std::sort(targets.begin(), targets.end(), byMountpoint);
	Q_FOREACH(const Target &target, targets)
	{
		QString path = QDir::cleanPath(root + "/" + target.first);
		if (!m_adapter.exists(path))
		{
			Logger::warning(QString("Mountpoint %1 does not exist, %2 is not mounted")
					.arg(path).arg(target.second));
			continue;
		}
		Expected<QString> res = mountAt(QStringList(), target.second, path);
		if (!res.isOk())
			return res;
	}
	return Expected<void>();
}

Expected<void> Manager::unmount(const QString &mountpoint) const
{
	if (!m_adapter.isMountpoint(mountpoint))
	{
		Logger::info(QString("%1 is not mounted").arg(mountpoint));
		return Expected<void>();
	}
	return Retry::withRetry<void>(
			Retry::Policy(m_retry.m_unmount, m_retry.m_unmountInterval), m_adapter,
			boost::bind(&Manager::umount, this, mountpoint));
}

bool Manager::unmountAll()
{
	bool result = true;
	while (!m_set.isEmpty())
	{
		Entry entry = m_set.takeLast();
		Expected<void> res = unmount(entry.m_path);
		if (!res.isOk())
		{
			Logger::error(res.getMessage());
			result = false;
			continue;
		}
		if (entry.m_created && !m_adapter.rmdir(entry.m_path))
			Logger::warning(QString("Unable to remove %1").arg(entry.m_path));
	}
	return result;
}

} // namespace Mount
