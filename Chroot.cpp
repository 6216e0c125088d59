///////////////////////////////////////////////////////////////////////////////
///
/// @file Chroot.cpp
///
/// Entering and leaving the guest root filesystem.
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
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <QDir>
#include <QStringList>

#include "Chroot.h"
#include "StringTable.h"
#include "Util.h"

namespace Chroot
{

extern const char REQUIRED_PATH[] = "/bin:/usr/bin:/usr/sbin:/usr/local/sbin:/sbin";

namespace
{
const char PATH[] = "PATH";

QString lastError()
{
	return QString::fromLocal8Bit(strerror(errno));
}

void restorePath(const Context &context)
{
	if (context.m_hadPath)
		setenv(PATH, context.m_path.constData(), 1);
	else
		unsetenv(PATH);
}

// Back to the original root from whatever the current one is.
bool escape(const CallAdapter &adapter, const Context &context)
{
	return adapter.fchdir(context.m_rootFd) && adapter.chroot(".");
}

} // namespace

QString rebuildPath(const QString &path)
{
	QStringList required = QString(REQUIRED_PATH).split(':');
	QStringList result;
	Q_FOREACH(const QString &dir, path.split(':', QString::SkipEmptyParts))
	{
		if (!required.contains(dir) && !result.contains(dir))
			result << dir;
	}
	result << required;
	return result.join(":");
}

Expected<Context> enter(const CallAdapter &adapter, const QString &newRoot)
{
	Context context;
	context.m_cwd = QDir::currentPath();
	const char *path = getenv(PATH);
	context.m_hadPath = path != NULL;
	if (path)
		context.m_path = path;

	context.m_rootFd = adapter.openDirectory("/");
	if (context.m_rootFd < 0)
	{
		return Expected<Context>::fromMessage(QString(IDS_ERR_CHROOT_FAILED)
				.arg(newRoot).arg(lastError()), ERR_CHROOT_FAILED);
	}

	if (!adapter.chdir(newRoot) || !adapter.chroot(newRoot))
	{
		// Root is unchanged here, only the working directory may be.
		QString msg = QString(IDS_ERR_CHROOT_FAILED).arg(newRoot).arg(lastError());
		adapter.close(context.m_rootFd);
		if (!adapter.chdir(context.m_cwd))
			Logger::error(QString("Unable to return to %1").arg(context.m_cwd));
		return Expected<Context>::fromMessage(msg, ERR_CHROOT_FAILED);
	}

	QByteArray rebuilt = rebuildPath(QString::fromLocal8Bit(context.m_path)).toLocal8Bit();
	setenv(PATH, rebuilt.constData(), 1);
	Logger::info(QString("Entered %1, PATH=%2").arg(newRoot).arg(QString::fromLocal8Bit(rebuilt)));
	return context;
}

Expected<void> leave(const CallAdapter &adapter, Context &context)
{
	if (context.m_rootFd < 0)
		return Expected<void>();

	bool ok = escape(adapter, context);
	QString err = ok ? QString() : lastError();
	adapter.close(context.m_rootFd);
	context.m_rootFd = -1;
	restorePath(context);
	if (!ok)
	{
		return Expected<void>::fromMessage(QString(IDS_ERR_CHROOT_EXIT_FAILED).arg(err),
				ERR_CHROOT_EXIT_FAILED);
	}

	if (!adapter.chdir(context.m_cwd))
	{
		return Expected<void>::fromMessage(QString(IDS_ERR_CHROOT_EXIT_FAILED)
				.arg(QString("%1: %2").arg(context.m_cwd).arg(lastError())), ERR_CHROOT_EXIT_FAILED);
	}
	Logger::info(QString("Left change root, back in %1").arg(context.m_cwd));
	return Expected<void>();
}

} // namespace Chroot
