///////////////////////////////////////////////////////////////////////////////
///
/// @file Util.cpp
///
/// Host command execution and logging helpers.
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
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <sys/stat.h>

#include <QProcess>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

#include "Util.h"
#include "StringTable.h"

extern const char QEMU_IMG[] = "qemu-img";

bool Logger::s_verbose = false;

namespace
{
enum {CMD_WORK_STEPS = 60 * 60, CMD_WORK_STEP_TIME = 1000};

class IndependentProcess: public QProcess
{
protected:
	void setupChildProcess()
	{
		setpgid(0, 0);

		sigset_t a;
		sigemptyset(&a);
		sigprocmask(SIG_SETMASK, &a, NULL);
	}
};

} // namespace

int run_prg(const QString &name, const QStringList &lstArgs, QByteArray *out, QByteArray *err)
{
	IndependentProcess proc;
	proc.start(name, lstArgs);
	if (!proc.waitForStarted())
	{
		fprintf(stderr, "Unable to start %s\n", QSTR2UTF8(name));
		return -1;
	}

	int step;
	for (step = 0; step < CMD_WORK_STEPS; ++step)
	{
		if (proc.waitForFinished(CMD_WORK_STEP_TIME))
			break;
	}

	if (step >= CMD_WORK_STEPS)
	{
		fprintf(stderr, "%s tool not responding. Terminate it now.\n", QSTR2UTF8(name));
		proc.kill();
		proc.waitForFinished();
		return -1;
	}
	if (out)
		*out = proc.readAllStandardOutput();
	if (err)
		*err = proc.readAllStandardError();

	if (proc.exitStatus() != QProcess::NormalExit)
		return -1;
	return proc.exitCode();
}

////////////////////////////////////////////////////////////
// Call

QString Call::which(const QString &name) const
{
	if (name.startsWith('/'))
	{
		QFileInfo info(name);
		return info.isExecutable() ? name : QString();
	}
	return QStandardPaths::findExecutable(name);
}

bool Call::exists(const QString &path) const
{
	return QFileInfo(path).exists();
}

bool Call::isMountpoint(const QString &path) const
{
	struct stat self, parent;
	if (::lstat(QSTR2UTF8(path), &self) || !S_ISDIR(self.st_mode))
		return false;
	QString up = QDir::cleanPath(path + "/..");
	if (::lstat(QSTR2UTF8(up), &parent))
		return false;
	if (self.st_dev != parent.st_dev)
		return true;
	// The root directory is its own parent.
	return self.st_ino == parent.st_ino;
}

bool Call::mkpath(const QString &path) const
{
	return QDir().mkpath(path);
}

bool Call::rmdir(const QString &path) const
{
	return QDir().rmdir(path);
}

// Not inherited by the tools run inside the new root.
int Call::openDirectory(const QString &path) const
{
	return ::open(QSTR2UTF8(path), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
}

bool Call::chdir(const QString &path) const
{
	return ::chdir(QSTR2UTF8(path)) == 0;
}

bool Call::fchdir(int fd) const
{
	return ::fchdir(fd) == 0;
}

bool Call::chroot(const QString &path) const
{
	return ::chroot(QSTR2UTF8(path)) == 0;
}

void Call::close(int fd) const
{
	::close(fd);
}

////////////////////////////////////////////////////////////
// CallAdapter

Expected<Exec::Result> CallAdapter::run(const QString &name, const QStringList &lstArgs) const
{
	QString command = QString("%1 %2").arg(name).arg(lstArgs.join(" ")).trimmed();
	Logger::info(command);

	QString path = m_call->which(name);
	if (path.isEmpty())
	{
		return Expected<Exec::Result>::fromMessage(
				QString(IDS_ERR_COMMAND_NOT_FOUND).arg(name), ERR_COMMAND_NOT_FOUND);
	}

	Exec::Result result;
	result.m_code = m_call->run(path, lstArgs, &result.m_out, &result.m_err);
	if (result.m_code != 0)
	{
		Logger::info(QString("%1 [%2]\nout=%3\nerr=%4")
				.arg(command).arg(result.m_code)
				.arg(QString::fromUtf8(result.m_out).trimmed())
				.arg(QString::fromUtf8(result.m_err).trimmed()));
	}
	return result;
}

Expected<int> CallAdapter::runSilent(const QString &name, const QStringList &lstArgs) const
{
	Expected<Exec::Result> result = run(name, lstArgs);
	if (!result.isOk())
		return result;
	return result.get().m_code;
}

Expected<QByteArray> CallAdapter::execute(const QString &name, const QStringList &lstArgs) const
{
	Expected<Exec::Result> result = run(name, lstArgs);
	if (!result.isOk())
		return result;
	if (result.get().m_code != 0)
	{
		QString err = QString::fromUtf8(result.get().m_err).trimmed();
		QString msg = QString(IDS_ERR_SUBPROGRAM_RETURN_CODE)
				.arg(name).arg(lstArgs.join(" ")).arg(result.get().m_code);
		if (!err.isEmpty())
			msg += QString(": %1").arg(err);
		return Expected<QByteArray>::fromMessage(msg, ERR_COMMAND_FAILED);
	}
	return result.get().m_out;
}
