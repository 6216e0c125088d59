///////////////////////////////////////////////////////////////////////////////
///
/// @file Util.h
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
#ifndef UTIL_H
#define UTIL_H

#include <QStringList>
#include <QByteArray>
#include <iostream>

#include <unistd.h>

#include <boost/shared_ptr.hpp>

#include "Expected.h"

#define QSTR2UTF8(str) ( (str).toUtf8().constData() )
#define UTF8_2QSTR(str) QString::fromUtf8( (str) )

extern const char QEMU_IMG[];

int run_prg(const QString &name, const QStringList &lstArgs, QByteArray *out, QByteArray *err);

////////////////////////////////////////////////////////////
// Logger

struct Logger: std::ostream
{
	static void init(bool verbose)
	{
		s_verbose = verbose;
	}

	static bool isVerbose()
	{
		return s_verbose;
	}

	static void print(const QString &line, std::ostream &stream = std::cout)
	{
		stream << QSTR2UTF8(line) << std::endl;
	}

	static void info(const QString &line)
	{
		if (s_verbose)
			print(line);
	}

	static void warning(const QString &line)
	{
		print(QString("Warning: ") + line, std::cerr);
	}

	static void error(const QString &line)
	{
		print(line, std::cerr);
	}

private:
	static bool s_verbose;
};

namespace Exec
{

////////////////////////////////////////////////////////////
// Result

struct Result
{
	Result(): m_code(-1)
	{
	}

	// Combined stdout and stderr, for tools which report on either.
	QString getText() const
	{
		return QString::fromUtf8(m_out) + QString::fromUtf8(m_err);
	}

	QByteArray m_out;
	QByteArray m_err;
	int m_code;
};

} // namespace Exec

////////////////////////////////////////////////////////////
// Call
// Every side effect on the host goes through here.

struct Call
{
	virtual ~Call()
	{
	}

	// Returns exit code of the program or -1 if it did not finish.
	virtual int run(const QString &name, const QStringList &lstArgs, QByteArray *out, QByteArray *err) const
	{
		return run_prg(name, lstArgs, out, err);
	}

	// Full path of the executable, empty if not found.
	virtual QString which(const QString &name) const;

	virtual bool exists(const QString &path) const;
	virtual bool isMountpoint(const QString &path) const;
	virtual bool mkpath(const QString &path) const;
	virtual bool rmdir(const QString &path) const;

	// Root switching primitives; on failure errno tells why.
	virtual int openDirectory(const QString &path) const;
	virtual bool chdir(const QString &path) const;
	virtual bool fchdir(int fd) const;
	virtual bool chroot(const QString &path) const;
	virtual void close(int fd) const;

	virtual void sleep(unsigned seconds) const
	{
		::sleep(seconds);
	}
};

////////////////////////////////////////////////////////////
// CallAdapter

struct CallAdapter
{
	explicit CallAdapter(const boost::shared_ptr<Call> &call):
		m_call(call)
	{
	}

	Expected<Exec::Result> run(const QString &name, const QStringList &lstArgs) const;

	// Exit code only.
	Expected<int> runSilent(const QString &name, const QStringList &lstArgs) const;

	// Fails unless the program exits with 0.
	Expected<QByteArray> execute(const QString &name, const QStringList &lstArgs) const;

	bool exists(const QString &path) const
	{
		return m_call->exists(path);
	}

	bool isMountpoint(const QString &path) const
	{
		return m_call->isMountpoint(path);
	}

	bool mkpath(const QString &path) const
	{
		Logger::info(QString("mkdir -p %1").arg(path));
		return m_call->mkpath(path);
	}

	bool rmdir(const QString &path) const
	{
		Logger::info(QString("rmdir %1").arg(path));
		return m_call->rmdir(path);
	}

	int openDirectory(const QString &path) const
	{
		return m_call->openDirectory(path);
	}

	bool chdir(const QString &path) const
	{
		return m_call->chdir(path);
	}

	bool fchdir(int fd) const
	{
		return m_call->fchdir(fd);
	}

	bool chroot(const QString &path) const
	{
		Logger::info(QString("chroot %1").arg(path));
		return m_call->chroot(path);
	}

	void close(int fd) const
	{
		m_call->close(fd);
	}

	void sleep(unsigned seconds) const
	{
		m_call->sleep(seconds);
	}

private:
	boost::shared_ptr<Call> m_call;
};

#endif // UTIL_H
