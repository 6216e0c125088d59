///////////////////////////////////////////////////////////////////////////////
///
/// @file Abort.h
///
/// Cancellation token and SIGINT/SIGTERM handling.
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
#ifndef ABORT_H
#define ABORT_H

#include <signal.h>

#include <boost/shared_ptr.hpp>

#include <QFuture>
#include <QMutex>

#include "Expected.h"

namespace Abort
{

////////////////////////////////////////////////////////////
// Token

// Set asynchronously by the Watcher, polled between preparation steps.
struct Token
{
	typedef boost::shared_ptr<Token> token_type;

	Token(): m_signal(0)
	{
	}

	void requestCancellation(int signo)
	{
		m_signal = signo;
	}

	bool isCancellationRequested() const
	{
		return m_signal != 0;
	}

	int getSignal() const
	{
		return m_signal;
	}

private:
	sig_atomic_t volatile m_signal;
};

typedef Token::token_type token_type;

// Fails with ERR_CANCELLED once cancellation was requested.
Expected<void> check(const token_type &token);

////////////////////////////////////////////////////////////
// Watcher

// Keeps SIGINT and SIGTERM blocked for its lifetime and turns them
// into a cancellation request, so that a started step is never cut short.
struct Watcher
{
	explicit Watcher(const token_type &token);
	~Watcher();

	void start();
	void stop();

private:
	Q_DISABLE_COPY(Watcher)

	static sigset_t getInterrupts();
	void listen();

	QMutex m_mutex;
	QFuture<void> m_listener;
	sigset_t m_saved;
	token_type m_token;
};

} // namespace Abort

#endif // ABORT_H
