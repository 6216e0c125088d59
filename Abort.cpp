///////////////////////////////////////////////////////////////////////////////
///
/// @file Abort.cpp
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

#include <string.h>
#include <unistd.h>

#include <QtConcurrentRun>
#include <QMutexLocker>

#include "Abort.h"
#include "StringTable.h"
#include "Util.h"

namespace Abort
{

namespace
{
// Wakes the listener up on stop().
const int WAKEUP = SIGUSR1;

} // namespace

Expected<void> check(const token_type &token)
{
	if (!token || !token->isCancellationRequested())
		return Expected<void>();
	return Expected<void>::fromMessage(QString("%1 (%2)").arg(IDS_ERR_CANCELLED)
			.arg(strsignal(token->getSignal())), ERR_CANCELLED);
}

////////////////////////////////////////////////////////////
// Watcher

Watcher::Watcher(const token_type &token):
	m_token(token)
{
	// Threads started from now on inherit the mask.
	sigset_t blocked = getInterrupts();
	sigaddset(&blocked, WAKEUP);
	pthread_sigmask(SIG_BLOCK, &blocked, &m_saved);
}

Watcher::~Watcher()
{
	stop();
	pthread_sigmask(SIG_SETMASK, &m_saved, NULL);
}

sigset_t Watcher::getInterrupts()
{
	sigset_t s;
	sigemptyset(&s);
	sigaddset(&s, SIGINT);
	sigaddset(&s, SIGTERM);
	return s;
}

void Watcher::start()
{
	QMutexLocker l(&m_mutex);
	if (m_listener.isRunning())
		return;

	// Drop a wakeup left over from a previous stop().
	sigset_t wakeup;
	sigemptyset(&wakeup);
	sigaddset(&wakeup, WAKEUP);
	timespec zero = {0, 0};
	while (sigtimedwait(&wakeup, NULL, &zero) == WAKEUP)
	{
	}

	m_listener = QtConcurrent::run(this, &Watcher::listen);
}

void Watcher::stop()
{
	QMutexLocker l(&m_mutex);
	if (!m_listener.isRunning())
		return;

	kill(getpid(), WAKEUP);
	m_listener.waitForFinished();
}

void Watcher::listen()
{
	sigset_t all;
	sigfillset(&all);
	pthread_sigmask(SIG_BLOCK, &all, NULL);

	sigset_t interrupts = getInterrupts();
	sigset_t awaited = interrupts;
	sigaddset(&awaited, WAKEUP);

	int signo = sigwaitinfo(&awaited, NULL);
	if (signo == WAKEUP)
	{
		// An interrupt may have raced with the stop request.
		timespec zero = {0, 0};
		signo = sigtimedwait(&interrupts, NULL, &zero);
	}
	if (signo != SIGINT && signo != SIGTERM)
		return;

	Logger::error(QString("Got %1, stopping after the current step").arg(strsignal(signo)));
	if (m_token)
		m_token->requestCancellation(signo);
}

} // namespace Abort
