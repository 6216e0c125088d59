///////////////////////////////////////////////////////////////////////////////
///
/// @file Progress.cpp
///
/// Console progress indicator for long running steps.
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
#include <unistd.h>

#include <QtConcurrentRun>
#include <QMutexLocker>

#include "Progress.h"
#include "Util.h"

namespace Progress
{

namespace
{
enum {SPIN_STEP_USEC = 200 * 1000};

const char SPINNER[] = "|/-\\";

} // namespace

////////////////////////////////////////////////////////////
// Bar

Bar::Bar(const QString &label, bool enabled):
	m_label(label), m_enabled(enabled && isatty(STDERR_FILENO)), m_stop(0)
{
	start();
}

Bar::~Bar()
{
	stop();
}

void Bar::start()
{
	QMutexLocker m(&m_mutex);
	if (!m_enabled || !m_result.isFinished())
		return;

	m_stop.fetchAndStoreOrdered(0);
	m_result = QtConcurrent::run(this, &Bar::spin);
}

void Bar::stop()
{
	QMutexLocker m(&m_mutex);
	if (m_result.isFinished())
		return;

	m_stop.fetchAndStoreOrdered(1);
	m_result.waitForFinished();
}

void Bar::spin()
{
	QByteArray label = m_label.toUtf8();
	for (unsigned i = 0; !m_stop.loadAcquire(); ++i)
	{
		fprintf(stderr, "\r%s %c", label.constData(), SPINNER[i % (sizeof(SPINNER) - 1)]);
		fflush(stderr);
		usleep(SPIN_STEP_USEC);
	}
	fprintf(stderr, "\r%s done\n", label.constData());
	fflush(stderr);
}

} // namespace Progress
