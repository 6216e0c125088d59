///////////////////////////////////////////////////////////////////////////////
///
/// @file Progress.h
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
#ifndef PROGRESS_H
#define PROGRESS_H

#include <QString>
#include <QMutex>
#include <QFuture>
#include <QAtomicInt>

namespace Progress
{

////////////////////////////////////////////////////////////
// Bar

// Spinner on stderr while a long call blocks. Drawn only on a terminal.
struct Bar
{
	Bar(const QString &label, bool enabled);
	~Bar();

	void start();
	void stop();

private:
	Q_DISABLE_COPY(Bar)

	void spin();

	QString m_label;
	bool m_enabled;
	QMutex m_mutex;
	QFuture<void> m_result;
	QAtomicInt m_stop;
};

} // namespace Progress

#endif // PROGRESS_H
