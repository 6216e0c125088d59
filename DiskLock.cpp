///////////////////////////////////////////////////////////////////////////////
///
/// @file DiskLock.cpp
///
/// Disk lock implementation
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

#include <sys/file.h>

#include "DiskLock.h"
#include "StringTable.h"
#include "Util.h"

////////////////////////////////////////////////////////////
// DiskLock

bool DiskLock::lock(const QString &path)
{
	Logger::info(QString("Locking image %1").arg(path));

	m_file.reset(new QFile(path));
	if (!m_file->open(QIODevice::ReadOnly))
		return false;

	if (flock(m_file->handle(), LOCK_EX | LOCK_NB))
	{
		m_file->close();
		return false;
	}
	return true;
}

// Safe to call if lock() failed.
void DiskLock::unlock()
{
	if (m_file.isNull() || !m_file->isOpen())
		return;

	Logger::info(QString("Unlocking image %1").arg(m_file->fileName()));
	// Closing the descriptor drops the lock.
	m_file->close();
}

////////////////////////////////////////////////////////////
// DiskLockGuard

Expected<DiskLockGuard::handle_type> DiskLockGuard::openExclusive(const QString &path)
{
	handle_type guard(new DiskLockGuard());
	if (!guard->m_lock.lock(path))
	{
		return Expected<handle_type>::fromMessage(
				QString(IDS_ERR_IMAGE_LOCKED).arg(path), ERR_IMAGE_LOCKED);
	}
	return guard;
}
