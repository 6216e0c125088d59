///////////////////////////////////////////////////////////////////////////////
///
/// @file Chroot.h
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
#ifndef CHROOT_H
#define CHROOT_H

#include <QString>
#include <QByteArray>

#include "Expected.h"

struct CallAdapter;

namespace Chroot
{

// Directories which must be in PATH inside the guest.
extern const char REQUIRED_PATH[];

////////////////////////////////////////////////////////////
// Context

struct Context
{
	Context(): m_rootFd(-1), m_hadPath(false)
	{
	}

	// Descriptor of the original root.
	int m_rootFd;
	QString m_cwd;
	QByteArray m_path;
	bool m_hadPath;
};

// PATH with required directories appended once; other entries keep order.
QString rebuildPath(const QString &path);

Expected<Context> enter(const CallAdapter &adapter, const QString &newRoot);

// Consumes the context: the root descriptor is closed.
Expected<void> leave(const CallAdapter &adapter, Context &context);

} // namespace Chroot

#endif // CHROOT_H
