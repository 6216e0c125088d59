///////////////////////////////////////////////////////////////////////////////
///
/// @file Errors.h
///
/// Error codes carried by Expected.
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
#ifndef ERRORS_H
#define ERRORS_H

// Error codes carried by Expected<T>. Also used as the process exit code,
// so the values stay below 256. Code 1 is reserved for a completed run
// whose prerequisite validation failed.
enum
{
	ERR_VALIDATION_FAILED = 1,

	ERR_COMMAND_NOT_FOUND = 10,
	ERR_COMMAND_FAILED,
	ERR_RETRIES_EXHAUSTED,

	ERR_NO_FREE_DEVICE = 20,
	ERR_LINK_FAILED,
	ERR_MODULE_NOT_LOADED,

	ERR_MBR_READ = 30,
	ERR_INVALID_MBR,
	ERR_UNSUPPORTED_PARTITION,

	ERR_ACTIVATION_FAILED = 40,
	ERR_VG_COLLISION,

	ERR_MOUNT_FAILED = 50,
	ERR_FSTAB_NOT_FOUND,
	ERR_ROOT_NOT_FOUND,

	ERR_CHROOT_FAILED = 60,
	ERR_CHROOT_EXIT_FAILED,
	ERR_UNSUPPORTED_OS,
	ERR_PLUGIN_FAILED,

	ERR_CANCELLED = 70,
	ERR_IMAGE_LOCKED,
	ERR_IMAGE_INFO,
	ERR_CONFIG,
	ERR_INVALID_ARGS,
	ERR_BUSY
};

#endif // ERRORS_H
