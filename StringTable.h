///////////////////////////////////////////////////////////////////////////////
///
/// @file StringTable.h
///
/// User visible messages.
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
#ifndef MIGRATE_STRING_TABLE_H
#define MIGRATE_STRING_TABLE_H

extern char IDS_ERR_SUBPROGRAM_RETURN_CODE[];
extern char IDS_ERR_COMMAND_NOT_FOUND[];
extern char IDS_ERR_RETRIES_EXHAUSTED[];
extern char IDS_ERR_INVALID_ARGS[];
extern char IDS_ERR_HDD_NOT_EXISTS[];
extern char IDS_ERR_IMAGE_LOCKED[];
extern char IDS_CANNOT_PARSE_IMAGE[];
extern char IDS_ERR_CONFIG[];

extern char IDS_ERR_NO_FREE_DEVICE[];
extern char IDS_ERR_LINK_FAILED[];
extern char IDS_ERR_MODULE_NOT_LOADED[];

extern char IDS_ERR_MBR_READ[];
extern char IDS_ERR_INVALID_MBR[];
extern char IDS_ERR_FS_UNSUPPORTED[];
extern char IDS_ERR_CANNOT_GET_PART_LIST[];

extern char IDS_ERR_ACTIVATION_FAILED[];
extern char IDS_ERR_VG_COLLISION[];

extern char IDS_ERR_CANNOT_MOUNT[];
extern char IDS_ERR_FSTAB_NOT_FOUND[];
extern char IDS_ERR_ROOT_NOT_FOUND[];

extern char IDS_ERR_CHROOT_FAILED[];
extern char IDS_ERR_CHROOT_EXIT_FAILED[];
extern char IDS_ERR_OS_RELEASE_NOT_FOUND[];
extern char IDS_ERR_UNSUPPORTED_OS[];
extern char IDS_ERR_PLUGIN_FAILED[];
extern char IDS_ERR_CANCELLED[];
extern char IDS_ERR_BUSY[];

extern char IDS_CHECK_BOOT_TYPE_UNKNOWN[];
extern char IDS_CHECK_BOOT_TYPE[];
extern char IDS_CHECK_MBR_INVALID[];
extern char IDS_CHECK_NO_BOOTABLE[];
extern char IDS_CHECK_NO_FSTAB[];
extern char IDS_CHECK_FSTAB_DEVICE[];
extern char IDS_CHECK_FSTAB_UNRESOLVED[];
extern char IDS_CHECK_NO_BOOTLOADER[];
extern char IDS_CHECK_NO_BOOT_LINES[];
extern char IDS_CHECK_BOOT_LINE[];
extern char IDS_CHECK_OS[];
extern char IDS_CHECK_MAC[];
extern char IDS_CHECK_IMAGE_UNKNOWN[];
extern char IDS_CHECK_IMAGE_FORMAT[];
extern char IDS_CHECK_IMAGE_SUBTYPE[];
extern char IDS_CHECK_IMAGE_SIZE[];

extern char IDS_REPORT__IMAGE[];
extern char IDS_REPORT__DEVICE[];
extern char IDS_REPORT__MBR[];
extern char IDS_REPORT__PARTITIONS[];
extern char IDS_REPORT__GROUPS[];
extern char IDS_REPORT__FSTAB[];
extern char IDS_REPORT__ROOT[];
extern char IDS_REPORT__OS[];
extern char IDS_REPORT__BOOTLOADER[];
extern char IDS_REPORT__NETWORK[];
extern char IDS_REPORT__PASSED[];
extern char IDS_REPORT__FAILED[];

#endif // MIGRATE_STRING_TABLE_H
