///////////////////////////////////////////////////////////////////////////////
///
/// @file StringTable.cpp
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

#include "StringTable.h"

char IDS_ERR_SUBPROGRAM_RETURN_CODE[] = "%1 %2 returned %3";
char IDS_ERR_COMMAND_NOT_FOUND[] = "Command '%1' is not found in PATH";
char IDS_ERR_RETRIES_EXHAUSTED[] = "Giving up after %1 attempts: %2";
char IDS_ERR_INVALID_ARGS[] = "Invalid arguments";
char IDS_ERR_HDD_NOT_EXISTS[] = "The specified disk image \"%1\" does not exist";
char IDS_ERR_IMAGE_LOCKED[] = "The specified disk image \"%1\" is locked by another process";
char IDS_CANNOT_PARSE_IMAGE[] = "Cannot parse image information";
char IDS_ERR_CONFIG[] = "Invalid configuration file \"%1\": %2";

char IDS_ERR_NO_FREE_DEVICE[] = "No free %1 device found";
char IDS_ERR_LINK_FAILED[] = "Unable to link image \"%1\" to %2";
char IDS_ERR_MODULE_NOT_LOADED[] = "Kernel module %1 is not loaded";

char IDS_ERR_MBR_READ[] = "Unable to read master boot record from %1";
char IDS_ERR_INVALID_MBR[] = "%1 does not contain a valid master boot record";
char IDS_ERR_FS_UNSUPPORTED[] = "Unsupported filesystem %1 on %2";
char IDS_ERR_CANNOT_GET_PART_LIST[] = "Unable to get partition list of %1";

char IDS_ERR_ACTIVATION_FAILED[] = "Volume group %1 was not activated";
char IDS_ERR_VG_COLLISION[] =
	"Volume group %1 of the image has the same name as a volume group of this host";

char IDS_ERR_CANNOT_MOUNT[] = "Cannot mount %1 on %2";
char IDS_ERR_FSTAB_NOT_FOUND[] = "No etc/fstab found on any mounted filesystem";
char IDS_ERR_ROOT_NOT_FOUND[] = "Unable to find the partition holding the root filesystem";

char IDS_ERR_CHROOT_FAILED[] = "Unable to change root to %1: %2";
char IDS_ERR_CHROOT_EXIT_FAILED[] = "Unable to leave change root jail: %1";
char IDS_ERR_OS_RELEASE_NOT_FOUND[] = "No os-release file found in %1";
char IDS_ERR_UNSUPPORTED_OS[] = "Operating system \"%1\" is not supported";
char IDS_ERR_PLUGIN_FAILED[] = "Plugin %1 failed to %2";
char IDS_ERR_CANCELLED[] = "Operation has been cancelled";
char IDS_ERR_BUSY[] = "Filesystems of the image are still mounted, %1 is left attached";

char IDS_CHECK_BOOT_TYPE_UNKNOWN[] = "Boot type could not be determined";
char IDS_CHECK_BOOT_TYPE[] = "Boot type %1 is not supported";
char IDS_CHECK_MBR_INVALID[] = "Master boot record is not valid";
char IDS_CHECK_NO_BOOTABLE[] = "No partition is marked bootable";
char IDS_CHECK_NO_FSTAB[] = "No fstab found";
char IDS_CHECK_FSTAB_DEVICE[] =
	"fstab entry \"%1\" for %2 uses a device path, use UUID, LABEL or /dev/mapper instead";
char IDS_CHECK_FSTAB_UNRESOLVED[] = "fstab entry \"%1\" for %2 does not match any partition";
char IDS_CHECK_NO_BOOTLOADER[] = "No grub configuration found";
char IDS_CHECK_NO_BOOT_LINES[] = "No boot device references found in %1";
char IDS_CHECK_BOOT_LINE[] = "Boot device is not referenced by UUID: \"%1\"";
char IDS_CHECK_OS[] = "Operating system \"%1\" is not supported";
char IDS_CHECK_MAC[] = "%1 hard-codes MAC address %2";
char IDS_CHECK_IMAGE_UNKNOWN[] = "Image format could not be determined";
char IDS_CHECK_IMAGE_FORMAT[] = "Image format %1 is not supported";
char IDS_CHECK_IMAGE_SUBTYPE[] = "Image type %1 is not in the supported list: %2";
char IDS_CHECK_IMAGE_SIZE[] = "Image size %1 GB exceeds the maximum of %2 GB";

char IDS_REPORT__IMAGE[] = "Image:";
char IDS_REPORT__DEVICE[] = "Device:";
char IDS_REPORT__MBR[] = "Partition table:";
char IDS_REPORT__PARTITIONS[] = "Partitions:";
char IDS_REPORT__GROUPS[] = "Volume groups:";
char IDS_REPORT__FSTAB[] = "fstab:";
char IDS_REPORT__ROOT[] = "Root:";
char IDS_REPORT__OS[] = "Operating system:";
char IDS_REPORT__BOOTLOADER[] = "Boot loader:";
char IDS_REPORT__NETWORK[] = "Network configuration:";
char IDS_REPORT__PASSED[] = "Image meets the prerequisites for import";
char IDS_REPORT__FAILED[] = "Image does not meet the prerequisites for import:";
