///////////////////////////////////////////////////////////////////////////////
///
/// @file Migration.h
///
/// Image preparation steps and their teardown.
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
#ifndef MIGRATION_H
#define MIGRATION_H

#include <QSet>
#include <QString>
#include <QStringList>

#include "Abort.h"
#include "Config.h"
#include "Descriptor.h"
#include "Device.h"
#include "Expected.h"
#include "Mount.h"
#include "Util.h"

namespace Migration
{

////////////////////////////////////////////////////////////
// Orchestrator

// One run over one image. Whatever happens, everything acquired on the
// host is released before run() returns: mounts last to first, then volume
// groups, then the device. A mount that stays busy keeps the groups and
// the device in place and fails the run with ERR_BUSY.
struct Orchestrator
{
	Orchestrator(const CallAdapter &adapter, const Config::Settings &settings,
			const Abort::token_type &token);

	Expected<Image::Descriptor> run(const QString &image);

private:
	Q_DISABLE_COPY(Orchestrator)

	typedef Expected<void> (Orchestrator::*step_type)(Image::Descriptor &descriptor);

	Expected<void> execute(Image::Descriptor &descriptor);
	// Nothing below a mount that could not be released is touched.
	Expected<void> teardown(Image::Descriptor &descriptor);

	Expected<void> attach(Image::Descriptor &descriptor);
	Expected<void> readTable(Image::Descriptor &descriptor);
	Expected<void> mountPartitions(Image::Descriptor &descriptor);
	Expected<void> mountVolumes(Image::Descriptor &descriptor);
	Expected<void> locateRoot(Image::Descriptor &descriptor);
	Expected<void> mountTree(Image::Descriptor &descriptor);
	Expected<void> customize(Image::Descriptor &descriptor);
	Expected<void> certify(Image::Descriptor &descriptor);

	// Inspect and classify, then mount unless the partition is a physical volume.
	Expected<void> scanPartition(Image::Descriptor &descriptor, Partition::Record record);

	CallAdapter m_adapter;
	Config::Settings m_settings;
	Abort::token_type m_token;
	Device::Nbd m_nbd;
	Mount::Set m_mounts;
	Mount::Manager m_manager;
	QSet<QString> m_hostGroups;
};

// Mountpoints of the partitions and volumes mounted so far.
QStringList getMounted(const Image::Descriptor &descriptor);

} // namespace Migration

#endif // MIGRATION_H
