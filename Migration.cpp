///////////////////////////////////////////////////////////////////////////////
///
/// @file Migration.cpp
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
#include <boost/scope_exit.hpp>

#include "Migration.h"
#include "Bootloader.h"
#include "Chroot.h"
#include "Fstab.h"
#include "Guest.h"
#include "ImageInfo.h"
#include "Lvm.h"
#include "Mbr.h"
#include "Partition.h"
#include "Plugin.h"
#include "Progress.h"
#include "StringTable.h"
#include "Validator.h"

namespace Migration
{

QStringList getMounted(const Image::Descriptor &descriptor)
{
	QStringList result;
	Q_FOREACH(const Partition::Record &record, descriptor.m_partitions)
	{
		if (record.m_mountpoint)
			result << *record.m_mountpoint;
	}
	return result;
}

////////////////////////////////////////////////////////////
// Orchestrator

Orchestrator::Orchestrator(const CallAdapter &adapter, const Config::Settings &settings,
		const Abort::token_type &token):
	m_adapter(adapter), m_settings(settings), m_token(token),
	m_nbd(adapter, settings), m_manager(adapter, settings, m_mounts)
{
}

Expected<Image::Descriptor> Orchestrator::run(const QString &image)
{
	Image::Descriptor descriptor(image);
	Expected<void> res = execute(descriptor);
	Expected<void> released = teardown(descriptor);
	if (!res.isOk())
	{
		if (!released.isOk())
			Logger::error(released.getMessage());
		return res;
	}
	if (!released.isOk())
		return released.prepend("teardown");
	return descriptor;
}

Expected<void> Orchestrator::execute(Image::Descriptor &descriptor)
{
	struct
	{
		const char *name;
		step_type step;
	} steps[] =
	{
		{"attach", &Orchestrator::attach},
		{"partition table", &Orchestrator::readTable},
		{"partitions", &Orchestrator::mountPartitions},
		{"volume groups", &Orchestrator::mountVolumes},
		{"root", &Orchestrator::locateRoot},
		{"guest tree", &Orchestrator::mountTree},
		{"customization", &Orchestrator::customize},
		{"validation", &Orchestrator::certify}
	};

	Expected<void> res;
	for (size_t i = 0; i < sizeof(steps) / sizeof(steps[0]); ++i)
	{
		if (!(res = Abort::check(m_token)).isOk())
			return res;

		Logger::info(QString("Step: %1").arg(steps[i].name));
		if (!(res = (this->*steps[i].step)(descriptor)).isOk())
			return res.prepend(steps[i].name);
	}
	return res;
}

Expected<void> Orchestrator::teardown(Image::Descriptor &descriptor)
{
	if (!m_manager.unmountAll())
	{
		// Volume groups stay active and the device stays attached
		// while anything on them is mounted.
		QString device = m_nbd.getDevice().get_value_or(descriptor.m_path);
		return Expected<void>::fromMessage(QString(IDS_ERR_BUSY).arg(device), ERR_BUSY);
	}
	for (Partition::Map::iterator it = descriptor.m_partitions.begin();
			it != descriptor.m_partitions.end(); ++it)
		it->m_mountpoint = boost::none;

	Lvm::Handler(m_adapter).deactivate(descriptor.m_groups);
	return m_nbd.detach();
}

Expected<void> Orchestrator::attach(Image::Descriptor &descriptor)
{
	Expected<Image::Info> info = Image::Unit(descriptor.m_path).getInfo(m_adapter);
	if (!info.isOk())
		return info;
	descriptor.m_info = info.get();

	// Groups seen now belong to the host, not to the image.
	Expected<QSet<QString> > host = Lvm::Handler(m_adapter).snapshotHost();
	if (host.isOk())
		m_hostGroups = host.get();
	else
		Logger::warning(host.getMessage());

	Progress::Bar bar(QString("Attaching %1").arg(descriptor.m_path), m_settings.m_progress);
	Expected<QString> device = m_nbd.attach(descriptor.m_path);
	if (!device.isOk())
		return device;
	descriptor.m_device = device.get();
	return Expected<void>();
}

Expected<void> Orchestrator::readTable(Image::Descriptor &descriptor)
{
	const QString &device = *descriptor.m_device;
	Expected<QByteArray> bytes = Mbr::read(device);
	if (!bytes.isOk())
		return bytes;
	descriptor.m_mbrBytes = bytes.get();
	descriptor.m_mbr = Mbr::parse(bytes.get());
	if (!descriptor.m_mbr.m_valid)
		return Expected<void>::fromMessage(QString(IDS_ERR_INVALID_MBR).arg(device), ERR_INVALID_MBR);

	Partition::Analyzer analyzer(m_adapter);
	Expected<Partition::Parted> parted = analyzer.collectParted(device);
	if (parted.isOk())
		descriptor.m_parted = parted.get();
	else
		Logger::warning(parted.getMessage());

	Expected<Partition::SfdiskMap> sfdisk = analyzer.collectSfdisk(device);
	if (!sfdisk.isOk())
		return sfdisk;
	descriptor.m_sfdisk = sfdisk.get();
	return Expected<void>();
}

Expected<void> Orchestrator::scanPartition(Image::Descriptor &descriptor, Partition::Record record)
{
	Expected<Partition::Record> inspected = Partition::Analyzer(m_adapter).inspect(record.m_device);
	if (!inspected.isOk())
		return inspected;

	Partition::Record &target = descriptor.m_partitions[record.m_device];
	target = inspected.get();
	target.m_start = record.m_start;
	target.m_size = record.m_size;
	target.m_id = record.m_id;
	target.m_bootable = record.m_bootable;

	Partition::Classifier classifier(m_settings);
	Expected<Partition::Usage> usage = classifier.classify(target);
	if (!usage.isOk())
		return usage;
	target.m_usage = usage.get();
	target.m_lvm = classifier.isLogicalVolume(target);
	if (target.m_usage != Partition::USAGE_STANDARD || target.m_lvm)
		return Expected<void>();

	Progress::Bar bar(QString("Mounting %1").arg(target.m_device), m_settings.m_progress);
	Expected<QString> mountpoint = m_manager.mountPartition(target.m_device);
	bar.stop();
	if (!mountpoint.isOk())
		return mountpoint;
	target.m_mountpoint = mountpoint.get();
	return Expected<void>();
}

Expected<void> Orchestrator::mountPartitions(Image::Descriptor &descriptor)
{
	for (Partition::SfdiskMap::const_iterator it = descriptor.m_sfdisk.constBegin();
			it != descriptor.m_sfdisk.constEnd(); ++it)
	{
		// Unused table slot.
		if (it->m_size == 0)
			continue;

		Partition::Record record(it.key());
		record.m_start = it->m_start;
		record.m_size = it->m_size;
		record.m_id = it->m_id;
		record.m_bootable = it->m_bootable;

		Expected<void> res = scanPartition(descriptor, record);
		if (!res.isOk())
			return res;
	}
	return Expected<void>();
}

Expected<void> Orchestrator::mountVolumes(Image::Descriptor &descriptor)
{
	QStringList physicals;
	Q_FOREACH(const Partition::Record &record, descriptor.m_partitions)
	{
		if (record.m_lvm)
			physicals << record.m_device;
	}
	if (physicals.isEmpty())
		return Expected<void>();

	Lvm::Handler lvm(m_adapter);
	{
		Progress::Bar bar("Scanning volume groups", m_settings.m_progress);
		Expected<Lvm::GroupList> groups = lvm.rescan(physicals, m_hostGroups);
		if (!groups.isOk())
			return groups;
		// Deactivated on teardown from here on.
		descriptor.m_groups = groups.get();

		Expected<void> res = lvm.activate(descriptor.m_groups);
		if (!res.isOk())
			return res;
	}

	Q_FOREACH(const Lvm::Group &group, descriptor.m_groups)
	{
		Q_FOREACH(const Lvm::Logical &volume, group.getVolumes())
		{
			Expected<void> res = scanPartition(descriptor, Partition::Record(volume.getDevice()));
			if (!res.isOk())
				return res;
		}
	}
	return Expected<void>();
}

Expected<void> Orchestrator::locateRoot(Image::Descriptor &descriptor)
{
	Expected<QString> path = Fstab::locate(getMounted(descriptor));
	if (!path.isOk())
		return path;
	descriptor.m_fstabPath = path.get();

	Expected<Fstab::EntryList> entries = Fstab::read(path.get());
	if (!entries.isOk())
		return entries;
	descriptor.m_fstab = entries.get();

	Expected<Fstab::Resolution> resolution = Fstab::resolve(descriptor.m_fstab,
			descriptor.m_partitions, m_settings.m_partitionsToSkip);
	if (!resolution.isOk())
		return resolution;

	const Fstab::Resolution &r = resolution.get();
	Q_FOREACH(const Mount::Target &target, r.m_secondary)
		descriptor.m_partitions[target.second].m_fstabMount = target.first;
	descriptor.m_partitions[r.m_rootPartition].m_usage = Partition::USAGE_ROOT;
	descriptor.m_partitions[r.m_rootPartition].m_fstabMount = "/";
	if (r.m_bootPartition && *r.m_bootPartition != r.m_rootPartition)
		descriptor.m_partitions[*r.m_bootPartition].m_usage = Partition::USAGE_BOOT;

	Logger::info(QString("Root %1").arg(r.toString()));
	descriptor.m_resolution = r;
	return Expected<void>();
}

Expected<void> Orchestrator::mountTree(Image::Descriptor &descriptor)
{
	const Fstab::Resolution &r = *descriptor.m_resolution;
	if (r.m_rootMount.isEmpty())
	{
		return Expected<void>::fromMessage(QString("%1: %2")
				.arg(IDS_ERR_ROOT_NOT_FOUND, r.m_rootPartition), ERR_ROOT_NOT_FOUND);
	}

	Expected<void> res = m_manager.remount(r.m_rootMount, r.m_secondary);
	if (!res.isOk())
		return res;

	QStringList roots(r.m_rootMount);
	if (r.m_bootMount)
		roots << *r.m_bootMount;
	descriptor.m_bootloader = Bootloader::load(roots);
	if (!descriptor.m_bootloader)
		Logger::warning(QString("No grub configuration found under %1").arg(roots.join(", ")));
	return Expected<void>();
}

Expected<void> Orchestrator::customize(Image::Descriptor &descriptor)
{
	const QString &root = descriptor.m_resolution->m_rootMount;
	Expected<Guest::Release> release = Guest::detectOS(root);
	if (!release.isOk())
		return release;
	descriptor.m_release = release.get();

	Plugin::Registry registry(m_adapter, m_settings);
	Expected<Plugin::handle_type> plugin = registry.select(descriptor.m_release.value("ID"));
	if (!plugin.isOk())
		return plugin;
	descriptor.m_plugin = plugin.get()->getName();

	Expected<QStringList> pseudo = m_manager.mountPseudo(root);
	if (!pseudo.isOk())
		return pseudo;

	const CallAdapter &adapter = m_adapter;
	Expected<Chroot::Context> context = Chroot::enter(adapter, root);
	if (!context.isOk())
		return context;

	BOOST_SCOPE_EXIT(&adapter, &context)
	{
		Expected<void> left = Chroot::leave(adapter, context.get());
		if (!left.isOk())
			Logger::error(left.getMessage());
	} BOOST_SCOPE_EXIT_END

	Progress::Bar bar(QString("Customizing %1").arg(descriptor.m_plugin), m_settings.m_progress);
	Expected<void> res = plugin.get()->updateNetworkConfig();
	if (!res.isOk())
		return res;
	return plugin.get()->installCloudInit(descriptor.m_release.value("VERSION_ID"));
}

Expected<void> Orchestrator::certify(Image::Descriptor &descriptor)
{
	descriptor.m_network = Guest::collectNetwork(descriptor.m_resolution->m_rootMount);
	descriptor.m_verdict = Validator::validate(descriptor, Validator::Rules(m_settings));
	return Expected<void>();
}

} // namespace Migration
