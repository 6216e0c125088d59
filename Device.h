///////////////////////////////////////////////////////////////////////////////
///
/// @file Device.h
///
/// Network block device attach and detach.
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
#ifndef DEVICE_H
#define DEVICE_H

#include <QString>

#include <boost/optional.hpp>

#include "Expected.h"
#include "Config.h"
#include "Util.h"

namespace Device
{

// First block device of the backend whose size in sysfs is 0.
Expected<QString> findFree(const Config::Backend &backend);

////////////////////////////////////////////////////////////
// Nbd

struct Nbd
{
	Nbd(const CallAdapter &adapter, const Config::Settings &settings):
		m_adapter(adapter), m_backend(settings.m_backend),
		m_retry(settings.m_retry), m_loaded(false)
	{
	}

	Expected<QString> attach(const QString &image);

	// Safe to call after a failed or partial attach.
	Expected<void> detach();

	const boost::optional<QString>& getDevice() const
	{
		return m_device;
	}

private:
	Expected<void> load() const;
	Expected<void> link(const QString &device, const QString &image) const;
	Expected<void> unlink(const QString &device) const;
	Expected<void> unload() const;

	CallAdapter m_adapter;
	Config::Backend m_backend;
	Config::Retries m_retry;
	bool m_loaded;
	boost::optional<QString> m_device;
};

} // namespace Device

#endif // DEVICE_H
