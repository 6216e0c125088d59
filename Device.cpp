///////////////////////////////////////////////////////////////////////////////
///
/// @file Device.cpp
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
#include <algorithm>

#include <QDir>
#include <QFile>
#include <QRegExp>
#include <QStringList>

#include <boost/bind.hpp>

#include "Device.h"
#include "Retry.h"
#include "StringTable.h"

namespace Device
{

namespace
{
const char MODPROBE[] = "modprobe";
const char RMMOD[] = "rmmod";
const char PVSCAN[] = "pvscan";

// nbd2 before nbd10.
struct ByIndex
{
	explicit ByIndex(const QString &prefix):
		m_prefix(prefix)
	{
	}

	bool operator() (const QString &first, const QString &second) const
	{
		return first.mid(m_prefix.size()).toUInt() < second.mid(m_prefix.size()).toUInt();
	}

private:
	QString m_prefix;
};

} // namespace

Expected<QString> findFree(const Config::Backend &backend)
{
	QDir sysfs(backend.m_sysfsRoot);
	QRegExp nameRE(QString("^%1\\d+$").arg(QRegExp::escape(backend.m_devicePrefix)));
	QStringList names = sysfs.entryList(QStringList() << backend.m_devicePrefix + "*",
			QDir::AllEntries | QDir::NoDotAndDotDot | QDir::System);
	names = names.filter(nameRE);
	std::sort(names.begin(), names.end(), ByIndex(backend.m_devicePrefix));

	Q_FOREACH(const QString &name, names)
	{
		QFile size(sysfs.filePath(name + "/size"));
		if (!size.open(QIODevice::ReadOnly))
			continue;
		bool ok = false;
		quint64 value = QString::fromUtf8(size.readAll()).trimmed().toULongLong(&ok);
		if (ok && value == 0)
			return QDir::cleanPath(backend.m_deviceDir + "/" + name);
	}
	return Expected<QString>::fromMessage(
			QString(IDS_ERR_NO_FREE_DEVICE).arg(backend.m_devicePrefix), ERR_NO_FREE_DEVICE);
}

////////////////////////////////////////////////////////////
// Nbd

Expected<void> Nbd::load() const
{
	QStringList args;
	args << m_backend.m_module;
	if (!m_backend.m_moduleParams.isEmpty())
		args << m_backend.m_moduleParams.split(' ', QString::SkipEmptyParts);
	Expected<QByteArray> out = m_adapter.execute(MODPROBE, args);
	if (!out.isOk())
		return out;
	return Expected<void>();
}

Expected<void> Nbd::link(const QString &device, const QString &image) const
{
	Expected<Exec::Result> res = m_adapter.run(m_backend.m_tool,
			QStringList() << "-c" << device << image);
	if (!res.isOk())
		return res;
	if (res.get().m_code != 0)
	{
		return Expected<void>::fromMessage(QString(IDS_ERR_LINK_FAILED)
				.arg(image).arg(device), ERR_LINK_FAILED);
	}
	return Expected<void>();
}

Expected<void> Nbd::unlink(const QString &device) const
{
	Expected<QByteArray> out = m_adapter.execute(m_backend.m_tool, QStringList() << "-d" << device);
	if (!out.isOk())
		return out;
	return Expected<void>();
}

Expected<void> Nbd::unload() const
{
	if (!m_adapter.exists(m_backend.m_moduleRoot + "/" + m_backend.m_module))
	{
		return Expected<void>::fromMessage(QString(IDS_ERR_MODULE_NOT_LOADED)
				.arg(m_backend.m_module), ERR_MODULE_NOT_LOADED);
	}
	Expected<QByteArray> out = m_adapter.execute(RMMOD, QStringList() << m_backend.m_module);
	if (!out.isOk())
		return out;
	return Expected<void>();
}

Expected<QString> Nbd::attach(const QString &image)
{
	Expected<void> res = Retry::withRetry<void>(
			Retry::Policy(m_retry.m_module, m_retry.m_interval), m_adapter,
			boost::bind(&Nbd::load, this));
	if (!res.isOk())
		return res;
	m_loaded = true;

	Expected<QString> device = findFree(m_backend);
	if (!device.isOk())
		return device;
	// Registered before linking, so that detach cleans up a partial link.
	m_device = device.get();

	res = Retry::withRetry<void>(
			Retry::Policy(m_retry.m_link, m_retry.m_interval), m_adapter,
			boost::bind(&Nbd::link, this, device.get(), image));
	if (!res.isOk())
		return res;

	Logger::info(QString("Linked %1 to %2, waiting %3s for partitions")
			.arg(image).arg(device.get()).arg(m_backend.m_settleSeconds));
	m_adapter.sleep(m_backend.m_settleSeconds);
	return device;
}

Expected<void> Nbd::detach()
{
	Expected<void> result;
	if (m_device)
	{
		result = Retry::withRetry<void>(
				Retry::Policy(m_retry.m_unlink, m_retry.m_interval), m_adapter,
				boost::bind(&Nbd::unlink, this, *m_device));
		if (result.isOk())
			m_device = boost::none;
		else
			Logger::error(result.getMessage());

		// Drop cached physical volumes of the image.
		Expected<QByteArray> out = m_adapter.execute(PVSCAN, QStringList() << "--cache");
		if (!out.isOk())
			Logger::error(out.getMessage());
	}
	if (!m_loaded || m_device)
		return result;

	Expected<void> res = unload();
	if (res.hasCode(ERR_MODULE_NOT_LOADED))
		Logger::info(res.getMessage());
	else if (!res.isOk() && m_retry.m_rmmod > 1)
	{
		m_adapter.sleep(m_retry.m_interval);
		res = Retry::withRetry<void>(
				Retry::Policy(m_retry.m_rmmod - 1, m_retry.m_interval), m_adapter,
				boost::bind(&Nbd::unload, this));
	}
	if (!res.isOk() && !res.hasCode(ERR_MODULE_NOT_LOADED))
		Logger::error(res.getMessage());
	m_loaded = false;
	return result;
}

} // namespace Device
