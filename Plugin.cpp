///////////////////////////////////////////////////////////////////////////////
///
/// @file Plugin.cpp
///
/// Distribution specific guest customization.
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
#include "Plugin.h"
#include "StringTable.h"

namespace Plugin
{

namespace
{
const char CLOUD_INIT[] = "cloud-init";

} // namespace

////////////////////////////////////////////////////////////
// Packaged

Expected<void> Packaged::updateNetworkConfig() const
{
	if (m_networkHelper.isEmpty())
	{
		Logger::info("No network helper configured, guest network configuration is left as is");
		return Expected<void>();
	}
	Expected<QByteArray> out = m_adapter.execute(m_networkHelper, QStringList() << getName());
	if (!out.isOk())
	{
		return Expected<void>::fromMessage(QString(IDS_ERR_PLUGIN_FAILED)
				.arg(getName()).arg("update network configuration") + ": " + out.getMessage(),
				ERR_PLUGIN_FAILED);
	}
	return Expected<void>();
}

Expected<void> Packaged::installCloudInit(const QString &version) const
{
	Logger::info(QString("Installing %1 on %2 %3").arg(CLOUD_INIT).arg(getName()).arg(version));

	Expected<QByteArray> out = m_adapter.execute(m_tool, QStringList() << "list" << CLOUD_INIT);
	if (out.isOk() && !QString::fromUtf8(out.get()).contains(CLOUD_INIT))
	{
		out = Expected<QByteArray>::fromMessage(
				QString("package %1 is missing from the repository").arg(CLOUD_INIT),
				ERR_PLUGIN_FAILED);
	}
	if (out.isOk())
		out = m_adapter.execute(m_tool, QStringList() << "install" << "-y" << CLOUD_INIT);
	if (!out.isOk())
	{
		return Expected<void>::fromMessage(QString(IDS_ERR_PLUGIN_FAILED)
				.arg(getName()).arg(QString("install %1").arg(CLOUD_INIT)) + ": " + out.getMessage(),
				ERR_PLUGIN_FAILED);
	}
	return Expected<void>();
}

////////////////////////////////////////////////////////////
// Registry

Registry::Registry(const CallAdapter &adapter, const Config::Settings &settings)
{
	m_plugins << handle_type(new Ol(adapter, settings.m_networkHelper))
		<< handle_type(new Ubuntu(adapter, settings.m_networkHelper));
}

Expected<handle_type> Registry::select(const QString &osId) const
{
	QString id = osId.toLower();
	Q_FOREACH(const handle_type &plugin, m_plugins)
	{
		if (plugin->getIds().contains(id))
		{
			Logger::info(QString("OS %1 is handled by plugin %2").arg(id, plugin->getName()));
			return plugin;
		}
	}
	return Expected<handle_type>::fromMessage(QString(IDS_ERR_UNSUPPORTED_OS).arg(osId),
			ERR_UNSUPPORTED_OS);
}

} // namespace Plugin
