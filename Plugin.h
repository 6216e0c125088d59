///////////////////////////////////////////////////////////////////////////////
///
/// @file Plugin.h
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
#ifndef PLUGIN_H
#define PLUGIN_H

#include <QList>
#include <QString>
#include <QStringList>

#include <boost/shared_ptr.hpp>

#include "Expected.h"
#include "Config.h"
#include "Util.h"

namespace Plugin
{

////////////////////////////////////////////////////////////
// Interface

// Customization of one OS family. Called inside the guest change root.
struct Interface
{
	virtual ~Interface()
	{
	}

	virtual QString getName() const = 0;
	// os-release ID values handled.
	virtual QStringList getIds() const = 0;

	virtual Expected<void> updateNetworkConfig() const = 0;
	virtual Expected<void> installCloudInit(const QString &version) const = 0;
};

typedef boost::shared_ptr<Interface> handle_type;

////////////////////////////////////////////////////////////
// Packaged

// Installs cloud-init through the distribution package manager.
struct Packaged: Interface
{
	Expected<void> updateNetworkConfig() const;
	Expected<void> installCloudInit(const QString &version) const;

protected:
	Packaged(const CallAdapter &adapter, const QString &networkHelper, const QString &tool):
		m_adapter(adapter), m_networkHelper(networkHelper), m_tool(tool)
	{
	}

private:
	CallAdapter m_adapter;
	QString m_networkHelper;
	QString m_tool;
};

////////////////////////////////////////////////////////////
// Ol

struct Ol: Packaged
{
	Ol(const CallAdapter &adapter, const QString &networkHelper):
		Packaged(adapter, networkHelper, "yum")
	{
	}

	QString getName() const
	{
		return "ol";
	}

	QStringList getIds() const
	{
		return QStringList() << "ol" << "rhel" << "fedora" << "centos";
	}
};

////////////////////////////////////////////////////////////
// Ubuntu

struct Ubuntu: Packaged
{
	Ubuntu(const CallAdapter &adapter, const QString &networkHelper):
		Packaged(adapter, networkHelper, "apt")
	{
	}

	QString getName() const
	{
		return "ubuntu";
	}

	QStringList getIds() const
	{
		return QStringList() << "ubuntu" << "debian";
	}
};

////////////////////////////////////////////////////////////
// Registry

struct Registry
{
	Registry(const CallAdapter &adapter, const Config::Settings &settings);

	Expected<handle_type> select(const QString &osId) const;

	const QList<handle_type>& getPlugins() const
	{
		return m_plugins;
	}

private:
	QList<handle_type> m_plugins;
};

} // namespace Plugin

#endif // PLUGIN_H
