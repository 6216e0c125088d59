///////////////////////////////////////////////////////////////////////////////
///
/// @file main.cpp
///
/// vdisk_migrate entry point and initialization
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

#include <QFileInfo>
#include <QString>

#include <boost/shared_ptr.hpp>

#include "Abort.h"
#include "Config.h"
#include "DiskLock.h"
#include "Migration.h"
#include "ProgramOptions.h"
#include "StringTable.h"
#include "Util.h"

namespace
{

Expected<Config::Settings> getSettings(const ParsedCommand &command)
{
	boost::optional<QString> path = command.getConfig();
	Expected<Config::Settings> settings = path ? Config::Loader::load(*path)
			: Expected<Config::Settings>(Config::Settings());
	if (settings.isOk())
		settings.get().m_verbose = command.isVerbose();
	return settings;
}

} // namespace

int main(int argc, char *argv[])
{
	OptionParser parser;

	Expected<ParsedCommand> parsed = parser.parseCommand(argc, argv);
	if (!parsed.isOk())
	{
		Logger::error(parsed.getMessage());
		parser.printUsage();
		return parsed.getCode();
	}

	const ParsedCommand &command = parsed.get();
	Logger::init(command.isVerbose());
	if (command.isUsageIssued())
	{
		parser.printUsage();
		return 0;
	}

	Expected<Config::Settings> settings = getSettings(command);
	if (!settings.isOk())
	{
		Logger::error(settings.getMessage());
		return settings.getCode();
	}

	QString image = command.getImage();
	if (!QFileInfo(image).exists())
	{
		Logger::error(QString(IDS_ERR_HDD_NOT_EXISTS).arg(image));
		return ERR_INVALID_ARGS;
	}

	Expected<DiskLockGuard::handle_type> lock = DiskLockGuard::openExclusive(image);
	if (!lock.isOk())
	{
		Logger::error(lock.getMessage());
		return lock.getCode();
	}

	Abort::token_type token(new Abort::Token());
	Abort::Watcher watcher(token);
	watcher.start();

	CallAdapter adapter(boost::shared_ptr<Call>(new Call()));
	Migration::Orchestrator orchestrator(adapter, settings.get(), token);
	Expected<Image::Descriptor> result = orchestrator.run(image);
	watcher.stop();

	if (!result.isOk())
	{
		Logger::error(result.getMessage());
		return result.getCode();
	}

	const Image::Descriptor &descriptor = result.get();
	Logger::print(descriptor.toString());
	if (!descriptor.m_verdict || !descriptor.m_verdict->m_pass)
		return ERR_VALIDATION_FAILED;
	return 0;
}
