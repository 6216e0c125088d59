///////////////////////////////////////////////////////////////////////////////
///
/// @file ProgramOptions.cpp
///
/// Option parser implementation.
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
#include <sstream>

#include "ProgramOptions.h"
#include "StringTable.h"
#include "Util.h"

namespace po = boost::program_options;

extern const char OPT_VERBOSE[] = "verbose";
extern const char OPT_HELP[] = "help";
extern const char OPT_USAGE[] = "usage";
extern const char OPT_CONFIG[] = "config";
extern const char OPT_IMAGE[] = "image";

////////////////////////////////////////////////////////////
// ParsedCommand

QString ParsedCommand::getImage() const
{
	if (!m_parsed.count(OPT_IMAGE))
		return QString();
	return QString::fromStdString(m_parsed[OPT_IMAGE].as<std::string>());
}

boost::optional<QString> ParsedCommand::getConfig() const
{
	if (!m_parsed.count(OPT_CONFIG))
		return boost::none;
	return QString::fromStdString(m_parsed[OPT_CONFIG].as<std::string>());
}

////////////////////////////////////////////////////////////
// OptionParser

OptionParser::OptionParser(): m_generic("Options")
{
	m_generic.add_options()
		("help,h", "Produce help message")
		("usage", "Produce help message")
		("verbose,v", "Enable information messages")
		("config,c", po::value<std::string>(), "JSON file overriding built-in settings")
		;
}

Expected<ParsedCommand> OptionParser::parseCommand(int argc, const char * const *argv)
{
	po::options_description all;
	all.add(m_generic);
	all.add_options()
		("image", po::value<std::string>(), "Disk image to prepare")
		;

	po::positional_options_description p;
	p.add(OPT_IMAGE, 1);

	po::variables_map vm;
	try
	{
		po::store(po::command_line_parser(argc, argv)
				.options(all)
				.positional(p)
				.run(), vm);
	}
	catch (po::error &e)
	{
		return Expected<ParsedCommand>::fromMessage(
				QString("%1: %2").arg(IDS_ERR_INVALID_ARGS, e.what()), ERR_INVALID_ARGS);
	}

	ParsedCommand command(vm);
	if (!command.isUsageIssued() && command.getImage().isEmpty())
	{
		return Expected<ParsedCommand>::fromMessage(
				QString("%1: no image specified").arg(IDS_ERR_INVALID_ARGS), ERR_INVALID_ARGS);
	}
	return command;
}

void OptionParser::printUsage() const
{
	po::options_description usage(
			"Usage:\n\tvdisk_migrate [-v] [-c <config.json>] <image>\n\n"
			"Attach a disk image, prepare the guest for cloud import\n"
			"and check that it meets the import prerequisites");
	usage.add(m_generic);

	std::stringstream ss;
	ss << usage << std::endl;
	Logger::print(QString::fromStdString(ss.str()));
}
