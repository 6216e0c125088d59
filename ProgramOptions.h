///////////////////////////////////////////////////////////////////////////////
///
/// @file ProgramOptions.h
///
/// Options declaration and parser.
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
#ifndef PROGRAM_OPTIONS_H
#define PROGRAM_OPTIONS_H

#include <string>

#include <QString>

#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "Expected.h"

extern const char OPT_VERBOSE[];
extern const char OPT_HELP[];
extern const char OPT_USAGE[]; // alias
extern const char OPT_CONFIG[];
extern const char OPT_IMAGE[];

////////////////////////////////////////////////////////////
// ParsedCommand

struct ParsedCommand
{
	explicit ParsedCommand(const boost::program_options::variables_map &parsed):
		m_parsed(parsed)
	{
	}

	QString getImage() const;
	boost::optional<QString> getConfig() const;

	bool isVerbose() const
	{
		return m_parsed.count(OPT_VERBOSE);
	}

	bool isUsageIssued() const
	{
		return m_parsed.count(OPT_USAGE) || m_parsed.count(OPT_HELP);
	}

private:
	boost::program_options::variables_map m_parsed;
};

////////////////////////////////////////////////////////////
// OptionParser

struct OptionParser
{
	OptionParser();

	Expected<ParsedCommand> parseCommand(int argc, const char * const *argv);

	void printUsage() const;

private:
	boost::program_options::options_description m_generic;
};

#endif // PROGRAM_OPTIONS_H
