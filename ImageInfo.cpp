///////////////////////////////////////////////////////////////////////////////
///
/// @file ImageInfo.cpp
///
/// Image properties reported by qemu-img.
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

#include <QStringList>

#include <boost/optional.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "ImageInfo.h"
#include "Util.h"
#include "StringTable.h"

namespace pt = boost::property_tree;
using namespace Image;

////////////////////////////////////////////////////////////
// Info

QString Info::toString() const
{
	QStringList lines;
	lines << QString("filename: ") + m_filename;
	lines << QString("format: ") + m_format;
	lines << QString("virtualSize: ") + QString::number(m_virtualSize);
	lines << QString("actualSize: ") + QString::number(m_actualSize);
	if (m_backingFilename)
		lines << QString("backingFile: ") + *m_backingFilename;
	if (m_subtype)
		lines << QString("subtype: ") + *m_subtype;
	return lines.join("\n");
}

////////////////////////////////////////////////////////////
// Parser

Expected<Info> Parser::parseInfo(const pt::ptree &v)
{
	boost::optional<std::string> filename = v.get_optional<std::string>("filename");
	if (!filename)
		return Expected<Info>::fromMessage(IDS_CANNOT_PARSE_IMAGE, ERR_IMAGE_INFO);
	boost::optional<quint64> virtualSize = v.get_optional<quint64>("virtual-size");
	if (!virtualSize)
		return Expected<Info>::fromMessage(IDS_CANNOT_PARSE_IMAGE, ERR_IMAGE_INFO);
	boost::optional<std::string> format = v.get_optional<std::string>("format");
	if (!format)
		return Expected<Info>::fromMessage(IDS_CANNOT_PARSE_IMAGE, ERR_IMAGE_INFO);
	// Absent for images on some remote protocols.
	quint64 actualSize = v.get<quint64>("actual-size", 0);

	Info info(QString::fromStdString(*filename), *virtualSize,
			  actualSize, QString::fromStdString(*format));

	boost::optional<std::string> backing = v.get_optional<std::string>("full-backing-filename");
	if (!backing)
		backing = v.get_optional<std::string>("backing-filename");
	if (backing)
		info.setBackingFilename(QString::fromStdString(*backing));

	boost::optional<std::string> subtype = v.get_optional<std::string>("format-specific.data.create-type");
	if (subtype)
		info.setSubtype(QString::fromStdString(*subtype));
	return info;
}

Expected<Info> Parser::parse(const QByteArray &data)
{
	pt::ptree pt;
	std::istringstream stream(std::string(data.constData(), data.size()));
	try
	{
		read_json(stream, pt);
		return parseInfo(pt);
	}
	catch (pt::ptree_error &e)
	{
		return Expected<Info>::fromMessage(QString::fromStdString(e.what()), ERR_IMAGE_INFO);
	}
}

////////////////////////////////////////////////////////////
// Unit

Expected<Info> Unit::getInfo(const CallAdapter &adapter) const
{
	QStringList args;
	args << "info" << "--output=json" << m_path;
	Expected<QByteArray> out = adapter.execute(QEMU_IMG, args);
	if (!out.isOk())
		return out;

	Expected<Info> info = Parser::parse(out.get());
	if (info.isOk())
		Logger::info(info.get().toString());
	return info;
}
