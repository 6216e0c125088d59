///////////////////////////////////////////////////////////////////////////////
///
/// @file ImageInfo.h
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
#ifndef IMAGE_INFO_H
#define IMAGE_INFO_H

#include <QString>
#include <QByteArray>

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

#include "Expected.h"

struct CallAdapter;

namespace Image
{

////////////////////////////////////////////////////////////
// Info

struct Info
{
	Info(const QString& filename, quint64 virtualSize,
		 quint64 actualSize, const QString &format):
		m_filename(filename), m_virtualSize(virtualSize),
		m_actualSize(actualSize), m_format(format)
	{
	}

	const QString& getFilename() const
	{
		return m_filename;
	}

	quint64 getVirtualSize() const
	{
		return m_virtualSize;
	}

	quint64 getActualSize() const
	{
		return m_actualSize;
	}

	const QString& getFormat() const
	{
		return m_format;
	}

	const boost::optional<QString>& getBackingFilename() const
	{
		return m_backingFilename;
	}

	void setBackingFilename(const QString &value)
	{
		m_backingFilename = value;
	}

	// vmdk create-type, such as monolithicSparse.
	const boost::optional<QString>& getSubtype() const
	{
		return m_subtype;
	}

	void setSubtype(const QString &value)
	{
		m_subtype = value;
	}

	QString toString() const;

private:
	QString m_filename;
	quint64 m_virtualSize;
	quint64 m_actualSize;
	QString m_format;
	boost::optional<QString> m_backingFilename;
	boost::optional<QString> m_subtype;
};

////////////////////////////////////////////////////////////
// Parser

struct Parser
{
	// Output of qemu-img info --output=json for a single image.
	static Expected<Info> parse(const QByteArray &data);

private:
	static Expected<Info> parseInfo(const boost::property_tree::ptree &pt);
};

////////////////////////////////////////////////////////////
// Unit

struct Unit
{
	explicit Unit(const QString &path):
		m_path(path)
	{
	}

	Expected<Info> getInfo(const CallAdapter &adapter) const;

private:
	QString m_path;
};

} // namespace Image

#endif // IMAGE_INFO_H
