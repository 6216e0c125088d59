///////////////////////////////////////////////////////////////////////////////
///
/// @file Validator.h
///
/// Cloud import prerequisites check.
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
#ifndef VALIDATOR_H
#define VALIDATOR_H

#include <QStringList>

#include "Descriptor.h"

namespace Config
{
struct Settings;
} // namespace Config

namespace Validator
{

////////////////////////////////////////////////////////////
// Rules

struct Rules
{
	Rules(): m_maxImageSizeGb(0)
	{
	}

	explicit Rules(const Config::Settings &settings);

	QStringList m_validBootTypes;
	// Upper case os-release NAME values.
	QStringList m_validOs;
	QStringList m_validImageFormats;
	QStringList m_validVmdkTypes;
	unsigned m_maxImageSizeGb;
};

// Certify that the image can boot in the cloud.
// All checks run, each failed one adds its own reason.
Image::Verdict validate(const Image::Descriptor &descriptor, const Rules &rules);

} // namespace Validator

#endif // VALIDATOR_H
