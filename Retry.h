///////////////////////////////////////////////////////////////////////////////
///
/// @file Retry.h
///
/// Retrying host operations.
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
#ifndef RETRY_H
#define RETRY_H

#include "Expected.h"
#include "StringTable.h"
#include "Util.h"

namespace Retry
{

////////////////////////////////////////////////////////////
// Policy

struct Policy
{
	Policy(unsigned attempts, unsigned interval):
		m_attempts(attempts > 0 ? attempts : 1), m_interval(interval)
	{
	}

	unsigned getAttempts() const
	{
		return m_attempts;
	}

	unsigned getInterval() const
	{
		return m_interval;
	}

private:
	unsigned m_attempts;
	unsigned m_interval;
};

/**
 * Invoke fn until it succeeds or attempts are over.
 * fn is a nullary functor returning Expected<T>.
 * Sleeps through adapter between attempts, not after the last one.
 */
template <typename T, typename F>
Expected<T> withRetry(const Policy &policy, const CallAdapter &adapter, F fn)
{
	Expected<T> result = fn();
	for (unsigned attempt = 1; !result.isOk(); ++attempt)
	{
		Logger::info(QString("Attempt %1 of %2 failed: %3")
				.arg(attempt).arg(policy.getAttempts()).arg(result.getMessage()));
		if (attempt >= policy.getAttempts())
		{
			return Expected<T>::fromMessage(QString(IDS_ERR_RETRIES_EXHAUSTED)
					.arg(policy.getAttempts()).arg(result.getMessage()),
					ERR_RETRIES_EXHAUSTED);
		}
		adapter.sleep(policy.getInterval());
		result = fn();
	}
	return result;
}

} // namespace Retry

#endif // RETRY_H
