/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Lesser Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */
// --------------------------------------------------------------------------
/*! \file
 *  \author Pavel Vainerman
*/
// --------------------------------------------------------------------------
#include <algorithm>
#include "PassiveTimer.h"
//----------------------------------------------------------------------------------------
using namespace std::chrono;
//----------------------------------------------------------------------------------------
PassiveTimer::PassiveTimer() noexcept:
	PassiveTimer(WaitUpTime)
{
}
//------------------------------------------------------------------------------
PassiveTimer::PassiveTimer( timeout_t msec ) noexcept
{
	setTiming(msec);
}
//------------------------------------------------------------------------------
PassiveTimer::~PassiveTimer() noexcept
{
}
//------------------------------------------------------------------------------
bool PassiveTimer::checkTime() const noexcept
{
	if( t_msec == WaitUpTime )
		return false;

	return getCurrent() >= t_msec;
}
//------------------------------------------------------------------------------
timeout_t PassiveTimer::setTiming( timeout_t msec ) noexcept
{
	t_msec = std::max<timeout_t>(msec, 0);
	PassiveTimer::reset();
	return getInterval();
}
//------------------------------------------------------------------------------
void PassiveTimer::reset() noexcept
{
	t_start = steady_clock::now();
}
//------------------------------------------------------------------------------
timeout_t PassiveTimer::getCurrent() const noexcept
{
	return duration_cast<milliseconds>(steady_clock::now() - t_start).count();
}
//------------------------------------------------------------------------------
timeout_t PassiveTimer::getInterval() const noexcept
{
	return (t_msec != WaitUpTime ? t_msec : 0);
}
//------------------------------------------------------------------------------
timeout_t PassiveTimer::timeLeft() const noexcept
{
	if( t_msec == WaitUpTime )
		return WaitUpTime;

	return getLeft(t_msec);
}
//------------------------------------------------------------------------------
void PassiveTimer::terminate() noexcept
{
	t_msec = WaitUpTime;
}
//------------------------------------------------------------------------------
timeout_t StackTimer::getLeft( timeout_t timeout ) const noexcept
{
	timeout_t ct = getCurrent();
	return ( timeout <= ct ) ? 0 : timeout - ct;
}
//------------------------------------------------------------------------------
bool StackTimer::wait( timeout_t msec )
{
	return false;
}
//------------------------------------------------------------------------------
const Poco::Timespan StackTimer::millisecToPoco( const timeout_t msec ) noexcept
{
	if( msec == WaitUpTime )
		return Poco::Timespan(-1, 0);

	// Timespan counts microseconds
	return Poco::Timespan( msec * 1000 );
}
//------------------------------------------------------------------------------
