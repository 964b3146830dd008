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
// ------------------------------------------------------------------------------------------
PassiveCondTimer::PassiveCondTimer() noexcept:
	terminated(false)
{
}
// ------------------------------------------------------------------------------------------
PassiveCondTimer::~PassiveCondTimer() noexcept
{
	terminate();
}
// ------------------------------------------------------------------------------------------
void PassiveCondTimer::terminate() noexcept
{
	{
		std::lock_guard<std::mutex> lk(mut);
		terminated = true;
	}

	cv.notify_all();
}
// ------------------------------------------------------------------------------------------
bool PassiveCondTimer::isTerminated() const noexcept
{
	return terminated;
}
// ------------------------------------------------------------------------------------------
void PassiveCondTimer::clearTerminate() noexcept
{
	std::lock_guard<std::mutex> lk(mut);
	terminated = false;
}
// ------------------------------------------------------------------------------------------
bool PassiveCondTimer::wait( timeout_t msec ) noexcept
{
	// the interval of the timer itself is not touched: several threads sleep at once
	std::unique_lock<std::mutex> lk(mut);
	auto isTerm = [this]()
	{
		return terminated.load();
	};

	if( msec == WaitUpTime )
	{
		cv.wait(lk, isTerm);
		return false;
	}

	return !cv.wait_for(lk, std::chrono::milliseconds(std::max<timeout_t>(msec, 0)), isTerm);
}
// ------------------------------------------------------------------------------------------
bool PassiveCondTimer::waitWithin( timeout_t msec, const PassiveTimer& deadline ) noexcept
{
	return wait( std::min(msec, deadline.timeLeft()) );
}
// ------------------------------------------------------------------------------------------
