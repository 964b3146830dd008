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
 *  \author Vitaly Lipatov, Pavel Vainerman
*/
//----------------------------------------------------------------------------
# ifndef PASSIVETIMER_H_
# define PASSIVETIMER_H_
//----------------------------------------------------------------------------
#include <condition_variable>
#include <mutex>
#include <atomic>
#include <chrono>
#include <limits>
#include <Poco/Timespan.h>
//----------------------------------------------------------------------------------------
typedef Poco::Timespan::TimeDiff timeout_t;
//----------------------------------------------------------------------------------------
/*! \class StackTimer
 * \brief Base interface of passive timers
*/
class StackTimer
{
	public:
		virtual ~StackTimer() {};

		virtual bool checkTime() const noexcept = 0;					/*!< has the time come */
		virtual timeout_t setTiming( timeout_t msec ) noexcept = 0;	/*!< set and start the timer */
		virtual void reset() noexcept = 0;							/*!< restart the timer */

		virtual timeout_t getCurrent() const noexcept = 0;  /*!< msec since the start */
		virtual timeout_t getInterval() const noexcept = 0; /*!< interval, msec */

		/*! what is left of timeout after getCurrent() (0 when passed) */
		timeout_t getLeft( timeout_t timeout ) const noexcept;

		// not every timer can sleep
		virtual bool wait( timeout_t msec );
		virtual void terminate() {}

		/*! Never fires: wait until terminate() */
		static const timeout_t WaitUpTime = std::numeric_limits<timeout_t>::max();

		/*! msec to Poco::Timespan for socket and session timeouts.
		 * WaitUpTime gives a negative span (no timeout).
		 */
		static const Poco::Timespan millisecToPoco( const timeout_t msec ) noexcept;
};
//----------------------------------------------------------------------------------------
/*! \class PassiveTimer
 * \brief Deadline polled with checkTime()
 * \par
 * The probe window, the dependency wait and the settle delay are PassiveTimers.
 * \note WaitUpTime never fires, 0 fires at once
*/
class PassiveTimer:
	public StackTimer
{
	public:
		PassiveTimer() noexcept;
		explicit PassiveTimer( timeout_t msec ) noexcept;
		virtual ~PassiveTimer() noexcept;

		virtual bool checkTime() const noexcept override;
		virtual timeout_t setTiming( timeout_t msec ) noexcept override;
		virtual void reset() noexcept override;

		virtual timeout_t getCurrent() const noexcept override;

		/*! \return msec or 0 for WaitUpTime */
		virtual timeout_t getInterval() const noexcept override;

		/*! what is left of our own interval (WaitUpTime for an endless timer) */
		timeout_t timeLeft() const noexcept;

		/*! the timer never fires after this */
		virtual void terminate() noexcept override;

	protected:
		timeout_t t_msec = { 0 };
		std::chrono::steady_clock::time_point t_start;
};

//----------------------------------------------------------------------------------------
/*! \class PassiveCondTimer
 * \brief Interruptible sleep, shared by every supervisor as the abort flag
 * \par
 * Any number of threads can sleep in wait() at the same time.
 * terminate() wakes all of them and is sticky: every later wait()
 * returns false at once until clearTerminate() is called.
*/
class PassiveCondTimer:
	public PassiveTimer
{
	public:

		PassiveCondTimer() noexcept;
		virtual ~PassiveCondTimer() noexcept;

		/*! \return true if the time has passed, false if terminated */
		virtual bool wait( timeout_t msec ) noexcept override;

		/*! sleep msec but not past the deadline
		 * \return false if terminated
		 */
		bool waitWithin( timeout_t msec, const PassiveTimer& deadline ) noexcept;

		virtual void terminate() noexcept override;

		bool isTerminated() const noexcept;
		void clearTerminate() noexcept;

	private:
		std::atomic_bool terminated;
		std::mutex mut;
		std::condition_variable cv;
};
//----------------------------------------------------------------------------------------
# endif //PASSIVETIMER_H_
