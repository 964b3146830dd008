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
 *  \brief basic helpers of the obstack library
*/
// --------------------------------------------------------------------------
#ifndef StackTypes_H_
#define StackTypes_H_
// --------------------------------------------------------------------------
#include <ctime>
#include <string>
#include <vector>
#include <ostream>
#include <chrono>
// --------------------------------------------------------------------------
namespace ostack
{
	// ---------------------------------------------------------------
	// Conversions

	//! String to number (prefix 0 is octal, 0x is hex, minus for negative numbers)
	int uni_atoi( const char* str ) noexcept;
	inline int uni_atoi( const std::string& str ) noexcept
	{
		return uni_atoi(str.c_str());
	}

	struct timespec to_timespec( const std::chrono::system_clock::duration& d ); /*!< std::chrono to posix timespec */
	struct timespec now_to_timespec(); /*!< current time */

	/*! Split string by separator (empty items are dropped) */
	std::vector<std::string> explode_str( const std::string& str, char sep = ',' );

	/*! The string consists of digits only.
	 * \warning "-10", "100.0" or "10 000" are not numbers here
	*/
	bool is_digit( const std::string& s ) noexcept;

	//! strip leading and trailing spaces and tabs
	std::string trim( const std::string& s );

	std::string toLower( const std::string& s );

	// ---------------------------------------------------------------
	// helpers

	// RAII for ostream format flags
	class ios_fmt_restorer
	{
		public:
			ios_fmt_restorer( std::ostream& s ):
				os(s), f(nullptr)
			{
				f.copyfmt(s);
			}

			~ios_fmt_restorer()
			{
				os.copyfmt(f);
			}

			ios_fmt_restorer( const ios_fmt_restorer& ) = delete;
			ios_fmt_restorer& operator=( const ios_fmt_restorer& ) = delete;

		private:
			std::ostream& os;
			std::ios f;
	};
	// -----------------------------------------------------------------------------------------
} // end of namespace ostack
// -----------------------------------------------------------------------------------------
#endif
