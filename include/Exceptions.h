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
 *  \brief Exceptions thrown by the obstack library
 *  \author Pavel Vainerman
*/
// --------------------------------------------------------------------------
#ifndef Exceptions_h_
#define Exceptions_h_
// ---------------------------------------------------------------------------
#include <ostream>
#include <iostream>
#include <string>
#include <exception>
// ---------------------------------------------------------------------

namespace ostack
{
	/**
	  @defgroup StackExceptions Exceptions
	  @{
	*/

	/*!
	    Base class for all obstack exceptions
	    \note every new exception must be derived from it or its descendants
	*/
	class Exception:
		public std::exception
	{
		public:

			Exception(const std::string& txt) noexcept: text(txt) {}
			Exception() noexcept: text("Exception") {}
			virtual ~Exception() noexcept(true) {}

			friend std::ostream& operator<<(std::ostream& os, const Exception& ex )
			{
				os << ex.text;
				return os;
			}

			virtual const char* what() const noexcept override
			{
				return text.c_str();
			}

		protected:
			const std::string text;
	};

	/*! Value outside of the allowed range (ports, port ranges, numbers) */
	class OutOfRange: public Exception
	{
		public:
			OutOfRange() noexcept: Exception("OutOfRange") {}
			OutOfRange(const std::string& err) noexcept: Exception(err) {}
	};

	/*! System errors (fork, exec, file system) */
	class SystemError: public Exception
	{
		public:
			SystemError() noexcept: Exception("SystemError") {}

			/*! err is added to the error message */
			SystemError(const std::string& err) noexcept: Exception(err) {}
	};

	/*! Bad or inconsistent configuration (XML file, command line) */
	class ConfigError: public Exception
	{
		public:
			ConfigError() noexcept: Exception("ConfigError") {}
			ConfigError(const std::string& err) noexcept: Exception(err) {}
	};

	/*! Unknown service, executable or dependency name */
	class NameNotFound: public Exception
	{
		public:
			NameNotFound() noexcept: Exception("NameNotFound") {}
			NameNotFound(const std::string& err) noexcept: Exception(err) {}
	};

	/*! The bootstrap was interrupted (signal or abort request) */
	class Aborted: public Exception
	{
		public:
			Aborted() noexcept: Exception("Aborted") {}
			Aborted(const std::string& err) noexcept: Exception(err) {}
	};

	//@}
	// end of StackExceptions group
	// ---------------------------------------------------------------------
}   // end of ostack namespace
// ---------------------------------------------------------------------
#endif // Exception_h_
// ---------------------------------------------------------------------
