// -*- C++ -*-

// Created by Lars Gullik Bjønnes
// Copyright 1999 Lars Gullik Bjønnes (larsbj@lyx.org)
// Released into the public domain.

// Primarily developed for use in the LyX Project http://www.lyx.org/
// but should be adaptable to any project.

// (c) 2002 adapted by Lav, GNU LGPL license
// Modify for obstack by pv@etersoft.ru, GNU LGPL license

#ifndef OBSTACK_DEBUGSTREAM_H
#define OBSTACK_DEBUGSTREAM_H

#include <iostream>
#include <string>
#include <sigc++/sigc++.h>
#include "Debug.h"

/** DebugStream is a ostream intended for log output.

    Output goes to cerr (unless disabled with disableOnScreen()), to the
    log file when one is set, and every completed line is emitted through
    signal_stream_event().

    Example:
    DebugStream log(Debug::value("info,warn"));
    log.setLogName("grafana");
    log.info() << "healthy on port " << port << endl;
    // dd/mm/YYYY HH:MM:SS (  info):  [grafana] healthy on port 3000

    Check the level before building expensive output:
    if( log.is_level3() )
        log.level3() << ...;
*/
class DebugStream : public std::ostream
{
	public:
		explicit DebugStream( Debug::type t = Debug::NONE );
		virtual ~DebugStream();

		typedef sigc::signal<void, const std::string&> StreamEvent_Signal;
		StreamEvent_Signal signal_stream_event();

		void level( Debug::type t ) noexcept
		{
			dt = Debug::type(t & Debug::ANY);
		}

		Debug::type level() const noexcept
		{
			return dt;
		}

		void addLevel( Debug::type t ) noexcept
		{
			dt = Debug::type(dt | t);
		}

		void delLevel( Debug::type t ) noexcept
		{
			dt = Debug::type(dt & ~t);
		}

		/*! Duplicate output to file f (appended unless truncate).
		 * An empty name closes the current file.
		 */
		void logFile( const std::string& f, bool truncate = false );

		inline std::string getLogFile() const noexcept
		{
			return fname;
		}

		inline bool isOnLogFile() const noexcept
		{
			return isWriteLogFile;
		}

		void enableOnScreen();
		void disableOnScreen();

		inline bool debugging( Debug::type t = Debug::ANY ) const noexcept
		{
			return (dt & t);
		}

		/** Returns the no-op stream if t is not part of the current level,
		    otherwise this stream with the line prefix already written.
		*/
		std::ostream& debug( Debug::type t = Debug::ANY ) noexcept;

		std::ostream& operator[]( Debug::type t ) noexcept
		{
			return debug(t);
		}

		/** Continuation of a log line (no prefix) */
		std::ostream& operator()( Debug::type t ) noexcept;

		inline void showDateTime( bool s ) noexcept
		{
			show_datetime = s;
		}

		inline void showMilliseconds( bool s ) noexcept
		{
			show_msec = s;
		}

		inline void showLogType( bool s ) noexcept
		{
			show_logtype = s;
		}

		// log.level1()  - a new line with the prefix
		// log.level1(false) - continuation, no prefix
		// if( log.is_level1() ) - check whether the level is enabled
#define DMANIP(FNAME,LEVEL) \
	inline std::ostream& FNAME( bool prefix=true ) noexcept \
	{\
		if( prefix )\
			return operator[](Debug::LEVEL); \
		return  operator()(Debug::LEVEL); \
	} \
	\
	inline bool is_##FNAME() const  noexcept\
	{ return debugging(Debug::LEVEL); }

		DMANIP(level1, LEVEL1)
		DMANIP(level2, LEVEL2)
		DMANIP(level3, LEVEL3)
		DMANIP(level4, LEVEL4)
		DMANIP(level5, LEVEL5)
		DMANIP(level6, LEVEL6)
		DMANIP(level7, LEVEL7)
		DMANIP(level8, LEVEL8)
		DMANIP(level9, LEVEL9)
		DMANIP(info, INFO)
		DMANIP(init, INIT)
		DMANIP(warn, WARN)
		DMANIP(crit, CRIT)
		DMANIP(system, SYSTEM)
		DMANIP(exception, EXCEPTION)
		DMANIP(any, ANY)
#undef DMANIP

		DebugStream( const DebugStream& ) = delete;

		/*! Copies levels, prefix settings, name and log file.
		 * Signal connections and the on-screen flag are not copied.
		 */
		const DebugStream& operator=( const DebugStream& r );

		inline void setLogName( const std::string& n ) noexcept
		{
			logname = n;
		}

		inline std::string getLogName() const noexcept
		{
			return logname;
		}

	protected:
		void printPrefix( Debug::type t );
		void rebuildOutputs();
		void sbuf_overflow( const std::string& s ) noexcept;

		Debug::type dt = { Debug::NONE };
		std::ostream nullstream;

		struct debugstream_internal;
		debugstream_internal* internal = { nullptr };

		bool show_datetime = { true };
		bool show_logtype = { true };
		bool show_msec = { false };
		std::string fname;

		StreamEvent_Signal s_stream;
		std::string logname;

		bool isWriteLogFile = { false };
		bool onScreen = { true };
};

// ------------------------------------------------------------------------------------------------
#endif
