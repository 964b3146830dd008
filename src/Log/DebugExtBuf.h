#ifndef OBSTACK_DEBUGEXTBUF_H
#define OBSTACK_DEBUGEXTBUF_H

// Created by Lars Gullik Bjønnes
// Copyright 1999 Lars Gullik Bjønnes (larsbj@lyx.org)
// Released into the public domain.

// Primarily developed for use in the LyX Project http://www.lyx.org/
// but should be adaptable to any project.

// (c) 2002 adapted by Lav, GNU GPL license
// Modify for obstack by pv@etersoft.ru, GNU LGPL license

#include <fstream>
#include <sstream>
#include <vector>
#include <mutex>
#include <sigc++/sigc++.h>
#include "Debug.h"

/** A no-op streambuffer: everything written to it is dropped. */
class nullbuf : public std::streambuf
{
	protected:
		virtual std::streamsize xsputn( char_type const*, std::streamsize n ) override
		{
			return n;
		}

		virtual int_type overflow( int_type c = traits_type::eof() ) override
		{
			return c == traits_type::eof() ? ' ' : c;
		}
};

/** Sends the output to every streambuf of the list.
    The result of the first one is returned to the stream.
*/
class fanoutbuf : public std::streambuf
{
	public:
		explicit fanoutbuf( const std::vector<std::streambuf*>& lst ): sbs(lst) {}

	protected:
		virtual int sync() override
		{
			int ret = 0;

			for( auto it = sbs.rbegin(); it != sbs.rend(); ++it )
				ret = (*it)->pubsync();

			return ret;
		}

		virtual std::streamsize xsputn( char_type const* p, std::streamsize n ) override
		{
			std::streamsize ret = n;

			for( auto it = sbs.rbegin(); it != sbs.rend(); ++it )
				ret = (*it)->sputn(p, n);

			return ret;
		}

		virtual int_type overflow( int_type c = traits_type::eof() ) override
		{
			int_type ret = c;

			for( auto it = sbs.rbegin(); it != sbs.rend(); ++it )
				ret = (*it)->sputc(c);

			return ret;
		}

	private:
		std::vector<std::streambuf*> sbs;
};

/** Collects output into lines and emits each completed line via signal. */
class stringsigbuf : public std::streambuf
{
	public:
		stringsigbuf() = default;

		typedef sigc::signal<void, const std::string&> StrBufOverflow_Signal;
		inline StrBufOverflow_Signal signal_overflow()
		{
			return s_overflow;
		}

	protected:
		virtual int sync() override
		{
			std::lock_guard<std::mutex> l(mut);
			return sb.pubsync();
		}

		virtual std::streamsize xsputn( char_type const* p, std::streamsize n ) override
		{
			std::lock_guard<std::mutex> l(mut);
			std::streamsize r = sb.sputn(p, n);

			if( n > 0 && p[n - 1] == '\n' )
				flushLine();

			return r;
		}

		virtual int_type overflow( int_type c = traits_type::eof() ) override
		{
			std::lock_guard<std::mutex> l(mut);
			int_type r = sb.sputc(c);

			if( r == '\n' )
				flushLine();

			return r;
		}

	private:
		void flushLine()
		{
			s_overflow.emit( sb.str() );
			sb.str("");
		}

		StrBufOverflow_Signal s_overflow;
		std::stringbuf sb;
		std::mutex mut;
};
//--------------------------------------------------------------------------
struct DebugStream::debugstream_internal
{
	std::filebuf fbuf;
	stringsigbuf sbuf;
};
//--------------------------------------------------------------------------
#endif
