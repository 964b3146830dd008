// Created by Lars Gullik Bjønnes
// Copyright 1999 Lars Gullik Bjønnes (larsbj@lyx.org)
// Released into the public domain.

// Primarily developed for use in the LyX Project http://www.lyx.org/
// but should be adaptable to any project.

// (c) 2002 adapted by Lav, GNU LGPL license
// Modify for obstack by pv@etersoft.ru, GNU LGPL license

#include <iomanip>
#include <ctime>
#include "Debug.h"
#include "DebugExtBuf.h"
#include "StackTypes.h"

//--------------------------------------------------------------------------
DebugStream::DebugStream( Debug::type t )
	: std::ostream(nullptr),
	  dt(t),
	  nullstream(new nullbuf),
	  internal(new debugstream_internal)
{
	internal->sbuf.signal_overflow().connect(sigc::mem_fun(*this, &DebugStream::sbuf_overflow));
	rebuildOutputs();
}
//--------------------------------------------------------------------------
DebugStream::~DebugStream()
{
	delete nullstream.rdbuf(nullptr);
	delete rdbuf(nullptr);
	delete internal;
}
//--------------------------------------------------------------------------
void DebugStream::sbuf_overflow( const std::string& s ) noexcept
{
	try
	{
		s_stream.emit(s);
	}
	catch( const std::exception& ex )
	{
		std::cerr << "(DebugStream): stream event handler failed: " << ex.what() << std::endl;
	}
}
//--------------------------------------------------------------------------
const DebugStream& DebugStream::operator=( const DebugStream& r )
{
	if( &r == this )
		return *this;

	dt = r.dt;
	show_datetime = r.show_datetime;
	show_logtype = r.show_logtype;
	show_msec = r.show_msec;
	logname = r.logname;

	if( r.isWriteLogFile )
		logFile(r.fname);

	return *this;
}
//--------------------------------------------------------------------------
void DebugStream::rebuildOutputs()
{
	std::vector<std::streambuf*> lst;

	if( onScreen )
		lst.push_back(std::cerr.rdbuf());

	if( isWriteLogFile )
		lst.push_back(&internal->fbuf);

	lst.push_back(&internal->sbuf);

	delete rdbuf(new fanoutbuf(lst));
}
//--------------------------------------------------------------------------
void DebugStream::logFile( const std::string& f, bool truncate )
{
	internal->fbuf.close();
	fname = f;
	isWriteLogFile = false;

	if( !f.empty() )
	{
		std::ios_base::openmode mode = std::ios::out;
		mode |= truncate ? std::ios::trunc : std::ios::app;

		isWriteLogFile = ( internal->fbuf.open(f, mode) != nullptr );

		if( !isWriteLogFile )
			std::cerr << "(DebugStream): can't open logfile '" << f << "'" << std::endl;
	}

	rebuildOutputs();
}
//--------------------------------------------------------------------------
void DebugStream::enableOnScreen()
{
	onScreen = true;
	rebuildOutputs();
}
//--------------------------------------------------------------------------
void DebugStream::disableOnScreen()
{
	onScreen = false;
	rebuildOutputs();
}
//--------------------------------------------------------------------------
void DebugStream::printPrefix( Debug::type t )
{
	ostack::ios_fmt_restorer ifs(*this);

	if( show_datetime )
	{
		timespec tv = ostack::now_to_timespec();
		std::tm tms;
		localtime_r(&tv.tv_sec, &tms);

		*this << std::put_time(&tms, "%d/%m/%Y %H:%M:%S");

		if( show_msec )
			*this << "." << std::setw(3) << std::setfill('0') << (tv.tv_nsec / 1000000);

		*this << " ";
	}

	if( show_logtype )
		*this << "(" << std::setfill(' ') << std::setw(6) << t << "):  ";

	if( !logname.empty() )
		*this << "[" << logname << "] ";
}
//--------------------------------------------------------------------------
std::ostream& DebugStream::debug( Debug::type t ) noexcept
{
	if( !(dt & t) )
		return nullstream;

	printPrefix(t);
	return *this;
}
//--------------------------------------------------------------------------
std::ostream& DebugStream::operator()( Debug::type t ) noexcept
{
	if( dt & t )
		return *this;

	return nullstream;
}
//--------------------------------------------------------------------------
DebugStream::StreamEvent_Signal DebugStream::signal_stream_event()
{
	return s_stream;
}
//--------------------------------------------------------------------------
