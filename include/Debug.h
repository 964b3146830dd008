// -*- C++ -*-
/* This file is part of
 * ======================================================
 *
 *           LyX, The Document Processor
 *
 *           Copyright 1995 Matthias Ettrich
 *           Copyright 1995-2000 The LyX Team.
 *
 * ====================================================== */
// (c) 2002 adapted by Lav, GNU LGPL license
// Modify for obstack by pv@etersoft.ru, GNU LGPL license

#ifndef OBSTACK_DEBUG_H
#define OBSTACK_DEBUG_H

#include <iosfwd>
#include <string>

/** Log levels, used as a bitmask by DebugStream.

    How obstack-bootstrap uses them:
    info   - service phases and the final state of every service
    warn   - abandoned ports, optional upstreams left out
    crit   - required failures, unexpected exceptions in a supervisor
    level2 - every state transition of a supervisor
    level3 - busy ports, dependency waits, resolved executables, successful probes
    level4 - failed or throwing probes, HTTP status codes, missing executable candidates
    level5 - unreachable endpoints, unreadable /proc tables, failed owner lookups, waitpid errors
    level9 - /proc/<pid>/fd scanning details, truncated comm names
*/
struct Debug
{
	enum type
	{
		NONE      = 0,
		INFO      = (1 << 0),
		INIT      = (1 << 1),
		WARN      = (1 << 2),
		CRIT      = (1 << 3),
		LEVEL1    = (1 << 4),
		LEVEL2    = (1 << 5),
		LEVEL3    = (1 << 6),
		LEVEL4    = (1 << 7),
		LEVEL5    = (1 << 8),
		LEVEL6    = (1 << 9),
		LEVEL7    = (1 << 10),
		LEVEL8    = (1 << 11),
		LEVEL9    = (1 << 12),
		SYSTEM    = (1 << 13),
		EXCEPTION = (1 << 14)
	};

	static type const ANY;

	/** Convert a comma separated list of level names to a mask.
	    example: "info,warn,level3" or "any,-level9" ('-' removes a level).
	    Names are case insensitive, unknown names are ignored.
	*/
	static Debug::type value( const std::string& val );

	/** Comma separated level names of the mask ("NONE" and "ANY" for the edge cases) */
	static std::string str( Debug::type level ) noexcept;

	friend std::ostream& operator<<(std::ostream& os, Debug::type level ) noexcept;
};

inline
void operator|=(Debug::type& d1, Debug::type d2) noexcept
{
	d1 = static_cast<Debug::type>(d1 | d2);
}

std::ostream& operator<<(std::ostream& o, Debug::type t) noexcept;

#include "DebugStream.h"
#endif
