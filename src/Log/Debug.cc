/* This file is part of
* ======================================================
*
*           LyX, The Document Processor
*
*           Copyright 1999-2000 The LyX Team.
*
* ====================================================== */
// (c) 2002 adapted by Lav, GNU LGPL license
// Modify for obstack by pv@etersoft.ru, GNU LGPL license

#include <array>
#include <sstream>
#include "Debug.h"
#include "StackTypes.h"

namespace
{
	struct LevelName
	{
		Debug::type level;
		const char* name;
	};

	// order matters for operator<<: the first matching name is printed
	const std::array<LevelName, 15> levelNames =
	{
		{
			{ Debug::INFO,      "info" },
			{ Debug::INIT,      "init" },
			{ Debug::WARN,      "warn" },
			{ Debug::CRIT,      "crit" },
			{ Debug::LEVEL1,    "level1" },
			{ Debug::LEVEL2,    "level2" },
			{ Debug::LEVEL3,    "level3" },
			{ Debug::LEVEL4,    "level4" },
			{ Debug::LEVEL5,    "level5" },
			{ Debug::LEVEL6,    "level6" },
			{ Debug::LEVEL7,    "level7" },
			{ Debug::LEVEL8,    "level8" },
			{ Debug::LEVEL9,    "level9" },
			{ Debug::SYSTEM,    "system" },
			{ Debug::EXCEPTION, "exception" }
		}
	};

	Debug::type levelByName( const std::string& name )
	{
		if( name == "any" )
			return Debug::ANY;

		for( const auto& l : levelNames )
		{
			if( name == l.name )
				return l.level;
		}

		return Debug::NONE;
	}
}

Debug::type const Debug::ANY = Debug::type(
								   Debug::INFO | Debug::INIT | Debug::WARN | Debug::CRIT |
								   Debug::LEVEL1 | Debug::LEVEL2 | Debug::LEVEL3 | Debug::LEVEL4 |
								   Debug::LEVEL5 | Debug::LEVEL6 | Debug::LEVEL7 | Debug::LEVEL8 |
								   Debug::LEVEL9 | Debug::SYSTEM | Debug::EXCEPTION );

Debug::type Debug::value( const std::string& val )
{
	Debug::type l = Debug::NONE;

	for( auto item : ostack::explode_str(ostack::toLower(val), ',') )
	{
		item = ostack::trim(item);

		if( item.empty() )
			continue;

		if( item[0] == '-' )
			l = Debug::type(l & ~levelByName(item.substr(1)));
		else
			l |= levelByName(item);
	}

	return l;
}

std::ostream& operator<<(std::ostream& os, Debug::type level ) noexcept
{
	for( const auto& l : levelNames )
	{
		if( l.level & level )
			return os << l.name;
	}

	return os << "???Debuglevel";
}

std::string Debug::str( Debug::type level ) noexcept
{
	if( level == Debug::NONE )
		return "NONE";

	if( level == Debug::ANY )
		return "ANY";

	std::ostringstream s;

	for( const auto& l : levelNames )
	{
		if( !(l.level & level) )
			continue;

		if( s.tellp() > 0 )
			s << ",";

		s << l.name;
	}

	return s.str();
}
