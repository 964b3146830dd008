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
// -----------------------------------------------------------------------------
#include <cstdlib>
#include <cctype>
#include <algorithm>
#include "StackTypes.h"
// -----------------------------------------------------------------------------
using namespace std;
// -----------------------------------------------------------------------------
int ostack::uni_atoi( const char* str ) noexcept
{
	if( str == nullptr )
		return 0;

	// strtol is used so that 0x.. and 0.. prefixes work,
	// then the value is cut to int
	unsigned long long n = std::strtoll(str, nullptr, 0);
	return static_cast<int>(n);
}
// -------------------------------------------------------------------------
struct timespec ostack::to_timespec( const std::chrono::system_clock::duration& d )
{
	struct timespec ts;

	auto sec = std::chrono::duration_cast<std::chrono::seconds>(d);
	ts.tv_sec = sec.count();
	ts.tv_nsec = std::chrono::duration_cast<std::chrono::nanoseconds>(d - sec).count();
	return ts;
}
// -------------------------------------------------------------------------
struct timespec ostack::now_to_timespec()
{
	auto d = std::chrono::system_clock::now().time_since_epoch();
	return to_timespec(d);
}
// -------------------------------------------------------------------------
std::vector<std::string> ostack::explode_str( const std::string& str, char sep )
{
	std::vector<std::string> v;

	string::size_type prev = 0;
	string::size_type pos = 0;
	string::size_type sz = str.size();

	do
	{
		if( prev >= sz )
			break;

		pos = str.find(sep, prev);

		if( pos == string::npos )
		{
			string s(str.substr(prev, sz - prev));

			if( !s.empty() )
				v.emplace_back( std::move(s) );

			break;
		}

		if( pos > prev )
		{
			string s(str.substr(prev, pos - prev));

			if( !s.empty() )
				v.emplace_back( std::move(s) );
		}

		prev = pos + 1;
	}
	while( pos != string::npos );

	return v;
}
// -------------------------------------------------------------------------
bool ostack::is_digit( const std::string& s ) noexcept
{
	if( s.empty() )
		return false;

	for( const auto& c : s )
	{
		if( !isdigit(static_cast<unsigned char>(c)) )
			return false;
	}

	return true;
}
// -------------------------------------------------------------------------
std::string ostack::trim( const std::string& s )
{
	auto b = s.find_first_not_of(" \t\r\n");

	if( b == std::string::npos )
		return "";

	auto e = s.find_last_not_of(" \t\r\n");
	return s.substr(b, e - b + 1);
}
// -------------------------------------------------------------------------
std::string ostack::toLower( const std::string& s )
{
	std::string r(s);
	std::transform(r.begin(), r.end(), r.begin(), [](unsigned char c)
	{
		return std::tolower(c);
	});

	return r;
}
// -------------------------------------------------------------------------
