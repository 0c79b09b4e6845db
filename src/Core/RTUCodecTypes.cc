/*
 * Copyright (c) 2015 Pavel Vainerman.
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
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <cctype>
#include <fstream>
#include "RTUCodecTypes.h"
// -----------------------------------------------------------------------------
using namespace std;
// -----------------------------------------------------------------------------
int rtucodec::rtu_atoi( const char* str ) noexcept
{
	if( str == nullptr || *str == '\0' )
		return 0;

	// "0x.." - шестнадцатеричное значение (адреса и регистры часто задают так)
	if( str[0] == '0' && (str[1] == 'x' || str[1] == 'X') )
		return (int)std::strtoul(str + 2, nullptr, 16);

	return (int)std::strtoll(str, nullptr, 10);
}
// -----------------------------------------------------------------------------
bool rtucodec::rtu_strtol( const std::string& str, long& value ) noexcept
{
	const char* s = str.c_str();
	int base = 10;

	if( str.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X') )
	{
		s += 2;
		base = 16;
	}

	// strtol пропускает пробелы и принимает знак даже после "0x"
	if( !std::isxdigit((unsigned char)*s) && !(base == 10 && (*s == '-' || *s == '+')) )
		return false;

	char* end = nullptr;
	errno = 0;
	const long v = std::strtol(s, &end, base);

	if( errno == ERANGE || end == s || *end != '\0' )
		return false;

	value = v;
	return true;
}
// -----------------------------------------------------------------------------
std::vector<std::string> rtucodec::explode_str( const string& str, char sep )
{
	std::vector<std::string> v;
	string::size_type prev = 0;

	while( prev <= str.size() )
	{
		string::size_type pos = str.find(sep, prev);

		if( pos == string::npos )
			pos = str.size();

		// пустые элементы ("a,,b") пропускаем
		if( pos > prev )
			v.emplace_back( str.substr(prev, pos - prev) );

		prev = pos + 1;
	}

	return v;
}
// -----------------------------------------------------------------------------
bool rtucodec::file_exist( const std::string& filename )
{
	std::ifstream file(filename.c_str());
	return file.good();
}
// -----------------------------------------------------------------------------
