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
/*! \file
 *  \brief Общие вспомогательные функции (командная строка, разбор чисел)
 *  \author Pavel Vainerman
 */
// --------------------------------------------------------------------------
#ifndef RTUCodecTypes_H_
#define RTUCodecTypes_H_
// --------------------------------------------------------------------------
#include <string>
#include <vector>
#include <ostream>
#include <ios>
// -----------------------------------------------------------------------------------------
namespace rtucodec
{
	/*! Перевод строки в число.
	 *  Понимает десятичную запись и запись с префиксом "0x".
	 *  Для пустой строки или nullptr возвращает 0.
	*/
	int rtu_atoi( const char* str ) noexcept;
	inline int rtu_atoi( const std::string& str ) noexcept
	{
		return rtu_atoi(str.c_str());
	}

	/*! Строгий разбор целого (десятичная запись или "0x").
	    \return false - пустая строка, лишние символы ("12abc", "1e3") или переполнение long.
	    При ошибке value не меняется.
	*/
	bool rtu_strtol( const std::string& str, long& value ) noexcept;

	/*! Разбивка строки по указанному символу (пустые элементы пропускаются) */
	std::vector<std::string> explode_str( const std::string& str, char sep = ',' );

	bool file_exist( const std::string& filename );

	// ---------------------------------------------------------------
	// Работа с командной строкой

	/*! Значение ключа командной строки: "--name value" -> "value".
	    Если ключ не найден (или стоит последним), возвращается defval.
	    argv[0] (имя программы) не просматривается.
	*/
	inline std::string getArgParam( const std::string& name,
									int _argc, const char* const* _argv,
									const std::string& defval = "" ) noexcept
	{
		for( int i = 1; i < (_argc - 1) ; i++ )
		{
			if( name == _argv[i] )
				return _argv[i + 1];
		}

		return defval;
	}

	/*! Позиция ключа-флага ("--mbcodec-no-debug") в argv или -1 */
	inline int findArgParam( const std::string& name, int _argc, const char* const* _argv )
	{
		for( int i = 1; i < _argc; i++ )
		{
			if( name == _argv[i] )
				return i;
		}

		return -1;
	}

	// восстанавливает флаги форматирования потока при выходе из области видимости
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
} // end of namespace rtucodec
// -----------------------------------------------------------------------------------------
#endif
