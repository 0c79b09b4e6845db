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
 *  \brief Иерархия генерируемых библиотекой исключений
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

namespace rtucodec
{
	/**
	  @defgroup CodecExceptions Исключения
	  @{
	*/

	/*!
	    Общий предок исключений rtucodec.
	    Ошибки протокола кодек исключениями не сообщает (см. ReplyStatus),
	    исключения бросают настройка и разбор параметров.
	*/
	class Exception:
		public std::exception
	{
		public:
			Exception( const std::string& txt ) noexcept: text(txt) {}
			Exception() noexcept: text("rtucodec::Exception") {}
			virtual ~Exception() noexcept(true) {}

			friend std::ostream& operator<<( std::ostream& os, const Exception& ex )
			{
				return os << ex.text;
			}

			virtual const char* what() const noexcept override
			{
				return text.c_str();
			}

		protected:
			const std::string text;
	};

	/*! число не разобралось или не попало в допустимый диапазон (адрес узла, номер регистра) */
	class OutOfRange: public Exception
	{
		public:
			OutOfRange( const std::string& err ) noexcept: Exception(err) {}
	};

	/*! нет файла конфигурации, файл не разбирается, не задан адрес узла */
	class SystemError: public Exception
	{
		public:
			SystemError( const std::string& err ) noexcept: Exception(err) {}
	};

	//@}
	// ---------------------------------------------------------------------
}   // end of rtucodec namespace
// ---------------------------------------------------------------------
#endif // Exceptions_h_
// ---------------------------------------------------------------------
