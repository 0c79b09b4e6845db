// -*- C++ -*-

// Created by Lars Gullik BjЬnnes
// Copyright 1999 Lars Gullik BjЬnnes (larsbj@lyx.org)
// Released into the public domain.

// Primarily developed for use in the LyX Project http://www.lyx.org/
// but should be adaptable to any project.

// (c) 2002 adapted for UniSet by Lav, GNU LGPL license
// adapted for rtucodec, GNU LGPL license

#ifndef RTUCODEC_DEBUGSTREAM_H
#define RTUCODEC_DEBUGSTREAM_H

#include <iostream>
#include <string>
#include <sigc++/sigc++.h>
#include "Debug.h"

/** Поток для логов кодека (наследник std::ostream).
    Пишет в cerr и, если задан, в лог-файл. Каждая законченная строка
    дополнительно отдаётся через signal_stream_event().

    Пример:
    auto log = make_shared<DebugStream>(Debug::WARN);
    log->warn() << "bad crc" << endl;   // "dd/mm/YYYY HH:MM:SS (  warn):  bad crc"
    log->level9() << "frame" << endl;   // уровень не включён, ничего не выводится

    Перед формированием "дорогого" вывода проверяйте уровень:
    if( log->is_level9() )
        log->level9() << ...;
*/
class DebugStream : public std::ostream
{
	public:
		/// t - начальная маска уровней
		explicit DebugStream( Debug::type t = Debug::NONE );
		virtual ~DebugStream();

		typedef sigc::signal<void, const std::string&> StreamEvent_Signal;
		StreamEvent_Signal signal_stream_event();

		/// заменить маску уровней
		void level( Debug::type t ) noexcept
		{
			dt = Debug::type(t & Debug::ANY);
		}

		Debug::type level() const noexcept
		{
			return dt;
		}

		/// включить уровни t (остальные не меняются)
		void addLevel( Debug::type t ) noexcept
		{
			dt = Debug::type(dt | t);
		}

		void delLevel( Debug::type t ) noexcept
		{
			dt = Debug::type(dt & ~t);
		}

		/** Писать также в файл f (пустое имя - отключить файл).
		    Если файл не открылся, вывод идёт как раньше без файла.
		*/
		void logFile( const std::string& f, bool truncate = false );

		/// включён ли хотя бы один из уровней t
		inline bool debugging( Debug::type t = Debug::ANY ) const noexcept
		{
			return (dt & t);
		}

		/** Поток для уровня t (с датой, временем и именем уровня в начале строки).
		    Если уровень выключен, возвращается "пустой" поток.
		*/
		std::ostream& debug( Debug::type t = Debug::ANY ) noexcept;

		// log.warn() << ...; if( log.is_warn() ) ...
#define DMANIP(FNAME,LEVEL) \
	inline std::ostream& FNAME() noexcept \
	{ return debug(Debug::LEVEL); } \
	\
	inline bool is_##FNAME() const noexcept \
	{ return debugging(Debug::LEVEL); }

		DMANIP(init, INIT)
		DMANIP(warn, WARN)
		DMANIP(level3, LEVEL3)
		DMANIP(level9, LEVEL9)
		DMANIP(any, ANY)
#undef DMANIP

		inline void setLogName( const std::string& n ) noexcept
		{
			logname = n;
		}

		inline std::string getLogName() const noexcept
		{
			return logname;
		}

		DebugStream( const DebugStream& ) = delete;
		DebugStream& operator=( const DebugStream& ) = delete;

	protected:
		void sbuf_overflow( const std::string& s ) noexcept;
		void printDateTime() noexcept;

		/// маска включённых уровней
		Debug::type dt = { Debug::NONE };
		/// сюда уходит вывод выключенных уровней
		std::ostream nullstream;

		struct debugstream_internal;
		debugstream_internal* internal = { 0 };

		StreamEvent_Signal s_stream;
		std::string logname = { "" };
};

// ------------------------------------------------------------------------------------------------
#endif
