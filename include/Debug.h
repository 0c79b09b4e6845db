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
// (c) 2002 adapted for UniSet by Lav, GNU LGPL license
// adapted for rtucodec, GNU LGPL license

#ifndef RTUCODEC_DEBUG_H
#define RTUCODEC_DEBUG_H

#include <iosfwd>
#include <string>

/** Уровни логов кодека (битовая маска).
    init   - создание кодека по настройкам
    warn   - отвергнутые запросы и ответы (с причиной)
    level3 - разобранные ответы
    level9 - дампы кадров
*/
struct Debug
{
	enum type
	{
		NONE   = 0,
		INIT   = (1 << 0),
		WARN   = (1 << 1),
		LEVEL3 = (1 << 2),
		LEVEL9 = (1 << 3)
	};

	/// все уровни
	static type const ANY;

	/** Разбор списка уровней: "warn,level9", "any,-level9".
	    Неизвестные имена пропускаются.
	*/
	static Debug::type value( const std::string& val );

	/** список уровней для --help */
	static void showTags( std::ostream& os ) noexcept;
};

inline
void operator|=( Debug::type& d1, Debug::type d2 ) noexcept
{
	d1 = static_cast<Debug::type>(d1 | d2);
}

/// имя уровня ("warn"); для ANY - "any", для смеси уровней - первый включённый
std::ostream& operator<<( std::ostream& os, Debug::type t ) noexcept;

#include "DebugStream.h"
#endif
