/* This file is part of
* ======================================================
*
*           LyX, The Document Processor
*
*           Copyright 1999-2000 The LyX Team.
*
* ====================================================== */
// (c) 2002 adapted for UniSet by Lav, GNU LGPL license
// adapted for rtucodec, GNU LGPL license

#include <iomanip>
#include <ostream>

#include "Debug.h"
#include "RTUCodecTypes.h"
//--------------------------------------------------------------------------
Debug::type const Debug::ANY = Debug::type( Debug::INIT | Debug::WARN | Debug::LEVEL3 | Debug::LEVEL9 );
//--------------------------------------------------------------------------
namespace
{
	struct LevelTag
	{
		Debug::type level;
		const char* name;
		const char* desc;
	};

	// порядок важен: для маски из нескольких бит operator<< печатает первый включённый уровень
	const LevelTag levelTags[] =
	{
		{ Debug::NONE,   "none",   "логи выключены" },
		{ Debug::INIT,   "init",   "создание кодека по настройкам" },
		{ Debug::WARN,   "warn",   "отвергнутые запросы и ответы" },
		{ Debug::LEVEL3, "level3", "разобранные ответы" },
		{ Debug::LEVEL9, "level9", "дампы кадров" },
		{ Debug::ANY,    "any",    "все уровни" }
	};

	const LevelTag* findTag( const std::string& name ) noexcept
	{
		for( const auto& t : levelTags )
		{
			if( name == t.name )
				return &t;
		}

		return nullptr;
	}
}
//--------------------------------------------------------------------------
Debug::type Debug::value( const std::string& val )
{
	type l = Debug::NONE;

	for( const auto& tag : rtucodec::explode_str(val, ',') )
	{
		// "-level9" снимает уровень
		const bool del = ( tag[0] == '-' );
		const LevelTag* t = findTag( del ? tag.substr(1) : tag );

		if( !t )
			continue;

		if( del )
			l = Debug::type(l & ~(t->level));
		else
			l |= t->level;
	}

	return l;
}
//--------------------------------------------------------------------------
void Debug::showTags( std::ostream& os ) noexcept
{
	for( const auto& t : levelTags )
		os << std::setw(10) << t.name << "  " << t.desc << '\n';

	os.flush();
}
//--------------------------------------------------------------------------
std::ostream& operator<<( std::ostream& os, Debug::type level ) noexcept
{
	for( const auto& t : levelTags )
	{
		if( t.level == level )
			return os << t.name;
	}

	for( const auto& t : levelTags )
	{
		if( t.level & level )
			return os << t.name;
	}

	return os << "none";
}
//--------------------------------------------------------------------------
