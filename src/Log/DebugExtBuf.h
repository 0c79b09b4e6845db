#ifndef DEBUGEXTBUF_H
#define DEBUGEXTBUF_H

// Created by Lars Gullik Bjønnes
// Copyright 1999 Lars Gullik Bjønnes (larsbj@lyx.org)
// Released into the public domain.

// Primarily developed for use in the LyX Project http://www.lyx.org/
// but should be adaptable to any project.

// (c) 2002 adapted for UniSet by Lav, GNU GPL license
// adapted for rtucodec, GNU LGPL license

#include <fstream>
#include <string>
#include <vector>
#include <Poco/Mutex.h>
#include "Debug.h"

/** Буфер для выключенных уровней: всё принимает и ничего не выводит */
class nullbuf : public std::streambuf
{
	protected:
		virtual std::streamsize xsputn( const char_type*, std::streamsize n ) override
		{
			return n;
		}

		virtual int_type overflow( int_type c = traits_type::eof() ) override
		{
			return traits_type::not_eof(c);
		}
};

/** Раздаёт вывод нескольким буферам (cerr, файл, строковый буфер) */
class teebuf : public std::streambuf
{
	public:
		explicit teebuf( const std::vector<std::streambuf*>& _sinks ):
			sinks(_sinks)
		{}

	protected:
		virtual int sync() override
		{
			int ret = 0;

			for( auto&& s : sinks )
			{
				if( s->pubsync() == -1 )
					ret = -1;
			}

			return ret;
		}

		virtual std::streamsize xsputn( const char_type* p, std::streamsize n ) override
		{
			for( auto&& s : sinks )
				s->sputn(p, n);

			return n;
		}

		virtual int_type overflow( int_type c = traits_type::eof() ) override
		{
			if( traits_type::eq_int_type(c, traits_type::eof()) )
				return traits_type::not_eof(c);

			for( auto&& s : sinks )
				s->sputc( traits_type::to_char_type(c) );

			return c;
		}

	private:
		std::vector<std::streambuf*> sinks;
};

/** Копит вывод и отдаёт через signal_line() каждую законченную строку ('\n' включительно).
    Один лог может быть общим для кодеков из разных потоков.
*/
class stringsigbuf : public std::streambuf
{
	public:
		typedef sigc::signal<void, const std::string&> Line_Signal;

		inline Line_Signal signal_line()
		{
			return s_line;
		}

	protected:
		virtual std::streamsize xsputn( const char_type* p, std::streamsize n ) override
		{
			std::vector<std::string> lines;
			{
				Poco::FastMutex::ScopedLock l(mut);
				line.append(p, n);
				cutLines(lines);
			}

			emitLines(lines);
			return n;
		}

		virtual int_type overflow( int_type c = traits_type::eof() ) override
		{
			if( traits_type::eq_int_type(c, traits_type::eof()) )
				return traits_type::not_eof(c);

			std::vector<std::string> lines;
			{
				Poco::FastMutex::ScopedLock l(mut);
				line.push_back( traits_type::to_char_type(c) );
				cutLines(lines);
			}

			emitLines(lines);
			return c;
		}

	private:
		// вызывается под mut
		void cutLines( std::vector<std::string>& lines )
		{
			std::string::size_type pos;

			while( (pos = line.find('\n')) != std::string::npos )
			{
				lines.emplace_back(line, 0, pos + 1);
				line.erase(0, pos + 1);
			}
		}

		// сигнал вызывается без блокировки (обработчик может сам писать в лог)
		void emitLines( const std::vector<std::string>& lines )
		{
			for( const auto& s : lines )
				s_line.emit(s);
		}

		Line_Signal s_line;
		std::string line;
		Poco::FastMutex mut;
};
//--------------------------------------------------------------------------
struct DebugStream::debugstream_internal
{
	std::filebuf fbuf;
	stringsigbuf sbuf;
};
//--------------------------------------------------------------------------
#endif
