// Created by Lars Gullik Bjønnes
// Copyright 1999 Lars Gullik Bjønnes (larsbj@lyx.org)
// Released into the public domain.

// Primarily developed for use in the LyX Project http://www.lyx.org/
// but should be adaptable to any project.

// (c) 2002 adapted for UniSet by Lav, GNU LGPL license
// adapted for rtucodec, GNU LGPL license

#include "Debug.h"

#include <iostream>
#include <iomanip>
#include <ctime>
#include <time.h>
#include "DebugExtBuf.h"
#include "RTUCodecTypes.h"
//--------------------------------------------------------------------------
DebugStream::DebugStream( Debug::type t )
	: std::ostream(nullptr),
	  dt(Debug::type(t & Debug::ANY)), nullstream(new nullbuf), internal(new debugstream_internal)
{
	rdbuf(new teebuf({ std::cerr.rdbuf(), &internal->sbuf }));
	internal->sbuf.signal_line().connect(sigc::mem_fun(*this, &DebugStream::sbuf_overflow));
}
//--------------------------------------------------------------------------
DebugStream::~DebugStream()
{
	delete nullstream.rdbuf(0);
	delete rdbuf(0);
	delete internal;
}
//--------------------------------------------------------------------------
void DebugStream::sbuf_overflow( const std::string& s ) noexcept
{
	try
	{
		s_stream.emit(s);
	}
	catch( const std::exception& ex )
	{
		std::cerr << "(DebugStream::sbuf_overflow): " << ex.what() << std::endl;
	}
}
//--------------------------------------------------------------------------
void DebugStream::logFile( const std::string& f, bool truncate )
{
	flush();
	internal->fbuf.close();

	if( !f.empty() )
	{
		std::ios_base::openmode mode = std::ios::out;
		mode |= truncate ? std::ios::trunc : std::ios::app;

		if( !internal->fbuf.open(f.c_str(), mode) )
			std::cerr << "(DebugStream::logFile): can't open '" << f << "'" << std::endl;
	}

	std::vector<std::streambuf*> sinks = { std::cerr.rdbuf(), &internal->sbuf };

	if( internal->fbuf.is_open() )
		sinks.push_back(&internal->fbuf);

	delete rdbuf(new teebuf(sinks));
}
//--------------------------------------------------------------------------
std::ostream& DebugStream::debug( Debug::type t ) noexcept
{
	if( !(dt & t) )
		return nullstream;

	printDateTime();

	rtucodec::ios_fmt_restorer ifs(*this);
	*this << "(" << std::setfill(' ') << std::setw(6) << t << "):  ";
	return *this;
}
//--------------------------------------------------------------------------
void DebugStream::printDateTime() noexcept
{
	rtucodec::ios_fmt_restorer ifs(*this);

	timespec tv;
	clock_gettime(CLOCK_REALTIME, &tv);

	std::tm tms;
	localtime_r(&tv.tv_sec, &tms);

	*this << std::put_time(&tms, "%d/%m/%Y %H:%M:%S") << " ";
}
//--------------------------------------------------------------------------
DebugStream::StreamEvent_Signal DebugStream::signal_stream_event()
{
	return s_stream;
}
//--------------------------------------------------------------------------
