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
 *  \author Vitaly Lipatov, Pavel Vainerman
 */
// --------------------------------------------------------------------------
#include <string>
#include <sstream>
#include <iomanip>
#include <iostream>
#include "CodecConfiguration.h"
#include "Exceptions.h"
// -------------------------------------------------------------------------
using namespace std;
// -------------------------------------------------------------------------
namespace rtucodec
{
	// -------------------------------------------------------------------------
	static ostream& print_help( ostream& os, int width, const string& cmd,
								const string& help, const string& tab = "" )
	{
		// чтобы не менять параметры основного потока
		// создаём свой stream...
		ostringstream info;
		info.setf(ios::left, ios::adjustfield);
		info << tab << setw(width) << cmd << " - " << help;
		return os << info.str();
	}
	// -------------------------------------------------------------------------
	ostream& CodecConfiguration::help(ostream& os)
	{
		os << "\n Configure command: " << endl;
		print_help(os, 25, "--confile", "полный путь до файла конфигурации\n");
		os << "\n Debug command:\n";
		print_help(os, 25, "  [debname]", "имя DebugStream указанное в конфигурационном файле\n");
		print_help(os, 25, "--[debname]-no-debug", "отключение логов\n");
		print_help(os, 25, "--[debname]-logfile", "перенаправление лога в файл\n");
		print_help(os, 25, "--[debname]-add-levels", "добавить уровень вывода логов\n");
		print_help(os, 25, "--[debname]-del-levels", "удалить уровень вывода логов\n");

		os << "\n Debug levels:\n";
		Debug::showTags(os);

		return os << "\nПример использования:\t mbrtu-codec "
			   << "--mbcodec-add-levels warn,level9 --mbcodec-logfile codec.log\n\n";
	}
	// -------------------------------------------------------------------------
	static std::shared_ptr<CodecConfiguration> cconf;
	// -------------------------------------------------------------------------
	std::shared_ptr<CodecConfiguration> codec_conf() noexcept
	{
		return cconf; // см. codec_init..
	}
	// -------------------------------------------------------------------------
	CodecConfiguration::CodecConfiguration( int argc, const char* const* argv, const string& xmlfile ):
		_argc(argc),
		_argv(argv),
		fileConfName(xmlfile)
	{
		if( fileConfName.empty() )
			return;

		if( !file_exist(fileConfName) )
			throw SystemError("(CodecConfiguration): not found configure file '" + fileConfName + "'");

		cxml = make_shared<ConfXML>(fileConfName);
	}
	// -------------------------------------------------------------------------
	CodecConfiguration::~CodecConfiguration()
	{
	}
	// -------------------------------------------------------------------------
	string CodecConfiguration::getArgParam( const string& name, const string& defval ) const noexcept
	{
		return rtucodec::getArgParam(name, _argc, _argv, defval);
	}
	// -------------------------------------------------------------------------
	int CodecConfiguration::getArgPInt( const string& name, const string& strdefval, int defval ) const noexcept
	{
		string param = getArgParam(name, strdefval);

		if( param.empty() && strdefval.empty() )
			return defval;

		return rtu_atoi(param);
	}
	// -------------------------------------------------------------------------
	xmlNode* CodecConfiguration::getNode( const string& path ) const
	{
		if( !cxml )
			return nullptr;

		return cxml->findNode(cxml->getFirstNode(), path);
	}
	// -------------------------------------------------------------------------
	string CodecConfiguration::getProp( xmlNode* node, const string& name ) const
	{
		return ConfXML::getProp(node, name);
	}
	// -------------------------------------------------------------------------
	const string CodecConfiguration::getConfFileName() const noexcept
	{
		return fileConfName;
	}
	// -------------------------------------------------------------------------
	xmlNode* CodecConfiguration::initLogStream( std::shared_ptr<DebugStream> deb, const string& _debname )
	{
		if( !deb )
			return nullptr;

		if( _debname.empty() )
		{
			deb->any() << "(CodecConfiguration)(initLogStream): INIT DEBUG FAILED!!!" << endl;
			return nullptr;
		}

		string debname(_debname);

		xmlNode* dnode = getNode(_debname);

		if( dnode && deb->getLogName().empty() )
		{
			if( !getProp(dnode, "name").empty() )
				debname = getProp(dnode, "name");

			deb->setLogName(debname);
		}

		string no_deb("--" + debname + "-no-debug");

		if( findArgParam(no_deb, _argc, _argv) != -1 )
		{
			deb->level(Debug::NONE);
			return dnode;
		}

		string debug_file("");

		// смотрим настройки файла
		if( dnode )
		{
			string conf_debug_levels(getProp(dnode, "levels"));

			if( !conf_debug_levels.empty() )
				deb->addLevel( Debug::value(conf_debug_levels) );

			debug_file = getProp(dnode, "file");
		}

		// теперь смотрим командную строку
		string logfile("--" + debname + "-logfile");
		string add_level("--" + debname + "-add-levels");
		string del_level("--" + debname + "-del-levels");

		for( int i = 1; i < (_argc - 1); i++ )
		{
			if( logfile == _argv[i] )        // "--debug-logfile"
			{
				debug_file = string(_argv[i + 1]);
			}
			else if( add_level == _argv[i] )    // "--debug-add-levels"
			{
				deb->addLevel(Debug::value(_argv[i + 1]));
			}
			else if( del_level == _argv[i] )    // "--debug-del-levels"
			{
				deb->delLevel(Debug::value(_argv[i + 1]));
			}
		}

		if( !debug_file.empty() )
			deb->logFile(debug_file);

		return dnode;
	}
	// -------------------------------------------------------------------------
	std::shared_ptr<CodecConfiguration> codec_init( int argc, const char* const* argv, const std::string& xmlfile )
	{
		if( cconf )
		{
			cerr << "Reusable call codec_init... ignore.." << endl;
			return cconf;
		}

		string confile = rtucodec::getArgParam( "--confile", argc, argv, xmlfile );
		cconf = make_shared<CodecConfiguration>(argc, argv, confile);
		return cconf;
	}
	// -------------------------------------------------------------------------
} // end of rtucodec namespace
