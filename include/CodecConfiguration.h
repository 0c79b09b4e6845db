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
 *  \brief Класс работы с конфигурацией (xml-файл + командная строка)
 *  \author Vitaly Lipatov, Pavel Vainerman
 */
// --------------------------------------------------------------------------
#ifndef CodecConfiguration_H_
#define CodecConfiguration_H_
// --------------------------------------------------------------------------
#include <memory>
#include <string>
#include <ostream>
#include "ConfXML.h"
#include "RTUCodecTypes.h"
#include "Debug.h"
// --------------------------------------------------------------------------
namespace rtucodec
{
	/*!
	     Конфигурация кодека.
	     Параметры берутся из xml-файла (если он задан), а параметры командной
	     строки имеют приоритет над ним.
	     \note Если файл задан, но его не удалось загрузить, вырабатывается SystemError.
	*/
	class CodecConfiguration
	{
		public:
			virtual ~CodecConfiguration();

			static std::ostream& help(std::ostream& os);

			/*! \param xmlfile - конфигурационный файл. Если пустой, работаем только с командной строкой */
			CodecConfiguration( int argc, const char* const* argv, const std::string& xmlfile = "" );

			// Получить узел (поиск по всему документу). Без xml-файла - nullptr
			xmlNode* getNode(const std::string& path) const;

			// Получить указанное свойство узла ("" для nullptr)
			std::string getProp(xmlNode*, const std::string& name) const;

			const std::string getConfFileName() const noexcept;

			/*! получить значение указанного параметра, или значение по умолчанию */
			std::string getArgParam(const std::string& name, const std::string& defval = "") const noexcept;

			/*! Числовое значение параметра (или strdefval, если параметра нет).
			    Если нет ни того, ни другого - defval.
			*/
			int getArgPInt(const std::string& name, const std::string& strdefval, int defval) const noexcept;

			/*! Настройка лога по секции <nodename levels=".." file=".."/>
			    и параметрам --nodename-add-levels, --nodename-del-levels,
			    --nodename-logfile, --nodename-no-debug.
			    \return узел с настройками или nullptr
			*/
			xmlNode* initLogStream( std::shared_ptr<DebugStream> deb, const std::string& nodename );

		protected:

			std::shared_ptr<ConfXML> cxml;

			int _argc = { 0 };
			const char* const* _argv = { nullptr };

			std::string fileConfName = { "" };
	};

	/*! Глобальный указатель на конфигурацию (singleton) */
	std::shared_ptr<CodecConfiguration> codec_conf() noexcept;

	/*! инициализация "глобальной" конфигурации (файл можно переопределить параметром --confile) */
	std::shared_ptr<CodecConfiguration> codec_init( int argc, const char* const* argv, const std::string& xmlfile = "rtucodec.xml" );
	// --------------------------------------------------------------------------
}    // end of rtucodec namespace
// --------------------------------------------------------------------------
#endif // CodecConfiguration_H_
