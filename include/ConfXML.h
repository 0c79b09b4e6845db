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
 *  \author Vitaly Lipatov, PavelVainerman
 *  \brief Чтение конфигурационного XML (libxml2)
 */
// --------------------------------------------------------------------------
#ifndef ConfXML_H_
#define ConfXML_H_

#include <string>
#include <memory>
#include <libxml/parser.h>
#include <libxml/tree.h>
// --------------------------------------------------------------------------
namespace rtucodec
{
	/*! Загруженный конфигурационный файл.
	    <xi:include> подставляются при загрузке.
	*/
	class ConfXML
	{
		public:
			/*! \throw SystemError - если файл не найден или не разбирается */
			explicit ConfXML( const std::string& filename );
			~ConfXML();

			/*! корневой узел документа */
			xmlNode* getFirstNode() const noexcept;
			std::string getFileName() const noexcept;

			/*! Свойство name узла node. Для nullptr или отсутствующего свойства - "" */
			static std::string getProp( const xmlNode* node, const std::string& name );

			/*! Поиск узла по названию во всём поддереве node (в глубину).
			    Если задан name, узел должен иметь свойство name с этим значением.
			*/
			xmlNode* findNode( xmlNode* node, const std::string& searchnode, const std::string& name = "" ) const;

			ConfXML( const ConfXML& ) = delete;
			ConfXML& operator=( const ConfXML& ) = delete;

		protected:
			std::string filename;

			struct ConfXMLDocDeleter
			{
				void operator()(xmlDoc* doc) const noexcept
				{
					if( doc )
						xmlFreeDoc(doc);
				}
			};

			std::unique_ptr<xmlDoc, ConfXMLDocDeleter> doc;
	};
	// -------------------------------------------------------------------------
} // end of rtucodec namespace
// --------------------------------------------------------------------------
#endif
