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
 *  \author Vitaly Lipatov
 */
// --------------------------------------------------------------------------
#include <string>
#include <libxml/xinclude.h>
#include "ConfXML.h"
#include "Exceptions.h"
// -----------------------------------------------------------------------------
using namespace std;
// -----------------------------------------------------------------------------
namespace rtucodec
{
	// -----------------------------------------------------------------------------
	ConfXML::ConfXML( const string& fname ):
		filename(fname)
	{
		xmlKeepBlanksDefault(0);
		xmlDoc* d = xmlParseFile(filename.c_str());

		if( d == NULL )
			throw SystemError("(ConfXML): not found or bad format file '" + filename + "'");

		doc.reset(d);

		if( xmlXIncludeProcess(doc.get()) < 0 )
			throw SystemError("(ConfXML): xinclude processing failed for '" + filename + "'");
	}
	// -----------------------------------------------------------------------------
	ConfXML::~ConfXML()
	{
	}
	// -----------------------------------------------------------------------------
	string ConfXML::getFileName() const noexcept
	{
		return filename;
	}
	// -----------------------------------------------------------------------------
	xmlNode* ConfXML::getFirstNode() const noexcept
	{
		return xmlDocGetRootElement(doc.get());
	}
	// -----------------------------------------------------------------------------
	string ConfXML::getProp( const xmlNode* node, const string& name )
	{
		if( node == nullptr )
			return "";

		xmlChar* text = ::xmlGetProp((xmlNode*)node, (const xmlChar*)name.c_str());

		if( text == NULL )
			return "";

		string t( (const char*)text );
		xmlFree(text);
		return t;
	}
	// -----------------------------------------------------------------------------
	xmlNode* ConfXML::findNode( xmlNode* node, const string& searchnode, const string& name ) const
	{
		for( xmlNode* fnode = node; fnode != NULL; fnode = fnode->next )
		{
			if( fnode->type == XML_ELEMENT_NODE && searchnode == (const char*)fnode->name )
			{
				if( name.empty() || name == getProp(fnode, "name") )
					return fnode;
			}

			xmlNode* nodeFound = findNode(fnode->children, searchnode, name);

			if( nodeFound != NULL )
				return nodeFound;
		}

		return NULL;
	}
	// -------------------------------------------------------------------------
} // end of rtucodec namespace
