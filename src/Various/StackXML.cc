/*
 * Copyright (c) 2026 Pavel Vainerman.
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
#include <libxml/xinclude.h>
#include "StackXML.h"
#include "Exceptions.h"
// -----------------------------------------------------------------------------
using namespace std;
using namespace ostack;
// -----------------------------------------------------------------------------
StackXML::StackXML( const string& fname )
{
	open(fname);
}
// -----------------------------------------------------------------------------
StackXML::StackXML()
{
}
// -----------------------------------------------------------------------------
StackXML::~StackXML()
{
	close();
}
// -----------------------------------------------------------------------------
string StackXML::getFileName() const noexcept
{
	return filename;
}
// -----------------------------------------------------------------------------
xmlNode* StackXML::getFirstNode() const noexcept
{
	return doc ? xmlDocGetRootElement(doc.get()) : nullptr;
}
// -----------------------------------------------------------------------------
StackXML::iterator StackXML::begin() const noexcept
{
	return iterator(getFirstNode());
}
// -----------------------------------------------------------------------------
void StackXML::open( const string& _filename )
{
	close();

	xmlKeepBlanksDefault(0);
	xmlDoc* d = xmlParseFile(_filename.c_str());

	if( !d )
		throw ConfigError("StackXML(open): can't parse file '" + _filename + "'");

	doc.reset(d);

	// stacks may be split over several files:
	// <obstack xmlns:xi="http://www.w3.org/2001/XInclude"> ... <xi:include href="dev.xml"/>
	if( xmlXIncludeProcess(doc.get()) < 0 )
	{
		close();
		throw ConfigError("StackXML(open): XInclude processing failed for '" + _filename + "'");
	}

	filename = _filename;
}
// -----------------------------------------------------------------------------
void StackXML::read( const std::string& xmltext )
{
	close();

	xmlKeepBlanksDefault(0);
	xmlDoc* d = xmlReadMemory(xmltext.data(), (int)xmltext.size(), "obstack.xml", nullptr, 0);

	if( !d )
		throw ConfigError("StackXML(read): can't parse xml text");

	doc.reset(d);
}
// -----------------------------------------------------------------------------
void StackXML::close()
{
	doc.reset();
	filename.clear();
}
// -----------------------------------------------------------------------------
bool StackXML::isOpen() const noexcept
{
	return (doc != nullptr);
}
// -----------------------------------------------------------------------------
string StackXML::getProp( const xmlNode* node, const string& name ) noexcept
{
	if( !node )
		return "";

	xmlChar* text = ::xmlGetProp(node, (const xmlChar*)name.c_str());

	if( !text )
		return "";

	const string t( (const char*)text );
	xmlFree(text);
	return t;
}
// -----------------------------------------------------------------------------
string StackXML::getProp2( const xmlNode* node, const string& name, const string& defval ) noexcept
{
	const string s(getProp(node, name));
	return s.empty() ? defval : s;
}
// -----------------------------------------------------------------------------
std::vector<xmlNode*> StackXML::children( const xmlNode* node, const std::string& tag )
{
	std::vector<xmlNode*> lst;

	if( !node )
		return lst;

	for( xmlNode* n = node->children; n; n = n->next )
	{
		if( n->type == XML_ELEMENT_NODE && tag == (const char*)n->name )
			lst.push_back(n);
	}

	return lst;
}
// -----------------------------------------------------------------------------
xmlNode* StackXML::findNode( xmlNode* node, const string& searchnode, const string& name ) const
{
	for( xmlNode* fnode = node; fnode; fnode = fnode->next )
	{
		if( fnode->type == XML_ELEMENT_NODE && searchnode == (const char*)fnode->name )
		{
			if( name.empty() || name == getProp(fnode, "name") )
				return fnode;
		}

		xmlNode* found = findNode(fnode->children, searchnode, name);

		if( found )
			return found;
	}

	return nullptr;
}
// -----------------------------------------------------------------------------
bool StackXML_iterator::goNext() noexcept
{
	if( !curNode )
		return false;

	do
	{
		curNode = curNode->next;
	}
	while( curNode && curNode->type != XML_ELEMENT_NODE );

	return (curNode != nullptr);
}
// -------------------------------------------------------------------------
bool StackXML_iterator::goChildren() noexcept
{
	if( !curNode )
		return false;

	for( xmlNode* n = curNode->children; n; n = n->next )
	{
		if( n->type == XML_ELEMENT_NODE )
		{
			curNode = n;
			return true;
		}
	}

	return false;
}
// -------------------------------------------------------------------------
xmlNode* StackXML_iterator::getCurrent() const noexcept
{
	return curNode;
}
// -------------------------------------------------------------------------
string StackXML_iterator::getName() const noexcept
{
	if( !curNode || !curNode->name )
		return "";

	return (const char*)curNode->name;
}
// -------------------------------------------------------------------------
string StackXML_iterator::getProp( const string& name ) const noexcept
{
	return StackXML::getProp(curNode, name);
}
// -------------------------------------------------------------------------
string StackXML_iterator::getProp2( const string& name, const string& defval ) const noexcept
{
	return StackXML::getProp2(curNode, name, defval);
}
// -------------------------------------------------------------------------
