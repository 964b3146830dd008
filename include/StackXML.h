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
 *  \author Vitaly Lipatov, PavelVainerman
 *  \brief read-only access to the XML stack configuration (libxml2)
 */
// --------------------------------------------------------------------------
#ifndef StackXML_H_
#define StackXML_H_

#include <string>
#include <memory>
#include <vector>

#include <libxml/parser.h>
#include <libxml/tree.h>
// --------------------------------------------------------------------------
namespace ostack
{
	/*! Walks element nodes only (text and comments are skipped) */
	class StackXML_iterator
	{
		public:
			StackXML_iterator( xmlNode* node ) noexcept:
				curNode(node)
			{}
			StackXML_iterator() noexcept: curNode(nullptr) {}

			std::string getProp( const std::string& name ) const noexcept;
			std::string getProp2( const std::string& name, const std::string& defval = "" ) const noexcept;

			/*! Go to the next element. Returns false at the end (the iterator becomes empty) */
			bool goNext() noexcept;

			/*! Go to the first child element
			    \note on failure the iterator keeps pointing to the same node
			*/
			bool goChildren() noexcept;

			xmlNode* getCurrent() const noexcept;
			std::string getName() const noexcept;

		private:
			xmlNode* curNode;
	};
	// --------------------------------------------------------------------------
	class StackXML
	{
		public:

			typedef StackXML_iterator iterator;

			/*! \throw ConfigError if the file can't be parsed */
			explicit StackXML( const std::string& filename );
			StackXML();
			~StackXML();

			xmlNode* getFirstNode() const noexcept;

			/*! iterator to the root element */
			iterator begin() const noexcept;

			/*! load the file (XInclude is processed)
			 * \throw ConfigError
			 */
			void open( const std::string& filename );

			/*! parse a document held in memory
			 * \throw ConfigError
			 */
			void read( const std::string& xmltext );

			bool isOpen() const noexcept;
			void close();

			std::string getFileName() const noexcept;

			static std::string getProp( const xmlNode* node, const std::string& name ) noexcept;
			static std::string getProp2( const xmlNode* node, const std::string& name, const std::string& defval = "" ) noexcept;

			/*! child elements of node named tag, in document order */
			static std::vector<xmlNode*> children( const xmlNode* node, const std::string& tag );

			/*! Depth-first search from node and its following siblings.
			 * \param name - when not empty, the 'name' property must match
			 */
			xmlNode* findNode( xmlNode* node, const std::string& searchnode, const std::string& name = "" ) const;

		protected:
			std::string filename;

			struct StackXMLDocDeleter
			{
				void operator()( xmlDoc* doc ) const noexcept
				{
					if( doc )
						xmlFreeDoc(doc);
				}
			};

			std::unique_ptr<xmlDoc, StackXMLDocDeleter> doc;
	};
	// -------------------------------------------------------------------------
} // end of ostack namespace
// --------------------------------------------------------------------------
#endif
