#include <catch.hpp>
// -----------------------------------------------------------------------------
#include "Exceptions.h"
#include "ConfXML.h"
// -----------------------------------------------------------------------------
using namespace std;
using namespace rtucodec;
// -----------------------------------------------------------------------------
TEST_CASE("ConfXML", "[confxml][basic]" )
{
    SECTION( "Bad file" )
    {
        REQUIRE_THROWS_AS( ConfXML("unknown.xml"), rtucodec::SystemError );
        REQUIRE_THROWS_AS( ConfXML("tests_confxml_badfile.xml"), rtucodec::SystemError );
    }

    SECTION( "Correct file" )
    {
        ConfXML xml("tests_with_conf.xml");
        CHECK( xml.getFileName() == "tests_with_conf.xml" );

        xmlNode* root = xml.getFirstNode();
        REQUIRE( root != nullptr );
        CHECK( string((const char*)root->name) == "RTUCodec" );

        // сам корень тоже участвует в поиске
        CHECK( xml.findNode(root, "RTUCodec") == root );
        // поиск "вглубь"
        CHECK( xml.findNode(root, "MBCodec1") != nullptr );
        CHECK( xml.findNode(root, "subnode") != nullptr );
        CHECK( xml.findNode(root, "NotFound") == nullptr );
        CHECK( xml.findNode(nullptr, "RTUCodec") == nullptr );
    }

    SECTION( "getProp" )
    {
        ConfXML xml("tests_with_conf.xml");
        xmlNode* cnode = xml.findNode(xml.getFirstNode(), "MBCodec2");
        REQUIRE( cnode != nullptr );

        CHECK( ConfXML::getProp(cnode, "addr") == "1" );
        CHECK( ConfXML::getProp(cnode, "permissiveCount") == "1" );
        CHECK( ConfXML::getProp(cnode, "unknown") == "" );
        CHECK( ConfXML::getProp(nullptr, "addr") == "" );

        xmlNode* tnode = xml.findNode(xml.getFirstNode(), "testnode");
        REQUIRE( tnode != nullptr );
        CHECK( ConfXML::getProp(tnode, "dummy") == "" );
    }

    SECTION( "findNode by name" )
    {
        ConfXML xml("tests_with_conf.xml");

        xmlNode* inode = xml.findNode(xml.getFirstNode(), "item", "item2");
        REQUIRE( inode != nullptr );
        CHECK( ConfXML::getProp(inode, "prop") == "yes" );

        // без имени возвращается первый узел
        inode = xml.findNode(xml.getFirstNode(), "item");
        REQUIRE( inode != nullptr );
        CHECK( ConfXML::getProp(inode, "name") == "item1" );

        CHECK( xml.findNode(xml.getFirstNode(), "item", "item3") == nullptr );
    }

    SECTION( "xinclude" )
    {
        ConfXML xml("tests_confxml_xinclude.xml");
        xmlNode* cnode = xml.findNode(xml.getFirstNode(), "MBCodecIncluded");
        REQUIRE( cnode != nullptr );
        CHECK( ConfXML::getProp(cnode, "addr") == "7" );
    }
}
// -----------------------------------------------------------------------------
