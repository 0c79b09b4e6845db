#include <catch.hpp>
// -----------------------------------------------------------------------------
#include <sstream>
#include <limits>
#include <iomanip>
#include <cstdint>
#include "RTUCodecTypes.h"
// -----------------------------------------------------------------------------
using namespace std;
using namespace rtucodec;
// -----------------------------------------------------------------------------
TEST_CASE("RTUCodecTypes: rtu_atoi", "[utypes][rtu_atoi]" )
{
    SECTION("int")
    {
        REQUIRE( rtu_atoi("100") == 100 );
        REQUIRE( rtu_atoi("-100") == -100 );
        REQUIRE( rtu_atoi("0") == 0 );
        REQUIRE( rtu_atoi("") == 0 );
        REQUIRE( rtu_atoi(nullptr) == 0 );
        REQUIRE( rtu_atoi("text") == 0 );

        ostringstream imax;
        imax << std::numeric_limits<int>::max();
        REQUIRE( rtu_atoi(imax.str()) == std::numeric_limits<int>::max() );
    }

    SECTION("hex")
    {
        REQUIRE( rtu_atoi("0xff") == 0xff );
        REQUIRE( rtu_atoi("0XFF") == 0xff );
        REQUIRE( rtu_atoi("0x11") == 17 );
        REQUIRE( rtu_atoi("0xffff") == 0xffff );
        REQUIRE( rtu_atoi("0x0") == 0 );
        REQUIRE( (uint32_t)rtu_atoi("0xffffffff") == 0xffffffff );
        REQUIRE( rtu_atoi("0x") == 0 );
    }
}
// -----------------------------------------------------------------------------
TEST_CASE("RTUCodecTypes: rtu_strtol", "[utypes][rtu_strtol]" )
{
    long v = -1;

    SECTION("valid")
    {
        REQUIRE( rtu_strtol("255", v) );
        REQUIRE( v == 255 );
        REQUIRE( rtu_strtol("-10", v) );
        REQUIRE( v == -10 );
        REQUIRE( rtu_strtol("0x11", v) );
        REQUIRE( v == 17 );
        REQUIRE( rtu_strtol("0XfF", v) );
        REQUIRE( v == 255 );
        REQUIRE( rtu_strtol("0", v) );
        REQUIRE( v == 0 );
        REQUIRE( rtu_strtol("4294967297", v) );
        REQUIRE( v == 4294967297L );
    }

    SECTION("invalid")
    {
        REQUIRE_FALSE( rtu_strtol("", v) );
        REQUIRE_FALSE( rtu_strtol("abc", v) );
        REQUIRE_FALSE( rtu_strtol("1e3", v) );
        REQUIRE_FALSE( rtu_strtol("12 ", v) );
        REQUIRE_FALSE( rtu_strtol(" 12", v) );
        REQUIRE_FALSE( rtu_strtol("0x", v) );
        REQUIRE_FALSE( rtu_strtol("0x-5", v) );
        REQUIRE_FALSE( rtu_strtol("0xZZ", v) );
        REQUIRE_FALSE( rtu_strtol("99999999999999999999999", v) );
        // при ошибке значение не меняется
        REQUIRE( v == -1 );
    }
}
// -----------------------------------------------------------------------------
TEST_CASE("RTUCodecTypes: explode_str", "[utypes][explode]" )
{
    auto t1 = explode_str("", ',');
    REQUIRE( t1.empty() );

    auto t2 = explode_str("warn", ',');
    REQUIRE( t2.size() == 1 );
    REQUIRE( t2[0] == "warn" );

    auto t3 = explode_str("warn,level3,level9", ',');
    REQUIRE( t3 == vector<string>({ "warn", "level3", "level9" }) );

    // пустые элементы пропускаются
    auto t4 = explode_str(",warn,,level3,", ',');
    REQUIRE( t4 == vector<string>({ "warn", "level3" }) );

    auto t5 = explode_str("01 03  00 0A", ' ');
    REQUIRE( t5 == vector<string>({ "01", "03", "00", "0A" }) );
}
// -----------------------------------------------------------------------------
TEST_CASE("RTUCodecTypes: arguments", "[utypes][args]" )
{
    const char* argv[] = { "prog", "--addr", "0x11", "--count", "10", "--flag" };
    int argc = sizeof(argv) / sizeof(argv[0]);

    REQUIRE( getArgParam("--addr", argc, argv) == "0x11" );
    REQUIRE( getArgParam("--unknown", argc, argv, "def") == "def" );
    // у последнего параметра нет значения
    REQUIRE( getArgParam("--flag", argc, argv, "def") == "def" );
    // нулевой аргумент не просматривается
    REQUIRE( getArgParam("prog", argc, argv) == "" );

    REQUIRE( getArgParam("--count", argc, argv) == "10" );

    REQUIRE( findArgParam("--flag", argc, argv) == 5 );
    REQUIRE( findArgParam("--addr", argc, argv) == 1 );
    REQUIRE( findArgParam("--unknown", argc, argv) == -1 );
}
// -----------------------------------------------------------------------------
TEST_CASE("RTUCodecTypes: file_exist", "[utypes][file]" )
{
    REQUIRE( file_exist("tests_with_conf.xml") );
    REQUIRE_FALSE( file_exist("not_found_file.xml") );
}
// -----------------------------------------------------------------------------
TEST_CASE("RTUCodecTypes: ios_fmt_restorer", "[utypes][ios]" )
{
    ostringstream s;
    {
        ios_fmt_restorer r(s);
        s << hex << setw(4) << setfill('0') << 255;
    }

    s << " " << 255;
    REQUIRE( s.str() == "00ff 255" );
}
// -----------------------------------------------------------------------------
