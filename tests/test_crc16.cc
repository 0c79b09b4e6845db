#include <catch.hpp>
// -----------------------------------------------------------------------------
#include <string>
#include <vector>
#include "modbus/ModbusTypes.h"
// -----------------------------------------------------------------------------
using namespace std;
using namespace rtucodec;
using namespace rtucodec::ModbusRTU;
// -----------------------------------------------------------------------------
// побитовый расчёт (без таблицы) для сверки
static ModbusCRC crc16_bitwise( const vector<ModbusByte>& buf )
{
    uint16_t crc = 0xffff;

    for( auto b : buf )
    {
        crc ^= b;

        for( int i = 0; i < 8; i++ )
        {
            if( crc & 0x0001 )
                crc = (crc >> 1) ^ 0xA001;
            else
                crc >>= 1;
        }
    }

    return crc;
}
// -----------------------------------------------------------------------------
TEST_CASE("CRC16: known vectors", "[modbus][crc]" )
{
    SECTION("read holding registers header")
    {
        vector<ModbusByte> buf = { 0x01, 0x03, 0x00, 0x00, 0x00, 0x0A };
        REQUIRE( checkCRC(buf) == 0xCDC5 );
        REQUIRE( checkCRC(buf.data(), buf.size()) == 0xCDC5 );
    }

    SECTION("check string '123456789'")
    {
        const string s("123456789");
        vector<ModbusByte> buf(s.begin(), s.end());
        REQUIRE( checkCRC(buf) == 0x4B37 );
    }

    SECTION("empty input")
    {
        vector<ModbusByte> buf;
        REQUIRE( checkCRC(buf) == 0xFFFF );
        REQUIRE( checkCRC(nullptr, 0) == 0xFFFF );
    }

    SECTION("reply 11 03 06 ...")
    {
        vector<ModbusByte> buf = { 0x11, 0x03, 0x06, 0xAE, 0x41, 0x56, 0x52, 0x43, 0x40 };
        ModbusCRC crc = checkCRC(buf);
        // в пакете: младший байт первым
        REQUIRE( (crc & 0xff) == 0x49 );
        REQUIRE( ((crc >> 8) & 0xff) == 0xAD );
    }
}
// -----------------------------------------------------------------------------
TEST_CASE("CRC16: table equals bitwise calculation", "[modbus][crc]" )
{
    vector<ModbusByte> buf;

    for( size_t len = 0; len < 300; len++ )
    {
        REQUIRE( checkCRC(buf) == crc16_bitwise(buf) );
        buf.push_back( (ModbusByte)((len * 37 + 11) & 0xff) );
    }

    vector<ModbusByte> all;

    for( int i = 0; i < 256; i++ )
        all.push_back(i);

    REQUIRE( checkCRC(all) == crc16_bitwise(all) );
}
// -----------------------------------------------------------------------------
TEST_CASE("CRC16: frame with appended crc", "[modbus][crc]" )
{
    vector<ModbusByte> buf = { 0x11, 0x03, 0x00, 0x6B, 0x00, 0x03 };
    ModbusCRC crc = checkCRC(buf);
    REQUIRE( crc == 0x8776 );

    buf.push_back(crc & 0xff);
    buf.push_back((crc >> 8) & 0xff);

    // crc по кадру вместе с его (правильной) CRC даёт ноль
    REQUIRE( checkCRC(buf) == 0x0000 );

    // любой изменённый байт даёт другую CRC
    for( size_t i = 0; i < buf.size() - szCRC; i++ )
    {
        auto b2 = buf;
        b2[i] ^= 0x01;
        REQUIRE( checkCRC(b2.data(), b2.size() - szCRC) != crc );
    }
}
// -----------------------------------------------------------------------------
