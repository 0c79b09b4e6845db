#include <catch.hpp>
// -----------------------------------------------------------------------------
#include <string>
#include <sstream>
#include <vector>
#include "modbus/ModbusRTUCodec.h"
// -----------------------------------------------------------------------------
using namespace std;
using namespace rtucodec;
using namespace rtucodec::ModbusRTU;
// -----------------------------------------------------------------------------
// дописывает в конец правильную CRC (младшим байтом вперёд)
static vector<ModbusByte> withCRC( vector<ModbusByte> buf )
{
    ModbusCRC crc = checkCRC(buf);
    buf.push_back(crc & 0xff);
    buf.push_back((crc >> 8) & 0xff);
    return buf;
}
// -----------------------------------------------------------------------------
static ostringstream codec_log_str;

static void codec_log_buffer( const std::string& txt )
{
    codec_log_str << txt;
}
// -----------------------------------------------------------------------------
TEST_CASE("ModbusRTUCodec: requestHoldingRegisters", "[rtucodec][request]" )
{
    ModbusRTUCodec codec(0x01);

    REQUIRE( (int)codec.getUnitAddress() == 0x01 );
    REQUIRE_FALSE( codec.isPermissiveCount() );

    SECTION("one register")
    {
        vector<ModbusByte> out;
        REQUIRE( codec.requestHoldingRegisters(0, 0, out) == erNoError );
        REQUIRE( out == vector<ModbusByte>({ 0x01, 0x03, 0x00, 0x00, 0x00, 0x01, 0x84, 0x0A }) );
    }

    SECTION("range")
    {
        vector<ModbusByte> out;
        REQUIRE( codec.requestHoldingRegisters(0x0A, 0x6D, out) == erNoError );
        REQUIRE( out == vector<ModbusByte>({ 0x01, 0x03, 0x00, 0x0A, 0x00, 0x64, 0x64, 0x23 }) );
    }

    SECTION("last register of address space")
    {
        vector<ModbusByte> out;
        REQUIRE( codec.requestHoldingRegisters(0xFFFF, 0xFFFF, out) == erNoError );
        REQUIRE( out == vector<ModbusByte>({ 0x01, 0x03, 0xFF, 0xFF, 0x00, 0x01, 0x84, 0x2E }) );
    }

    SECTION("other unit address")
    {
        ModbusRTUCodec c2(0x11);
        vector<ModbusByte> out;
        REQUIRE( c2.requestHoldingRegisters(0x6B, 0x6D, out) == erNoError );
        REQUIRE( out == vector<ModbusByte>({ 0x11, 0x03, 0x00, 0x6B, 0x00, 0x03, 0x76, 0x87 }) );
    }

    SECTION("ModbusMessage")
    {
        ModbusMessage msg;
        REQUIRE( codec.requestHoldingRegisters(0, 9, msg) == erNoError );
        REQUIRE( msg.len() == 8 );
        REQUIRE( (int)msg.func() == fnReadOutputRegisters );
        REQUIRE( (int)msg.addr() == 0x01 );
        REQUIRE( msg.tailCRC() == 0xCDC5 );
        REQUIRE( msg.pduCRC(msg.len()) == 0 );

        ReadOutputMessage q(msg);
        REQUIRE( (int)q.start == 0 );
        REQUIRE( (int)q.count == 10 );
    }

    SECTION("bad range")
    {
        vector<ModbusByte> out = { 0xAA, 0xBB };
        REQUIRE( codec.requestHoldingRegisters(10, 9, out) == erBadDataValue );
        // при ошибке out не трогаем
        REQUIRE( out == vector<ModbusByte>({ 0xAA, 0xBB }) );

        ModbusMessage msg;
        msg.assign( vector<ModbusByte>({ 0x05, 0x06, 0x07 }) );
        REQUIRE( codec.requestHoldingRegisters(0xFFFF, 0, msg) == erBadDataValue );
        REQUIRE( msg.len() == 3 );
        REQUIRE( (int)msg.addr() == 0x05 );
    }
}
// -----------------------------------------------------------------------------
TEST_CASE("ModbusRTUCodec: register count limit", "[rtucodec][request][count]" )
{
    SECTION("strict")
    {
        ModbusRTUCodec codec(0x01);
        vector<ModbusByte> out;

        REQUIRE( codec.requestHoldingRegisters(0, MAXDATALEN - 1, out) == erNoError );
        REQUIRE( out == vector<ModbusByte>({ 0x01, 0x03, 0x00, 0x00, 0x00, 0x7D, 0x85, 0xEB }) );

        out.clear();
        REQUIRE( codec.requestHoldingRegisters(0, MAXDATALEN, out) == erPacketTooLong );
        REQUIRE( out.empty() );

        REQUIRE( codec.requestHoldingRegisters(100, 100 + MAXDATALEN - 1, out) == erNoError );
        REQUIRE( codec.requestHoldingRegisters(0, 0xFFFF, out) == erPacketTooLong );
    }

    SECTION("permissive")
    {
        ModbusRTUCodec codec(0x01, true);
        REQUIRE( codec.isPermissiveCount() );

        vector<ModbusByte> out;
        REQUIRE( codec.requestHoldingRegisters(0, MAXDATALEN, out) == erNoError );
        REQUIRE( out == vector<ModbusByte>({ 0x01, 0x03, 0x00, 0x00, 0x00, 0x7E, 0xC5, 0xEA }) );

        REQUIRE( codec.requestHoldingRegisters(1, 0xFFFF, out) == erNoError );
        REQUIRE( (int)out[4] == 0xFF );
        REQUIRE( (int)out[5] == 0xFF );

        // 65536 регистров в поле count не помещается
        out.clear();
        REQUIRE( codec.requestHoldingRegisters(0, 0xFFFF, out) == erPacketTooLong );
        REQUIRE( out.empty() );
    }
}
// -----------------------------------------------------------------------------
TEST_CASE("ModbusRTUCodec: fetchHoldingRegisters", "[rtucodec][reply]" )
{
    vector<ModbusData> regs;

    SECTION("one register")
    {
        ModbusRTUCodec codec(0x01);
        ReplyStatus st = codec.fetchHoldingRegisters( vector<ModbusByte>({ 0x01, 0x03, 0x02, 0x00, 0x2A, 0x39, 0x9B }), regs);
        REQUIRE( st.ok() );
        REQUIRE( st.err == erNoError );
        REQUIRE( regs == vector<ModbusData>({ 42 }) );
    }

    SECTION("three registers")
    {
        ModbusRTUCodec codec(0x11);
        vector<ModbusByte> buf = { 0x11, 0x03, 0x06, 0xAE, 0x41, 0x56, 0x52, 0x43, 0x40, 0x49, 0xAD };
        REQUIRE( codec.fetchHoldingRegisters(buf.data(), buf.size(), regs).ok() );
        REQUIRE( regs == vector<ModbusData>({ 0xAE41, 0x5652, 0x4340 }) );
    }

    SECTION("ModbusMessage")
    {
        ModbusRTUCodec codec(0x01);
        ModbusMessage msg;
        REQUIRE( msg.assign( vector<ModbusByte>({ 0x01, 0x03, 0x04, 0x00, 0x01, 0x00, 0xFF, 0xEB, 0xB3 }) ) == erNoError );
        REQUIRE( codec.fetchHoldingRegisters(msg, regs).ok() );
        REQUIRE( regs == vector<ModbusData>({ 1, 255 }) );
    }

    SECTION("empty data")
    {
        ModbusRTUCodec codec(0x01);
        REQUIRE( codec.fetchHoldingRegisters( withCRC({ 0x01, 0x03, 0x00 }), regs).ok() );
        REQUIRE( regs.empty() );
    }

    SECTION("full reply")
    {
        ModbusRTUCodec codec(0x01);
        ReadOutputRetMessage ret(0x01);

        for( int i = 0; i < MAXDATALEN; i++ )
            REQUIRE( ret.addData(i * 3) );

        ModbusMessage msg = ret.transport_msg();
        REQUIRE( codec.fetchHoldingRegisters(msg, regs).ok() );
        REQUIRE( regs.size() == (size_t)MAXDATALEN );
        REQUIRE( regs[0] == 0 );
        REQUIRE( regs[MAXDATALEN - 1] == (MAXDATALEN - 1) * 3 );
    }
}
// -----------------------------------------------------------------------------
TEST_CASE("ModbusRTUCodec: reply errors", "[rtucodec][reply][errors]" )
{
    ModbusRTUCodec codec(0x01);
    vector<ModbusData> regs = { 1, 2, 3 };

    SECTION("bad checksum")
    {
        vector<ModbusByte> buf = { 0x01, 0x03, 0x02, 0x00, 0x2A, 0x39, 0x00 };
        ReplyStatus st = codec.fetchHoldingRegisters(buf, regs);
        REQUIRE( st.err == erBadCheckSum );
        REQUIRE( st.expected == 0x9B39 );
        REQUIRE( st.actual == 0x0039 );
        REQUIRE_FALSE( st.ok() );
        REQUIRE( regs.empty() );
    }

    SECTION("any changed byte breaks checksum")
    {
        const vector<ModbusByte> good = { 0x01, 0x03, 0x02, 0x00, 0x2A, 0x39, 0x9B };

        for( size_t i = 0; i < good.size(); i++ )
        {
            auto buf = good;
            buf[i] ^= 0x10;
            REQUIRE( codec.fetchHoldingRegisters(buf, regs).err == erBadCheckSum );
        }
    }

    SECTION("bad unit address")
    {
        ReplyStatus st = codec.fetchHoldingRegisters( vector<ModbusByte>({ 0x02, 0x03, 0x02, 0x00, 0x2A, 0x7D, 0x9B }), regs);
        REQUIRE( st.err == erBadReplyNodeAddress );
        REQUIRE( st.expected == 0x01 );
        REQUIRE( st.actual == 0x02 );
        REQUIRE( regs.empty() );
    }

    SECTION("unexpected function")
    {
        ReplyStatus st = codec.fetchHoldingRegisters( vector<ModbusByte>({ 0x01, 0x04, 0x02, 0x00, 0x2A, 0x38, 0xEF }), regs);
        REQUIRE( st.err == erUnExpectedPacketType );
        REQUIRE( st.expected == fnReadOutputRegisters );
        REQUIRE( st.actual == 0x04 );
    }

    SECTION("slave exception")
    {
        ReplyStatus st = codec.fetchHoldingRegisters( vector<ModbusByte>({ 0x01, 0x83, 0x02, 0xC0, 0xF1 }), regs);
        REQUIRE( st.err == erSlaveException );
        REQUIRE( (int)st.addr == 0x01 );
        REQUIRE( (int)st.func == 0x83 );
        REQUIRE( (int)st.ecode == 2 );
        REQUIRE( st.message() == "Illegal data address" );
        REQUIRE( regs.empty() );

        ostringstream s;
        s << st;
        REQUIRE( s.str().find("addr=0x1 func=0x83 ecode=2") != string::npos );
    }

    SECTION("unknown slave exception")
    {
        ModbusRTUCodec c2(0x11);
        ReplyStatus st = c2.fetchHoldingRegisters( vector<ModbusByte>({ 0x11, 0x83, 0x09, 0x80, 0xF3 }), regs);
        REQUIRE( st.err == erSlaveException );
        REQUIRE( (int)st.addr == 0x11 );
        REQUIRE( (int)st.ecode == 9 );
        REQUIRE( st.message() == "Unknown error" );
    }

    SECTION("odd byte count")
    {
        // bcnt=3: один полный регистр, последний байт не разбирается
        ReplyStatus st = codec.fetchHoldingRegisters( withCRC({ 0x01, 0x03, 0x03, 0x00, 0x2A, 0x00 }), regs);
        REQUIRE( st.ok() );
        REQUIRE( regs == vector<ModbusData>({ 0x002A }) );
    }

    SECTION("byte count overruns the packet")
    {
        REQUIRE( codec.fetchHoldingRegisters( withCRC({ 0x01, 0x03, 0x04, 0x00, 0x2A }), regs).err == erInvalidFormat );
        REQUIRE( regs.empty() );

        REQUIRE( codec.fetchHoldingRegisters( withCRC({ 0x01, 0x03, 0xFF, 0x00, 0x2A, 0x00, 0x01 }), regs).err == erInvalidFormat );
        REQUIRE( regs.empty() );
    }

    SECTION("bytes after data are ignored")
    {
        ReplyStatus st = codec.fetchHoldingRegisters( withCRC({ 0x01, 0x03, 0x02, 0x00, 0x2A, 0x00, 0x01 }), regs);
        REQUIRE( st.ok() );
        REQUIRE( regs == vector<ModbusData>({ 42 }) );

        st = codec.fetchHoldingRegisters( withCRC({ 0x01, 0x03, 0x00, 0x12, 0x34 }), regs);
        REQUIRE( st.ok() );
        REQUIRE( regs.empty() );
    }

    SECTION("short packet")
    {
        REQUIRE( codec.fetchHoldingRegisters( vector<ModbusByte>(), regs).err == erInvalidFormat );
        REQUIRE( codec.fetchHoldingRegisters( vector<ModbusByte>({ 0x01, 0x03, 0x02 }), regs).err == erInvalidFormat );
        REQUIRE( codec.fetchHoldingRegisters(nullptr, 10, regs).err == erInvalidFormat );
        REQUIRE( regs.empty() );
    }

    SECTION("no byte count")
    {
        // 01 03 + CRC: кадр корректен, но данных нет
        REQUIRE( codec.fetchHoldingRegisters( vector<ModbusByte>({ 0x01, 0x03, 0x40, 0x21 }), regs).err == erInvalidFormat );
    }

    SECTION("too long packet")
    {
        vector<ModbusByte> buf(ModbusMessage::maxSizeOfMessage() + 1, 0x01);
        REQUIRE( codec.fetchHoldingRegisters(buf, regs).err == erPacketTooLong );
        REQUIRE( regs.empty() );
    }
}
// -----------------------------------------------------------------------------
TEST_CASE("ModbusRTUCodec: check order", "[rtucodec][reply][order]" )
{
    ModbusRTUCodec codec(0x01);
    vector<ModbusData> regs;

    SECTION("checksum before address")
    {
        vector<ModbusByte> buf = { 0x02, 0x03, 0x02, 0x00, 0x2A, 0x7D, 0x9C };
        REQUIRE( codec.fetchHoldingRegisters(buf, regs).err == erBadCheckSum );
    }

    SECTION("address before exception")
    {
        ErrorRetMessage em(0x02, fnReadOutputRegisters | MBErrMask, exIllegalDataAddress);
        ReplyStatus st = codec.fetchHoldingRegisters(em.transport_msg(), regs);
        REQUIRE( st.err == erBadReplyNodeAddress );
        REQUIRE( st.actual == 0x02 );
    }

    SECTION("exception before function code")
    {
        ErrorRetMessage em(0x01, fnReadOutputRegisters | MBErrMask, exSlaveDeviceBusy);
        ReplyStatus st = codec.fetchHoldingRegisters(em.transport_msg(), regs);
        REQUIRE( st.err == erSlaveException );
        REQUIRE( (int)st.ecode == 6 );
    }

    SECTION("short exception is a function mismatch")
    {
        // 01 83 + CRC: без кода исключения
        ReplyStatus st = codec.fetchHoldingRegisters( vector<ModbusByte>({ 0x01, 0x83, 0x41, 0x81 }), regs);
        REQUIRE( st.err == erUnExpectedPacketType );
        REQUIRE( st.expected == fnReadOutputRegisters );
        REQUIRE( st.actual == 0x83 );
    }

    SECTION("exception for other function")
    {
        ErrorRetMessage em(0x01, 0x04 | MBErrMask, exIllegalFunction);
        ReplyStatus st = codec.fetchHoldingRegisters(em.transport_msg(), regs);
        REQUIRE( st.err == erUnExpectedPacketType );
        REQUIRE( st.actual == 0x84 );
    }
}
// -----------------------------------------------------------------------------
TEST_CASE("ModbusRTUCodec: exception codes", "[rtucodec][reply][exception]" )
{
    ModbusRTUCodec codec(0x01);
    vector<ModbusData> regs;

    const vector<string> texts =
    {
        "Unknown error",
        "Illegal function",
        "Illegal data address",
        "Illegal data value",
        "Slave device failure",
        "Acknowledge",
        "Slave device busy",
        "Memory Parity Error"
    };

    for( size_t i = 0; i < texts.size(); i++ )
    {
        ErrorRetMessage em(0x01, fnReadOutputRegisters | MBErrMask, (ModbusByte)i);
        ReplyStatus st = codec.fetchHoldingRegisters(em.transport_msg(), regs);
        REQUIRE( st.err == erSlaveException );
        REQUIRE( (size_t)st.ecode == i );
        REQUIRE( st.message() == texts[i] );
    }

    for( int code : { 8, 9, 0x7F, 0xFF } )
    {
        ErrorRetMessage em(0x01, fnReadOutputRegisters | MBErrMask, (ModbusByte)code);
        ReplyStatus st = codec.fetchHoldingRegisters(em.transport_msg(), regs);
        REQUIRE( st.err == erSlaveException );
        REQUIRE( (int)st.ecode == code );
        REQUIRE( st.message() == "Unknown error" );
    }
}
// -----------------------------------------------------------------------------
TEST_CASE("ModbusRTUCodec: request and reply", "[rtucodec][exchange]" )
{
    ModbusRTUCodec codec(0x20);

    vector<ModbusByte> req;
    REQUIRE( codec.requestHoldingRegisters(0x100, 0x104, req) == erNoError );

    // ответ "устройства" на этот запрос
    ModbusMessage rmsg;
    REQUIRE( rmsg.assign(req) == erNoError );
    ReadOutputMessage q(rmsg);
    REQUIRE( (int)q.addr == 0x20 );
    REQUIRE( (int)q.start == 0x100 );
    REQUIRE( (int)q.count == 5 );

    ReadOutputRetMessage ret(q.addr);

    for( int i = 0; i < q.count; i++ )
        ret.addData( q.start + i );

    vector<ModbusData> regs;
    ReplyStatus st = codec.fetchHoldingRegisters(ret.transport_msg(), regs);
    REQUIRE( st.ok() );
    REQUIRE( regs == vector<ModbusData>({ 0x100, 0x101, 0x102, 0x103, 0x104 }) );
}
// -----------------------------------------------------------------------------
TEST_CASE("ModbusRTUCodec: log", "[rtucodec][log]" )
{
    ModbusRTUCodec codec(0x01);

    // по умолчанию лог выключен
    REQUIRE( codec.log() != nullptr );
    REQUIRE( codec.log()->level() == Debug::NONE );

    auto l = make_shared<DebugStream>();
    l->level(Debug::WARN);
    l->signal_stream_event().connect( &codec_log_buffer );

    codec.setLog(l);
    REQUIRE( codec.log() == l );

    codec.setLog(nullptr);
    REQUIRE( codec.log() == l );

    codec_log_str.str("");

    vector<ModbusData> regs;
    codec.fetchHoldingRegisters( vector<ModbusByte>({ 0x01, 0x03, 0x02, 0x00, 0x2A, 0x39, 0x9B }), regs);
    REQUIRE( codec_log_str.str().empty() );

    codec.fetchHoldingRegisters( vector<ModbusByte>({ 0x01, 0x03, 0x02, 0x00, 0x2A, 0x39, 0x00 }), regs);
    REQUIRE( codec_log_str.str().find("bad crc") != string::npos );

    codec_log_str.str("");
    vector<ModbusByte> out;
    codec.requestHoldingRegisters(5, 4, out);
    REQUIRE( codec_log_str.str().find("bad range") != string::npos );

    ostringstream s;
    s << codec;
    REQUIRE( s.str() == "addr=0x01 permissiveCount=0" );
}
// -----------------------------------------------------------------------------
