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
// -------------------------------------------------------------------------
#include <cstring>
#include <cctype>
#include <string>
#include <iostream>
#include <sstream>
#include <iomanip>
#include "modbus/ModbusTypes.h"
#include "RTUCodecTypes.h"
// -------------------------------------------------------------------------
namespace rtucodec
{
	// -------------------------------------------------------------------------
	using namespace ModbusRTU;
	using namespace std;
	// -------------------------------------------------------------------------
	uint16_t ModbusRTU::SWAPSHORT( uint16_t x )
	{
		return ((((x) >> 8) & 0xff) | (((x) << 8) & 0xff00));
	}
	// -------------------------------------------------------------------------
	// таблица для полинома 0xA001 (отражённый 0x8005)
	static const uint16_t crc_16_tab[] =
	{
		0x0000, 0xc0c1, 0xc181, 0x0140, 0xc301, 0x03c0, 0x0280, 0xc241,
		0xc601, 0x06c0, 0x0780, 0xc741, 0x0500, 0xc5c1, 0xc481, 0x0440,
		0xcc01, 0x0cc0, 0x0d80, 0xcd41, 0x0f00, 0xcfc1, 0xce81, 0x0e40,
		0x0a00, 0xcac1, 0xcb81, 0x0b40, 0xc901, 0x09c0, 0x0880, 0xc841,
		0xd801, 0x18c0, 0x1980, 0xd941, 0x1b00, 0xdbc1, 0xda81, 0x1a40,
		0x1e00, 0xdec1, 0xdf81, 0x1f40, 0xdd01, 0x1dc0, 0x1c80, 0xdc41,
		0x1400, 0xd4c1, 0xd581, 0x1540, 0xd701, 0x17c0, 0x1680, 0xd641,
		0xd201, 0x12c0, 0x1380, 0xd341, 0x1100, 0xd1c1, 0xd081, 0x1040,
		0xf001, 0x30c0, 0x3180, 0xf141, 0x3300, 0xf3c1, 0xf281, 0x3240,
		0x3600, 0xf6c1, 0xf781, 0x3740, 0xf501, 0x35c0, 0x3480, 0xf441,
		0x3c00, 0xfcc1, 0xfd81, 0x3d40, 0xff01, 0x3fc0, 0x3e80, 0xfe41,
		0xfa01, 0x3ac0, 0x3b80, 0xfb41, 0x3900, 0xf9c1, 0xf881, 0x3840,
		0x2800, 0xe8c1, 0xe981, 0x2940, 0xeb01, 0x2bc0, 0x2a80, 0xea41,
		0xee01, 0x2ec0, 0x2f80, 0xef41, 0x2d00, 0xedc1, 0xec81, 0x2c40,
		0xe401, 0x24c0, 0x2580, 0xe541, 0x2700, 0xe7c1, 0xe681, 0x2640,
		0x2200, 0xe2c1, 0xe381, 0x2340, 0xe101, 0x21c0, 0x2080, 0xe041,
		0xa001, 0x60c0, 0x6180, 0xa141, 0x6300, 0xa3c1, 0xa281, 0x6240,
		0x6600, 0xa6c1, 0xa781, 0x6740, 0xa501, 0x65c0, 0x6480, 0xa441,
		0x6c00, 0xacc1, 0xad81, 0x6d40, 0xaf01, 0x6fc0, 0x6e80, 0xae41,
		0xaa01, 0x6ac0, 0x6b80, 0xab41, 0x6900, 0xa9c1, 0xa881, 0x6840,
		0x7800, 0xb8c1, 0xb981, 0x7940, 0xbb01, 0x7bc0, 0x7a80, 0xba41,
		0xbe01, 0x7ec0, 0x7f80, 0xbf41, 0x7d00, 0xbdc1, 0xbc81, 0x7c40,
		0xb401, 0x74c0, 0x7580, 0xb541, 0x7700, 0xb7c1, 0xb681, 0x7640,
		0x7200, 0xb2c1, 0xb381, 0x7340, 0xb101, 0x71c0, 0x7080, 0xb041,
		0x5000, 0x90c1, 0x9181, 0x5140, 0x9301, 0x53c0, 0x5280, 0x9241,
		0x9601, 0x56c0, 0x5780, 0x9741, 0x5500, 0x95c1, 0x9481, 0x5440,
		0x9c01, 0x5cc0, 0x5d80, 0x9d41, 0x5f00, 0x9fc1, 0x9e81, 0x5e40,
		0x5a00, 0x9ac1, 0x9b81, 0x5b40, 0x9901, 0x59c0, 0x5880, 0x9841,
		0x8801, 0x48c0, 0x4980, 0x8941, 0x4b00, 0x8bc1, 0x8a81, 0x4a40,
		0x4e00, 0x8ec1, 0x8f81, 0x4f40, 0x8d01, 0x4dc0, 0x4c80, 0x8c41,
		0x4400, 0x84c1, 0x8581, 0x4540, 0x8701, 0x47c0, 0x4680, 0x8641,
		0x8201, 0x42c0, 0x4380, 0x8341, 0x4100, 0x81c1, 0x8081, 0x4040
	};
	// -------------------------------------------------------------------------
	// побайтовый расчёт по таблице (отражённый полином, младший бит первым)
	static uint16_t get_crc_16( uint16_t crc, const uint8_t* buf, size_t size )
	{
		while( size-- )
			crc = (crc >> 8) ^ crc_16_tab[ (crc ^ * (buf++)) & 0xff ];

		return crc;
	}
	// -------------------------------------------------------------------------
	ModbusCRC ModbusRTU::checkCRC( const ModbusByte* buf, size_t len )
	{
		if( buf == nullptr )
			return 0xffff;

		return get_crc_16(0xffff, buf, len);
	}
	// -------------------------------------------------------------------------
	ModbusCRC ModbusRTU::checkCRC( const std::vector<ModbusByte>& buf )
	{
		return checkCRC(buf.data(), buf.size());
	}
	// -------------------------------------------------------------------------
	std::ostream& ModbusRTU::mbPrintMessage( std::ostream& os, const ModbusByte* m, size_t len )
	{
		ios_fmt_restorer ifs(os);

		os << hex << setfill('0');

		for( size_t i = 0; i < len; i++ )
			os << setw(2) << (int)(m[i]) << " ";

		return os;
	}
	// -------------------------------------------------------------------------
	std::ostream& ModbusRTU::operator<<(std::ostream& os, const ModbusHeader& m )
	{
		return os << "addr=" << addr2str(m.addr) << " func=" << b2str(m.func);
	}
	// -------------------------------------------------------------------------
	ModbusMessage::ModbusMessage():
		dlen(0)
	{
		pduhead.addr = 0;
		pduhead.func = 0;
		memset(data, 0, sizeof(data));
	}
	// -------------------------------------------------------------------------
	const ModbusByte* ModbusMessage::buf() const
	{
		return (const ModbusByte*)&pduhead;
	}
	// -------------------------------------------------------------------------
	size_t ModbusMessage::len() const
	{
		return (szModbusHeader + dlen);
	}
	// -------------------------------------------------------------------------
	ModbusCRC ModbusMessage::pduCRC( size_t clen ) const
	{
		return checkCRC( buf(), clen );
	}
	// -------------------------------------------------------------------------
	ModbusCRC ModbusMessage::tailCRC() const
	{
		if( len() < szCRC )
			return 0;

		// в пакете CRC лежит младшим байтом вперёд
		const ModbusByte* b = buf() + len() - szCRC;
		return (ModbusCRC)( b[0] | (b[1] << 8) );
	}
	// -------------------------------------------------------------------------
	mbErrCode ModbusMessage::assign( const ModbusByte* b, size_t blen )
	{
		if( b == nullptr || blen < szModbusHeader )
			return erInvalidFormat;

		if( blen > maxSizeOfMessage() )
			return erPacketTooLong;

		clear();
		pduhead.addr = b[0];
		pduhead.func = b[1];
		dlen = blen - szModbusHeader;

		if( dlen > 0 )
			memcpy(data, b + szModbusHeader, dlen);

		return erNoError;
	}
	// -------------------------------------------------------------------------
	mbErrCode ModbusMessage::assign( const std::vector<ModbusByte>& v )
	{
		return assign(v.data(), v.size());
	}
	// -------------------------------------------------------------------------
	std::vector<ModbusByte> ModbusMessage::bytes() const
	{
		return std::vector<ModbusByte>(buf(), buf() + len());
	}
	// -------------------------------------------------------------------------
	size_t ModbusMessage::maxSizeOfMessage()
	{
		return (MAXLENPACKET + szModbusHeader + szCRC);
	}
	// -------------------------------------------------------------------------
	void ModbusMessage::clear()
	{
		pduhead.addr = 0;
		pduhead.func = 0;
		memset(data, 0, sizeof(data));
		dlen = 0;
	}
	// -------------------------------------------------------------------------
	// дописать CRC после ind байт данных, вернуть её. dlen становится окончательной
	static ModbusCRC append_crc( ModbusMessage& mm, size_t ind )
	{
		const ModbusCRC crc = mm.pduCRC( szModbusHeader + ind );

		// в пакете младшим байтом вперёд
		mm.data[ind] = crc & 0xff;
		mm.data[ind + 1] = (crc >> 8) & 0xff;
		mm.dlen = ind + szCRC;
		return crc;
	}
	// -------------------------------------------------------------------------
	std::ostream& ModbusRTU::operator<<(std::ostream& os, const ModbusMessage& m )
	{
		return mbPrintMessage(os, m.buf(), m.len());
	}
	// -------------------------------------------------------------------------
	ErrorRetMessage::ErrorRetMessage( const ModbusMessage& m )
	{
		init(m);
	}
	// -------------------------------------------------------------------------
	void ErrorRetMessage::init( const ModbusMessage& m )
	{
		if( m.dlen < szData() )
			throw mbException(erInvalidFormat);

		addr = m.pduhead.addr;
		func = m.pduhead.func;
		ecode = m.data[0];
		crc = (ModbusCRC)( m.data[1] | (m.data[2] << 8) );
	}
	// -------------------------------------------------------------------------
	ErrorRetMessage::ErrorRetMessage( ModbusAddr _from,
									  ModbusByte _func, ModbusByte _ecode )
	{
		addr = _from;
		func = _func | MBErrMask; // выставляем старший бит
		ecode = _ecode;
	}
	// -------------------------------------------------------------------------
	ModbusMessage ErrorRetMessage::transport_msg()
	{
		ModbusMessage mm;

		mm.pduhead.addr = addr;
		mm.pduhead.func = func;
		mm.data[0] = ecode;

		crc = append_crc(mm, sizeof(ecode));
		return mm;
	}
	// -------------------------------------------------------------------------
	std::ostream& ModbusRTU::operator<<(std::ostream& os, const ErrorRetMessage& m )
	{
		return os << "addr=" << addr2str(m.addr)
			   << " func=" << b2str(m.func)
			   << " errcode=" << (int)m.ecode
			   << " (" << exceptionMessage(m.ecode) << ")";
	}
	// -------------------------------------------------------------------------
	ReadOutputMessage::ReadOutputMessage( ModbusAddr a, ModbusData s, ModbusData c ):
		start(s),
		count(c)
	{
		addr = a;
		func = fnReadOutputRegisters;
	}
	// -------------------------------------------------------------------------
	ModbusMessage ReadOutputMessage::transport_msg()
	{
		ModbusMessage mm;

		mm.pduhead.addr = addr;
		mm.pduhead.func = func;

		// start и count старшим байтом вперёд
		mm.data[0] = (start >> 8) & 0xff;
		mm.data[1] = start & 0xff;
		mm.data[2] = (count >> 8) & 0xff;
		mm.data[3] = count & 0xff;

		crc = append_crc(mm, 2 * sizeof(ModbusData));
		return mm;
	}
	// -------------------------------------------------------------------------
	ReadOutputMessage::ReadOutputMessage( const ModbusMessage& m )
	{
		init(m);
	}
	// -------------------------------------------------------------------------
	void ReadOutputMessage::init( const ModbusMessage& m )
	{
		if( m.pduhead.func != fnReadOutputRegisters )
			throw mbException(erUnExpectedPacketType);

		if( m.dlen < szData() )
			throw mbException(erInvalidFormat);

		addr = m.pduhead.addr;
		func = m.pduhead.func;

		ModbusData d[2];
		memcpy(&d, m.data, sizeof(d));

		// переворачиваем слова
		start = SWAPSHORT(d[0]);
		count = SWAPSHORT(d[1]);
		crc = (ModbusCRC)( m.data[4] | (m.data[5] << 8) );
	}
	// -------------------------------------------------------------------------
	std::ostream& ModbusRTU::operator<<(std::ostream& os, const ReadOutputMessage& m )
	{
		return os << "addr=" << addr2str(m.addr)
			   << " start=" << dat2str(m.start) << "(" << (int)(m.start) << ")"
			   << " count=" << dat2str(m.count) << "(" << (int)m.count << ")";
	}
	// -------------------------------------------------------------------------
	ReadOutputRetMessage::ReadOutputRetMessage( const ModbusMessage& m )
	{
		init(m);
	}
	// -------------------------------------------------------------------------
	void ReadOutputRetMessage::init( const ModbusMessage& m )
	{
		if( m.pduhead.func != fnReadOutputRegisters )
			throw mbException(erUnExpectedPacketType);

		if( m.dlen < szHead() + szCRC )
			throw mbException(erInvalidFormat);

		clear();
		addr = m.pduhead.addr;
		func = m.pduhead.func;

		bcnt = m.data[0];

		// данные не должны заходить на CRC (байты между данными и CRC пропускаются)
		if( m.dlen < szHead() + bcnt + szCRC )
			throw mbException(erInvalidFormat);

		// при нечётном bcnt последний байт не образует регистра
		count = bcnt / sizeof(ModbusData);

		// старший байт первым
		for( size_t i = 0; i < count; i++ )
			data[i] = (ModbusData)( (m.data[1 + 2 * i] << 8) | m.data[2 + 2 * i] );

		crc = (ModbusCRC)( m.data[m.dlen - 2] | (m.data[m.dlen - 1] << 8) );
	}
	// -------------------------------------------------------------------------
	size_t ReadOutputRetMessage::getDataLen( const ModbusMessage& m )
	{
		if( m.dlen == 0 )
			return 0;

		return m.data[0];
	}
	// -------------------------------------------------------------------------
	ReadOutputRetMessage::ReadOutputRetMessage( const ModbusAddr _addr ):
		bcnt(0),
		count(0)
	{
		addr = _addr;
		func = fnReadOutputRegisters;
		memset(data, 0, sizeof(data));
	}
	// -------------------------------------------------------------------------
	bool ReadOutputRetMessage::addData( ModbusData d )
	{
		if( isFull() )
			return false;

		data[count++] = d;
		bcnt = count * sizeof(ModbusData);
		return true;
	}
	// -------------------------------------------------------------------------
	void ReadOutputRetMessage::clear()
	{
		memset(data, 0, sizeof(data));
		count = 0;
		bcnt = 0;
	}
	// -------------------------------------------------------------------------
	ModbusMessage ReadOutputRetMessage::transport_msg()
	{
		ModbusMessage mm;

		mm.pduhead.addr = addr;
		mm.pduhead.func = func;

		size_t ind = 0;
		bcnt = count * sizeof(ModbusData);

		mm.data[ind++] = bcnt;

		// копируем данные (старший байт первым)
		for( size_t i = 0; i < count; i++ )
		{
			mm.data[ind++] = (data[i] >> 8) & 0xff;
			mm.data[ind++] = data[i] & 0xff;
		}

		crc = append_crc(mm, ind);
		return mm;
	}
	// -------------------------------------------------------------------------
	size_t ReadOutputRetMessage::szData() const
	{
		// фактическое число данных + контрольная сумма
		return sizeof(bcnt) + count * sizeof(ModbusData) + szCRC;
	}
	// -------------------------------------------------------------------------
	std::vector<ModbusData> ReadOutputRetMessage::values() const
	{
		return std::vector<ModbusData>(data, data + count);
	}
	// -------------------------------------------------------------------------
	std::ostream& ModbusRTU::operator<<(std::ostream& os, const ReadOutputRetMessage& m )
	{
		os << "addr=" << addr2str(m.addr)
		   << " bcnt=" << (int)m.bcnt
		   << " data: ";

		for( size_t i = 0; i < m.count; i++ )
			os << dat2str(m.data[i]) << " ";

		return os;
	}
	// -------------------------------------------------------------------------
	ModbusAddr ModbusRTU::str2mbAddr( const std::string& val )
	{
		long v = 0;

		if( !rtucodec::rtu_strtol(val, v) || v < 0 || v > 0xff )
			throw rtucodec::OutOfRange("(str2mbAddr): bad address '" + val + "' (0..255)");

		return (ModbusAddr)v;
	}
	// -------------------------------------------------------------------------
	ModbusData ModbusRTU::str2mbData( const std::string& val )
	{
		long v = 0;

		if( !rtucodec::rtu_strtol(val, v) || v < 0 || v > 0xffff )
			throw rtucodec::OutOfRange("(str2mbData): bad value '" + val + "' (0..65535)");

		return (ModbusData)v;
	}
	// -------------------------------------------------------------------------
	std::string ModbusRTU::dat2str( const ModbusData dat )
	{
		ostringstream s;
		s << hex << setfill('0') << showbase << dat;
		return s.str();
	}
	// -------------------------------------------------------------------------
	std::string ModbusRTU::addr2str( const ModbusAddr addr )
	{
		ostringstream s;
		s << "0x" << hex << setfill('0') << setw(2) << (int)addr;
		return s.str();
	}
	// -------------------------------------------------------------------------
	std::string ModbusRTU::b2str( const ModbusByte b )
	{
		ostringstream s;
		s << hex << setfill('0') << setw(2) << (int)b;
		return s.str();
	}
	// -------------------------------------------------------------------------
	static int hexval( char c )
	{
		if( c >= '0' && c <= '9' )
			return c - '0';

		// для не-ASCII символов char отрицателен
		const int lc = std::tolower( (unsigned char)c );

		if( lc >= 'a' && lc <= 'f' )
			return lc - 'a' + 10;

		return -1;
	}
	// -------------------------------------------------------------------------
	bool ModbusRTU::str2bytes( const std::string& s, std::vector<ModbusByte>& out )
	{
		out.clear();

		std::string norm(s);

		for( auto& c : norm )
		{
			if( c == ',' || c == ':' || c == '\t' || c == '\n' )
				c = ' ';
		}

		for( auto tok : explode_str(norm, ' ') )
		{
			if( tok.size() > 2 && tok[0] == '0' && (tok[1] == 'x' || tok[1] == 'X') )
				tok = tok.substr(2);

			// допускаем слитную запись "0103000A"
			if( tok.size() == 1 )
				tok = "0" + tok;

			if( tok.empty() || (tok.size() % 2) != 0 )
				return false;

			for( size_t i = 0; i < tok.size(); i += 2 )
			{
				int hi = hexval(tok[i]);
				int lo = hexval(tok[i + 1]);

				if( hi < 0 || lo < 0 )
					return false;

				out.push_back( (ModbusByte)((hi << 4) | lo) );
			}
		}

		return true;
	}
	// -------------------------------------------------------------------------
} // end of namespace rtucodec
