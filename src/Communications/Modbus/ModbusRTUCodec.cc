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
#include <sstream>
#include <iomanip>
#include "Exceptions.h"
#include "modbus/ModbusRTUCodec.h"
#include "modbus/MBLogSugar.h"
// -------------------------------------------------------------------------
namespace rtucodec
{
	// -------------------------------------------------------------------------
	using namespace std;
	using namespace ModbusRTU;
	// -------------------------------------------------------------------------
	ModbusRTUCodec::ModbusRTUCodec( ModbusAddr addr, bool _permissiveCount ):
		unitAddr(addr),
		permissiveCount(_permissiveCount)
	{
		mblog = make_shared<DebugStream>();
	}
	// -------------------------------------------------------------------------
	ModbusRTUCodec::~ModbusRTUCodec()
	{
	}
	// -------------------------------------------------------------------------
	std::shared_ptr<ModbusRTUCodec> ModbusRTUCodec::init( const std::shared_ptr<CodecConfiguration>& conf,
			const std::string& section, const std::string& prefix )
	{
		if( !conf )
			throw SystemError("(ModbusRTUCodec::init): configuration not initialized");

		xmlNode* cnode = section.empty() ? nullptr : conf->getNode(section);

		const string argAddr("--" + prefix + "-addr");
		string saddr = conf->getArgParam(argAddr, conf->getProp(cnode, "addr"));

		if( saddr.empty() )
		{
			ostringstream err;

			if( !cnode )
				err << "(ModbusRTUCodec::init): not found section <" << section << "> and " << argAddr << " not set";
			else
				err << "(ModbusRTUCodec::init): unit address not set (<" << section << " addr='..'> or " << argAddr << ")";

			throw SystemError(err.str());
		}

		long a = 0;

		if( !rtu_strtol(saddr, a) || a < 0 || a > 255 )
		{
			ostringstream err;
			err << "(ModbusRTUCodec::init): bad unit address '" << saddr << "' (must be a number in range [0..255])";
			throw OutOfRange(err.str());
		}

		bool permissive = conf->getArgPInt("--" + prefix + "-permissive-count", conf->getProp(cnode, "permissiveCount"), 0) != 0;

		auto codec = make_shared<ModbusRTUCodec>((ModbusAddr)a, permissive);
		codec->initLog(conf, prefix);

		if( codec->mblog->is_init() )
			codec->mblog->init() << "(ModbusRTUCodec::init): " << (*codec) << endl;

		return codec;
	}
	// -------------------------------------------------------------------------
	std::ostream& ModbusRTUCodec::help_print( std::ostream& os, const std::string& prefix )
	{
		os << "--" << prefix << "-addr addr              - адрес опрашиваемого устройства (0..255)" << endl;
		os << "--" << prefix << "-permissive-count [0,1] - разрешить запрос больше " << (int)MAXDATALEN << " регистров" << endl;
		os << "--" << prefix << "-add-levels levels      - уровни логов кодека (warn,level3,level9,...)" << endl;
		os << "--" << prefix << "-logfile file           - записывать логи кодека в файл" << endl;
		return os;
	}
	// -------------------------------------------------------------------------
	void ModbusRTUCodec::initLog( const std::shared_ptr<CodecConfiguration>& conf,
								  const std::string& lname, const string& logfile )
	{
		conf->initLogStream(mblog, lname);

		if( !logfile.empty() )
			mblog->logFile( logfile );
	}
	// -------------------------------------------------------------------------
	void ModbusRTUCodec::setLog( std::shared_ptr<DebugStream> l )
	{
		if( l )
			this->mblog = l;
	}
	// -------------------------------------------------------------------------
	mbErrCode ModbusRTUCodec::requestHoldingRegisters( ModbusData first, ModbusData last,
			ModbusMessage& out ) const
	{
		if( last < first )
		{
			mbwarn << "(requestHoldingRegisters): bad range: first=" << (int)first
				   << " > last=" << (int)last << endl;
			return erBadDataValue;
		}

		// [0..65535] даёт 65536 регистров, что не помещается в поле count
		size_t count = (size_t)(last - first) + 1;

		if( count > 0xffff )
		{
			mbwarn << "(requestHoldingRegisters): count=" << count << " does not fit in 16 bits" << endl;
			return erPacketTooLong;
		}

		if( count > MAXDATALEN && !permissiveCount )
		{
			mbwarn << "(requestHoldingRegisters): count=" << count
				   << " > MAXDATALEN(" << (int)MAXDATALEN << ")" << endl;
			return erPacketTooLong;
		}

		ReadOutputMessage msg(unitAddr, first, (ModbusData)count);
		out = msg.transport_msg();

		mblog9 << "(requestHoldingRegisters): " << msg << " send: " << out << endl;
		return erNoError;
	}
	// -------------------------------------------------------------------------
	mbErrCode ModbusRTUCodec::requestHoldingRegisters( ModbusData first, ModbusData last,
			std::vector<ModbusByte>& out ) const
	{
		ModbusMessage msg;
		mbErrCode ret = requestHoldingRegisters(first, last, msg);

		if( ret == erNoError )
			out = msg.bytes();

		return ret;
	}
	// -------------------------------------------------------------------------
	ReplyStatus ModbusRTUCodec::fetchHoldingRegisters( const ModbusMessage& reply,
			std::vector<ModbusData>& regs ) const
	{
		regs.clear();

		if( reply.dlen > MAXLENPACKET + szCRC )
		{
			mbwarn << "(fetchHoldingRegisters): packet too long dlen=" << reply.dlen << endl;
			return ReplyStatus(erPacketTooLong);
		}

		const size_t mlen = reply.len();

		// адрес + функция + CRC
		if( mlen < szModbusHeader + szCRC )
		{
			mbwarn << "(fetchHoldingRegisters): short packet len=" << mlen << endl;
			return ReplyStatus(erInvalidFormat);
		}

		mblog9 << "(fetchHoldingRegisters): recv: " << reply << endl;

		// Проверяем контрольную сумму
		// от начала(включая заголовок)
		// и до конца (исключив последние два байта содержащие CRC)
		const ModbusCRC tcrc = reply.pduCRC(mlen - szCRC);
		const ModbusCRC mcrc = reply.tailCRC();

		if( tcrc != mcrc )
		{
			mbwarn << "(fetchHoldingRegisters): bad crc. calc.crc=" << dat2str(tcrc)
				   << " msg.crc=" << dat2str(mcrc) << endl;

			return ReplyStatus(erBadCheckSum, tcrc, mcrc);
		}

		// Проверка от кого пришёл ответ...
		if( reply.addr() != unitAddr )
		{
			mbwarn << "(fetchHoldingRegisters): BadNodeAddress. my=" << addr2str(unitAddr)
				   << " msg.addr=" << addr2str(reply.addr()) << endl;

			return ReplyStatus(erBadReplyNodeAddress, unitAddr, reply.addr());
		}

		// обработка сообщения об ошибке...
		if( mlen >= szModbusHeader + ErrorRetMessage::szData()
				&& reply.func() == (fnReadOutputRegisters | MBErrMask) )
		{
			ErrorRetMessage em(reply);

			mbwarn << "(fetchHoldingRegisters): slave exception: " << em << endl;
			return ReplyStatus::slaveException(em.addr, em.func, em.ecode);
		}

		if( reply.func() != fnReadOutputRegisters )
		{
			mbwarn << "(fetchHoldingRegisters): unexpected func=" << b2str(reply.func())
				   << " (wait " << b2str(fnReadOutputRegisters) << ")" << endl;

			return ReplyStatus(erUnExpectedPacketType, fnReadOutputRegisters, reply.func());
		}

		// поле bcnt
		if( mlen < szModbusHeader + ReadOutputRetMessage::szHead() + szCRC )
		{
			mbwarn << "(fetchHoldingRegisters): no byte count. packet len=" << mlen << endl;
			return ReplyStatus(erInvalidFormat);
		}

		// данные не должны заходить на CRC. Лишние байты после данных не разбираются
		const size_t bcnt = ReadOutputRetMessage::getDataLen(reply);

		if( mlen < szModbusHeader + ReadOutputRetMessage::szHead() + bcnt + szCRC )
		{
			mbwarn << "(fetchHoldingRegisters): bad format: bcnt=" << bcnt
				   << " packet len=" << mlen << endl;

			return ReplyStatus(erInvalidFormat);
		}

		ReadOutputRetMessage ret(reply);
		regs = ret.values();

		mblog3 << "(fetchHoldingRegisters): " << ret << endl;
		return ReplyStatus(erNoError);
	}
	// -------------------------------------------------------------------------
	ReplyStatus ModbusRTUCodec::fetchHoldingRegisters( const std::vector<ModbusByte>& reply,
			std::vector<ModbusData>& regs ) const
	{
		return fetchHoldingRegisters(reply.data(), reply.size(), regs);
	}
	// -------------------------------------------------------------------------
	ReplyStatus ModbusRTUCodec::fetchHoldingRegisters( const ModbusByte* buf, size_t len,
			std::vector<ModbusData>& regs ) const
	{
		regs.clear();

		if( buf == nullptr || len < szModbusHeader + szCRC )
		{
			mbwarn << "(fetchHoldingRegisters): short packet len=" << len << endl;
			return ReplyStatus(erInvalidFormat);
		}

		ModbusMessage msg;
		mbErrCode err = msg.assign(buf, len);

		if( err != erNoError )
		{
			mbwarn << "(fetchHoldingRegisters): bad packet len=" << len << ": " << err << endl;
			return ReplyStatus(err);
		}

		return fetchHoldingRegisters(msg, regs);
	}
	// -------------------------------------------------------------------------
	std::ostream& operator<<( std::ostream& os, const ModbusRTUCodec& c )
	{
		return os << "addr=" << addr2str(c.unitAddr)
			   << " permissiveCount=" << c.permissiveCount;
	}
	// -------------------------------------------------------------------------
} // end of namespace rtucodec
