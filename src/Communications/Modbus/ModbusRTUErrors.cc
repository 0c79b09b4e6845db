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
#include "modbus/ModbusRTUErrors.h"
#include "RTUCodecTypes.h"
// -------------------------------------------------------------------------
namespace rtucodec
{
	// -------------------------------------------------------------------------
	using namespace ModbusRTU;
	using namespace std;
	// -------------------------------------------------------------------------
	static const char* exception_messages[] =
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

	static const size_t exception_messages_size = sizeof(exception_messages) / sizeof(exception_messages[0]);
	// -------------------------------------------------------------------------
	const char* ModbusRTU::exceptionMessage( uint8_t ecode ) noexcept
	{
		if( ecode >= exception_messages_size )
			return exception_messages[exUnknownError];

		return exception_messages[ecode];
	}
	// -------------------------------------------------------------------------
	std::string ModbusRTU::mbErr2Str( ModbusRTU::mbErrCode e )
	{
		switch( e )
		{
			case erNoError:
				return "";

			case erInvalidFormat:
				return "неправильный формат";

			case erBadCheckSum:
				return "У пакета не сошлась контрольная сумма";

			case erBadReplyNodeAddress:
				return "Ответ пришёл от станции, которую не спрашивали";

			case erUnExpectedPacketType:
				return "Неожидаемый тип пакета";

			case erPacketTooLong:
				return "пакет длинее буфера приема (или запрошено слишком много регистров)";

			case erSlaveException:
				return "устройство ответило исключением";

			case erBadDataValue:
				return "недопустимое значение";

			default:
				return "Неизвестный код ошибки";
		}
	}
	// -------------------------------------------------------------------------
	std::ostream& ModbusRTU::operator<<( std::ostream& os, mbErrCode e )
	{
		return os << "(" << (int)e << ") " << mbErr2Str(e);
	}
	// -------------------------------------------------------------------------
	std::string ReplyStatus::message() const
	{
		if( err == erSlaveException )
			return exceptionMessage(ecode);

		return mbErr2Str(err);
	}
	// -------------------------------------------------------------------------
	void ReplyStatus::check() const
	{
		if( !ok() )
			throw mbException(*this);
	}
	// -------------------------------------------------------------------------
	std::ostream& ModbusRTU::operator<<( std::ostream& os, const ReplyStatus& st )
	{
		ios_fmt_restorer ifs(os);

		os << "(" << (int)st.err << ") " << st.message();

		switch( st.err )
		{
			case erBadCheckSum:
				os << hex << showbase
				   << " calc.crc=" << st.expected
				   << " msg.crc=" << st.actual;
				break;

			case erBadReplyNodeAddress:
				os << " expected addr=" << st.expected
				   << " reply addr=" << st.actual;
				break;

			case erUnExpectedPacketType:
				os << hex << showbase
				   << " expected func=" << st.expected
				   << " reply func=" << st.actual;
				break;

			case erSlaveException:
				os << hex << showbase
				   << " addr=" << (int)st.addr
				   << " func=" << (int)st.func
				   << dec << noshowbase
				   << " ecode=" << (int)st.ecode;
				break;

			default:
				break;
		}

		return os;
	}
	// -------------------------------------------------------------------------
} // end of namespace rtucodec
