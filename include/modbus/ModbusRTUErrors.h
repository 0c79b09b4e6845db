#ifndef ModbusRTUErrors_H_
#define ModbusRTUErrors_H_
// -------------------------------------------------------------------------
#include <cstdint>
#include <string>
#include <iostream>
#include "Exceptions.h"
// -------------------------------------------------------------------------
namespace rtucodec
{
	// -------------------------------------------------------------------------
	namespace ModbusRTU
	{
		/*! Результат построения запроса или разбора ответа.
		    Коды не пересекаются с кодами исключений, присылаемых устройством
		    (их значение хранится отдельно, см. ReplyStatus::ecode).
		*/
		enum mbErrCode
		{
			erNoError               = 0,   /*!< нет ошибок */
			erInvalidFormat         = 111, /*!< неправильный формат (короткий пакет, не сошлось число байт) */
			erBadCheckSum           = 112, /*!< У пакета не сошлась контрольная сумма */
			erBadReplyNodeAddress   = 113, /*!< Ответ пришёл от станции, которую не спрашивали */
			erPacketTooLong         = 115, /*!< запрошено слишком много регистров или пакет длиннее буфера */
			erUnExpectedPacketType  = 117, /*!< Неожидаемый тип пакета (ошибка кода функции) */
			erSlaveException        = 118, /*!< устройство ответило исключением (см. ecode) */
			erBadDataValue          = 119  /*!< недопустимые параметры запроса */
		};

		std::string mbErr2Str( mbErrCode e );
		std::ostream& operator<<( std::ostream& os, mbErrCode e );

		/*! Коды исключений, присылаемых устройством (индексы таблицы сообщений) */
		enum ExceptionCode
		{
			exUnknownError       = 0,
			exIllegalFunction    = 1,
			exIllegalDataAddress = 2,
			exIllegalDataValue   = 3,
			exSlaveDeviceFailure = 4,
			exAcknowledge        = 5,
			exSlaveDeviceBusy    = 6,
			exMemoryParityError  = 7
		};

		/*! текст исключения по его коду.
		    Коды вне таблицы (>7) дают "Unknown error".
		*/
		const char* exceptionMessage( uint8_t ecode ) noexcept;

		// ---------------------------------------------------------------------
		/*! Подробности ошибки обмена.
		    expected/actual заполняются для erBadCheckSum (вычисленная и принятая CRC),
		    erBadReplyNodeAddress (адреса) и erUnExpectedPacketType (коды функций).
		    Для erSlaveException заполняются addr, func (как в ответе, со старшим битом)
		    и ecode.
		*/
		struct ReplyStatus
		{
			ReplyStatus() noexcept {}
			ReplyStatus( mbErrCode e ) noexcept: err(e) {}
			ReplyStatus( mbErrCode e, uint16_t _expected, uint16_t _actual ) noexcept:
				err(e), expected(_expected), actual(_actual) {}

			static ReplyStatus slaveException( uint8_t _addr, uint8_t _func, uint8_t code ) noexcept
			{
				ReplyStatus st(erSlaveException);
				st.addr = _addr;
				st.func = _func;
				st.ecode = code;
				return st;
			}

			mbErrCode err = { erNoError };
			uint16_t expected = { 0 };
			uint16_t actual = { 0 };
			uint8_t addr = { 0 };
			uint8_t func = { 0 };
			uint8_t ecode = { 0 };

			inline bool ok() const noexcept
			{
				return err == erNoError;
			}

			/*! текст ошибки. Для erSlaveException - сообщение из таблицы исключений */
			std::string message() const;

			/*! выбросить mbException, если есть ошибка */
			void check() const;
		};

		std::ostream& operator<<( std::ostream& os, const ReplyStatus& st );
		// ---------------------------------------------------------------------
		class mbException:
			public rtucodec::Exception
		{
			public:
				mbException():
					rtucodec::Exception("mbException"), err(ModbusRTU::erNoError) {}
				mbException( ModbusRTU::mbErrCode err ):
					rtucodec::Exception(mbErr2Str(err)), err(err), status(err) {}
				mbException( const ReplyStatus& st ):
					rtucodec::Exception(st.message()), err(st.err), status(st) {}

				ModbusRTU::mbErrCode err;
				ReplyStatus status;

				friend std::ostream& operator<<(std::ostream& os, const mbException& ex )
				{
					return os << "(" << (int)ex.err << ") " << ex.what();
				}
		};
		// ---------------------------------------------------------------------
	} // end of namespace ModbusRTU
	// -------------------------------------------------------------------------
} // end of namespace rtucodec
// -------------------------------------------------------------------------
#endif // ModbusRTUErrors_H_
// -------------------------------------------------------------------------
