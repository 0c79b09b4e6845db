// -------------------------------------------------------------------------
#ifndef ModbusRTUCodec_H_
#define ModbusRTUCodec_H_
// -------------------------------------------------------------------------
#include <string>
#include <vector>
#include <memory>
#include "Debug.h"
#include "CodecConfiguration.h"
#include "ModbusTypes.h"
#include "ModbusRTUErrors.h"
// -------------------------------------------------------------------------
namespace rtucodec
{
	// -------------------------------------------------------------------------
	/*! Modbus RTU master: формирование запроса 0x03 и разбор ответа на него.
	    Обмен с каналом (порт, таймауты, повторы) делается снаружи:
	    кодек только превращает параметры в байты и байты в регистры.

	    Методы const и не имеют побочных эффектов, кроме записи в лог.
	*/
	class ModbusRTUCodec
	{
		public:

			/*! \param addr - адрес опрашиваемого устройства
			    \param permissiveCount - разрешить запрос больше MAXDATALEN регистров
			*/
			explicit ModbusRTUCodec( ModbusRTU::ModbusAddr addr, bool permissiveCount = false );
			virtual ~ModbusRTUCodec();

			/*! Создание по настройкам
			    <section addr="0x01" permissiveCount="0"/>
			    Параметры командной строки (приоритетнее):
			    --prefix-addr, --prefix-permissive-count

			    \throw SystemError - если не найдена секция и не задан --prefix-addr
			    \throw OutOfRange - если адрес вне диапазона 0..255
			*/
			static std::shared_ptr<ModbusRTUCodec> init( const std::shared_ptr<CodecConfiguration>& conf,
					const std::string& section, const std::string& prefix = "mbcodec" );

			static std::ostream& help_print( std::ostream& os, const std::string& prefix = "mbcodec" );

			// ------------- Modbus-функции ----------------------------------------
			/*! Формирование запроса чтения регистров (0x03)
			    \param first - первый регистр
			    \param last - последний регистр (включительно)
			    \param out - сформированный пакет (8 байт). При ошибке не изменяется.
			    \return erNoError
			    \return erBadDataValue - last < first
			    \return erPacketTooLong - больше MAXDATALEN регистров (если не включён permissiveCount)
			*/
			ModbusRTU::mbErrCode requestHoldingRegisters( ModbusRTU::ModbusData first, ModbusRTU::ModbusData last,
					ModbusRTU::ModbusMessage& out ) const;

			ModbusRTU::mbErrCode requestHoldingRegisters( ModbusRTU::ModbusData first, ModbusRTU::ModbusData last,
					std::vector<ModbusRTU::ModbusByte>& out ) const;

			/*! Проверка и разбор ответа на запрос 0x03.
			    Проверки (до первой ошибки): CRC, адрес, ответ-исключение, код функции, формат данных.
			    \param regs - прочитанные регистры (очищается при каждом вызове, заполняется только при успехе)
			*/
			ModbusRTU::ReplyStatus fetchHoldingRegisters( const ModbusRTU::ModbusMessage& reply,
					std::vector<ModbusRTU::ModbusData>& regs ) const;

			ModbusRTU::ReplyStatus fetchHoldingRegisters( const std::vector<ModbusRTU::ModbusByte>& reply,
					std::vector<ModbusRTU::ModbusData>& regs ) const;

			ModbusRTU::ReplyStatus fetchHoldingRegisters( const ModbusRTU::ModbusByte* buf, size_t len,
					std::vector<ModbusRTU::ModbusData>& regs ) const;

			inline ModbusRTU::ModbusAddr getUnitAddress() const noexcept
			{
				return unitAddr;
			}

			inline bool isPermissiveCount() const noexcept
			{
				return permissiveCount;
			}

			void initLog( const std::shared_ptr<CodecConfiguration>& conf, const std::string& name, const std::string& logfile = "" );
			void setLog( std::shared_ptr<DebugStream> l );

			inline std::shared_ptr<DebugStream> log() noexcept
			{
				return mblog;
			}

			friend std::ostream& operator<<( std::ostream& os, const ModbusRTUCodec& c );

		protected:

			const ModbusRTU::ModbusAddr unitAddr;
			const bool permissiveCount;

			std::shared_ptr<DebugStream> mblog;
	};
	// -------------------------------------------------------------------------
} // end of namespace rtucodec
// -------------------------------------------------------------------------
#endif // ModbusRTUCodec_H_
// -------------------------------------------------------------------------
