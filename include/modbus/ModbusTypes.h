// -------------------------------------------------------------------------
#ifndef ModbusTypes_H_
#define ModbusTypes_H_
// -------------------------------------------------------------------------
#include <ostream>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "ModbusRTUErrors.h"
// -------------------------------------------------------------------------
/* Порядок байт в кадре RTU:
 * - адрес регистра, количество и значения регистров: старший байт первым;
 * - CRC-16 (по всему кадру, от адреса узла): младший байт первым.
*/
// -------------------------------------------------------------------------
namespace rtucodec
{
	// -------------------------------------------------------------------------
	namespace ModbusRTU
	{
		typedef uint8_t ModbusByte;
		typedef uint8_t ModbusAddr;    /*!< адрес устройства (unit id) */
		typedef uint16_t ModbusData;   /*!< значение или номер регистра */
		typedef uint16_t ModbusCRC;

		// ---------------------------------------------------------------------
		/*! функция, которую умеет кодек */
		enum SlaveFunctionCode
		{
			fnReadOutputRegisters = 0x03  /*!< read holding registers */
		};

		enum
		{
			/*! место под данные кадра: 512 - адрес и функция(2) - CRC(2) */
			MAXLENPACKET = 508,
			/*! больше 125 регистров не помещается в однобайтовое поле bcnt ответа */
			MAXDATALEN = 125
		};

		/*! бит, которым устройство помечает ответ-исключение (0x03 -> 0x83) */
		const uint8_t MBErrMask = 0x80;
		// ---------------------------------------------------------------------
		/*! перестановка байт слова (порядок сети <-> порядок хоста) */
		uint16_t SWAPSHORT( uint16_t x );
		// ---------------------------------------------------------------------
		/*! CRC-16/MODBUS: полином 0xA001 (отражённый 0x8005), начальное значение 0xFFFF */
		ModbusCRC checkCRC( const ModbusByte* start, size_t len );
		ModbusCRC checkCRC( const std::vector<ModbusByte>& buf );
		const size_t szCRC = sizeof(ModbusCRC);
		// ---------------------------------------------------------------------
		/*! байты кадра в hex через пробел: "01 03 00 0a" */
		std::ostream& mbPrintMessage( std::ostream& os, const ModbusByte* b, size_t len );
		// -------------------------------------------------------------------------
		/*! \throw OutOfRange - не число или вне диапазона 0..255 (0..65535 для str2mbData) */
		ModbusAddr str2mbAddr( const std::string& val );
		ModbusData str2mbData( const std::string& val );

		// "0x000a", "0x01", "0x83"
		std::string dat2str( const ModbusData dat );
		std::string addr2str( const ModbusAddr addr );
		std::string b2str( const ModbusByte b );

		/*! Строка байт "01 03 0x02 00 2A" или "0103022A" (hex; разделители пробел, запятая, ':') -> out.
		    \return false, если встретилось не hex-значение (out тогда заполнен частично)
		*/
		bool str2bytes( const std::string& s, std::vector<ModbusByte>& out );
		// -------------------------------------------------------------------------
		/*! первые два байта любого кадра */
		struct ModbusHeader
		{
			ModbusAddr addr;
			ModbusByte func;

			ModbusHeader(): addr(0), func(0) {}
		} __attribute__((packed));

		const size_t szModbusHeader = sizeof(ModbusHeader);

		std::ostream& operator<<( std::ostream& os, const ModbusHeader& m );
		// -----------------------------------------------------------------------

		/*! Кадр "как на линии": заголовок, данные и CRC подряд.
		    Именно такие кадры кодек отдаёт и принимает.
		*/
		struct ModbusMessage
		{
			ModbusMessage();

			ModbusMessage( ModbusMessage&& ) = default;
			ModbusMessage& operator=( ModbusMessage&& ) = default;
			ModbusMessage( const ModbusMessage& ) = default;
			ModbusMessage& operator=( const ModbusMessage& ) = default;

			inline ModbusByte func() const { return pduhead.func; }
			inline ModbusAddr addr() const { return pduhead.addr; }

			/*! начало кадра (адрес) и его полная длина */
			const ModbusByte* buf() const;
			size_t len() const;

			/*! CRC первых clen байт кадра */
			ModbusCRC pduCRC( size_t clen ) const;

			/*! CRC из двух последних байт кадра (младший первым) */
			ModbusCRC tailCRC() const;

			/*! скопировать кадр из буфера
			    \return erNoError, erInvalidFormat (меньше 2 байт) или erPacketTooLong
			*/
			mbErrCode assign( const ModbusByte* b, size_t len );
			mbErrCode assign( const std::vector<ModbusByte>& v );

			std::vector<ModbusByte> bytes() const;

			/*! 512 */
			static size_t maxSizeOfMessage();

			void clear();

			ModbusHeader pduhead;
			ModbusByte data[MAXLENPACKET + szCRC];

			/*! сколько байт data занято (вместе с CRC); в кадр не входит */
			size_t dlen = { 0 };
		} __attribute__((packed));

		std::ostream& operator<<( std::ostream& os, const ModbusMessage& m );
		// -----------------------------------------------------------------------
		/*! Ответ-исключение: addr, func|0x80, ecode, CRC */
		struct ErrorRetMessage:
			public ModbusHeader
		{
			ModbusByte ecode = { 0 };
			ModbusCRC crc = { 0 };

			// разбор принятого кадра
			ErrorRetMessage( const ModbusMessage& m );
			void init( const ModbusMessage& m );

			// формирование (для тестов и эмуляции устройства)
			ErrorRetMessage( ModbusAddr _from, ModbusByte _func, ModbusByte ecode );
			ModbusMessage transport_msg();

			/*! ecode + CRC */
			inline static size_t szData() { return sizeof(ModbusByte) + szCRC; }
		};

		std::ostream& operator<<( std::ostream& os, const ErrorRetMessage& m );
		// -----------------------------------------------------------------------
		/*! Запрос 0x03: addr, 0x03, start(BE), count(BE), CRC */
		struct ReadOutputMessage:
			public ModbusHeader
		{
			ModbusData start = { 0 };
			ModbusData count = { 0 };
			ModbusCRC crc = { 0 };

			ReadOutputMessage( ModbusAddr addr, ModbusData start, ModbusData count );
			/*! кадр для отправки (CRC считается здесь) */
			ModbusMessage transport_msg();

			// разбор готового кадра запроса
			ReadOutputMessage( const ModbusMessage& m );
			void init( const ModbusMessage& m );

			/*! start + count + CRC */
			inline static size_t szData() { return sizeof(ModbusData) * 2 + szCRC; }

		} __attribute__((packed));

		std::ostream& operator<<( std::ostream& os, const ReadOutputMessage& m );
		// -----------------------------------------------------------------------
		/*! Ответ на 0x03: addr, 0x03, bcnt, bcnt/2 регистров (BE), CRC */
		struct ReadOutputRetMessage:
			public ModbusHeader
		{
			ModbusByte bcnt = { 0 };
			ModbusData data[MAXLENPACKET / sizeof(ModbusData)];  /*!< в порядке хоста */

			// разбор принятого кадра
			ReadOutputRetMessage( const ModbusMessage& m );
			void init( const ModbusMessage& m );

			/*! поле bcnt между заголовком и данными */
			static inline size_t szHead() { return sizeof(ModbusByte); }

			/*! значение bcnt из кадра (0 для пустого кадра) */
			static size_t getDataLen( const ModbusMessage& m );
			ModbusCRC crc = { 0 };

			// формирование ответа (для тестов и эмуляции устройства)
			ReadOutputRetMessage( ModbusAddr _from );

			/*! \return false - уже MAXDATALEN регистров */
			bool addData( ModbusData d );
			void clear();

			inline bool isFull() const { return ( count >= MAXDATALEN ); }

			/*! bcnt + данные + CRC */
			size_t szData() const;

			ModbusMessage transport_msg();

			/*! регистры в порядке следования в кадре */
			std::vector<ModbusData> values() const;

			/*! число регистров в data; в кадр не входит */
			size_t count = { 0 };
		};

		std::ostream& operator<<( std::ostream& os, const ReadOutputRetMessage& m );
		// -----------------------------------------------------------------------
	} // end of namespace ModbusRTU
	// -------------------------------------------------------------------------
} // end of namespace rtucodec
// -------------------------------------------------------------------------
#endif // ModbusTypes_H_
// -------------------------------------------------------------------------
