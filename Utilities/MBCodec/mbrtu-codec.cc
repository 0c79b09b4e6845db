// --------------------------------------------------------------------------
#include <string>
#include <sstream>
#include <iostream>
#include <memory>
#include <getopt.h>
#include "Debug.h"
#include "Exceptions.h"
#include "CodecConfiguration.h"
#include "modbus/ModbusRTUCodec.h"
// --------------------------------------------------------------------------
using namespace rtucodec;
using namespace std;
// --------------------------------------------------------------------------
static struct option longopts[] =
{
	{ "help", no_argument, 0, 'h' },
	{ "addr", required_argument, 0, 'a' },
	{ "request", required_argument, 0, 'r' },
	{ "decode", required_argument, 0, 'd' },
	{ "crc", required_argument, 0, 'c' },
	{ "permissive-count", no_argument, 0, 'p' },
	{ "verbose", no_argument, 0, 'v' },
	{ "confile", required_argument, 0, 'x' },
	{ "section", required_argument, 0, 's' },
	{ NULL, 0, 0, 0 }
};
// --------------------------------------------------------------------------
static void print_help()
{
	printf("-h|--help                     - this message\n");
	printf("[-r|--request] first [last]   - build 0x03 request for registers first..last. Default: last=first\n");
	printf("[-d|--decode] \"hex bytes\"     - check and decode 0x03 reply (example: \"01 03 02 00 2A 39 9B\")\n");
	printf("[-c|--crc] \"hex bytes\"        - calculate CRC-16 (Modbus) of bytes\n");
	printf("[-a|--addr] addr              - unit address of slave. Default: 0x01.\n");
	printf("[-p|--permissive-count]       - allow request of more than %d registers\n", (int)ModbusRTU::MAXDATALEN);
	printf("[-v|--verbose]                - Print all messages to stderr\n");
	printf("[-x|--confile] file           - xml configuration file. Codec settings are taken from it\n");
	printf("[-s|--section] name           - section of codec settings in configuration file. Default: MBCodec\n");
	printf("\nCodec parameters (with --confile they override the section properties):\n");
	rtucodec::ModbusRTUCodec::help_print(cout);
	rtucodec::CodecConfiguration::help(cout);
	printf("Exit code: 0 - ok, 1 - codec error, 2 - bad arguments (including out of range address or register)\n");
}
// --------------------------------------------------------------------------
enum Command
{
	cmdNOP,
	cmdRequest,
	cmdDecode,
	cmdCRC
};
// --------------------------------------------------------------------------
static char* checkArg( int ind, int argc, char* argv[] );
// hex-байты могут идти одним аргументом "01 03 ..." или несколькими
static string collectHex( const char* first, int& ind, int argc, char* argv[] );
// --------------------------------------------------------------------------
int main( int argc, char** argv )
{
	Command cmd = cmdNOP;
	int optindex = 0;
	int opt = 0;
	int verb = 0;
	bool permissive = false;
	ModbusRTU::ModbusAddr addr = 0x01;
	ModbusRTU::ModbusData first = 0;
	ModbusRTU::ModbusData last = 0;
	string hexdata("");
	string confile("");
	string section("MBCodec");
	const string codecPrefix("mbcodec");

	// неизвестные параметры (--mbcodec-xxx) разбирает CodecConfiguration
	opterr = 0;

	try
	{
		while(1)
		{
			opt = getopt_long(argc, argv, "hva:r:d:c:px:s:", longopts, &optindex);

			if( opt == -1 )
				break;

			switch (opt)
			{
				case 'h':
					print_help();
					return 0;

				case 'a':
					addr = ModbusRTU::str2mbAddr(optarg);
					break;

				case 'r':
					cmd = cmdRequest;
					first = ModbusRTU::str2mbData(optarg);
					last = first;

					if( checkArg(optind, argc, argv) )
						last = ModbusRTU::str2mbData(argv[optind]);

					break;

				case 'd':
					cmd = cmdDecode;
					hexdata = collectHex(optarg, optind, argc, argv);
					break;

				case 'c':
					cmd = cmdCRC;
					hexdata = collectHex(optarg, optind, argc, argv);
					break;

				case 'p':
					permissive = true;
					break;

				case 'v':
					verb = 1;
					break;

				case 'x':
					confile = string(optarg);
					break;

				case 's':
					section = string(optarg);
					break;

				case '?':
				default:
					if( optind > 0 && string(argv[optind - 1]).find("--" + codecPrefix + "-") == 0 )
						break;

					cerr << "? argument '" << (optind > 0 ? argv[optind - 1] : "") << "'" << endl;
					return 2;
			}
		}

		if( cmd == cmdNOP )
		{
			print_help();
			return 2;
		}

		if( cmd == cmdCRC )
		{
			vector<ModbusRTU::ModbusByte> buf;

			if( !ModbusRTU::str2bytes(hexdata, buf) )
			{
				cerr << "(mbrtu-codec): bad hex data '" << hexdata << "'" << endl;
				return 2;
			}

			ModbusRTU::ModbusCRC crc = ModbusRTU::checkCRC(buf);
			cout << "crc=" << ModbusRTU::dat2str(crc)
				 << " (on wire: " << ModbusRTU::b2str(crc & 0xff)
				 << " " << ModbusRTU::b2str((crc >> 8) & 0xff) << ")" << endl;
			return 0;
		}

		std::shared_ptr<ModbusRTUCodec> codec;

		if( !confile.empty() )
		{
			auto conf = make_shared<CodecConfiguration>(argc, argv, confile);
			codec = ModbusRTUCodec::init(conf, section, codecPrefix);
		}
		else
		{
			auto conf = make_shared<CodecConfiguration>(argc, argv);
			codec = make_shared<ModbusRTUCodec>(addr, permissive);
			codec->initLog(conf, codecPrefix);
		}

		if( verb )
			codec->log()->addLevel(Debug::ANY);

		if( cmd == cmdRequest )
		{
			ModbusRTU::ModbusMessage msg;
			ModbusRTU::mbErrCode err = codec->requestHoldingRegisters(first, last, msg);

			if( err != ModbusRTU::erNoError )
			{
				cerr << "(mbrtu-codec): request error: " << err << endl;
				return 1;
			}

			cout << msg << endl;
			return 0;
		}

		// cmdDecode
		vector<ModbusRTU::ModbusByte> buf;

		if( !ModbusRTU::str2bytes(hexdata, buf) )
		{
			cerr << "(mbrtu-codec): bad hex data '" << hexdata << "'" << endl;
			return 2;
		}

		vector<ModbusRTU::ModbusData> regs;
		ModbusRTU::ReplyStatus st = codec->fetchHoldingRegisters(buf, regs);

		if( !st.ok() )
		{
			cerr << "(mbrtu-codec): reply error: " << st << endl;
			return 1;
		}

		cout << "registers: " << regs.size() << endl;

		for( size_t i = 0; i < regs.size(); i++ )
			cout << i << ": " << regs[i] << " (" << ModbusRTU::dat2str(regs[i]) << ")" << endl;

		return 0;
	}
	catch( const ModbusRTU::mbException& ex )
	{
		cerr << "(mbrtu-codec): " << ex << endl;
	}
	catch( const rtucodec::OutOfRange& ex )
	{
		// адрес или номер регистра вне диапазона
		cerr << "(mbrtu-codec): " << ex << endl;
		return 2;
	}
	catch( const rtucodec::Exception& ex )
	{
		cerr << "(mbrtu-codec): " << ex << endl;
	}
	catch( const std::exception& ex )
	{
		cerr << "(mbrtu-codec): " << ex.what() << endl;
	}

	return 1;
}
// --------------------------------------------------------------------------
char* checkArg( int i, int argc, char* argv[] )
{
	if( i < argc && (argv[i])[0] != '-' )
		return argv[i];

	return 0;
}
// --------------------------------------------------------------------------
string collectHex( const char* first, int& ind, int argc, char* argv[] )
{
	ostringstream s;
	s << first;

	while( checkArg(ind, argc, argv) )
		s << " " << argv[ind++];

	return s.str();
}
// --------------------------------------------------------------------------
