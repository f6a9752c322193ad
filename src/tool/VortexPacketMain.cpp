#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "PacketFiles.hpp"
#include "PacketPrinter.hpp"
#include "ToolConfig.hpp"
#include "VortexException.hpp"

using namespace vortex;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  vortex::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, vortex::InterruptSignalHandler);

  cxxopts::Options options("vortex-packet",
                           "Builds and inspects Vortex protocol packets");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("encode", "Build a packet and write it to --out")  //
        ("decode", "Decode the packet stored in --in")      //
        ("tag", "Tag name (DownloadPiece, PieceContent, Close, Error) or code",
         cxxopts::value<std::string>())  //
        ("value", "Packet value as text",
         cxxopts::value<std::string>()->default_value(""))  //
        ("valuefile", "Read the packet value from this file",
         cxxopts::value<std::string>())  //
        ("in", "Packet file to decode", cxxopts::value<std::string>())  //
        ("out", "Where to write the encoded packet",
         cxxopts::value<std::string>())      //
        ("json", "Print decoded packets as JSON")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "vortex-packet version " << VORTEX_VERSION
                           << endl;
      exit(0);
    }

    ToolConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      config = ToolConfig::fromFile(cfgfilename);
    }

    // prioritize command line options over cfgfile
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("json")) {
      config.jsonOutput = true;
    }
    LogHandler::applyVerbosity(&defaultConf, config.verbose, config.silent);

    LogHandler::setupLogFiles(&defaultConf, config.logDirectory,
                              "vortex-packet", result.count("logtostdout") > 0,
                              config.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("vortex-packet-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    if (result.count("encode") == result.count("decode")) {
      CLOG(INFO, "stdout") << "Exactly one of --encode or --decode is required"
                           << endl
                           << options.help({}) << endl;
      exit(1);
    }

    if (result.count("encode")) {
      if (!result.count("tag") || !result.count("out")) {
        CLOG(INFO, "stdout") << "--encode requires --tag and --out" << endl;
        exit(1);
      }
      Tag tag = Tag::parse(result["tag"].as<string>());
      string value = result["value"].as<string>();
      if (result.count("valuefile")) {
        value = PacketFiles::readFile(result["valuefile"].as<string>());
      }
      shared_ptr<PacketIdGenerator> idGenerator(new SodiumPacketIdGenerator());
      Packet packet = PacketFiles::write(result["out"].as<string>(), tag,
                                         value, idGenerator);
      CLOG(INFO, "stdout") << "Wrote " << packet.toBytes().length()
                           << " bytes, packet id "
                           << int(packet.getPacketId()) << endl;
    } else {
      if (!result.count("in")) {
        CLOG(INFO, "stdout") << "--decode requires --in" << endl;
        exit(1);
      }
      Packet packet = PacketFiles::read(result["in"].as<string>());
      if (config.jsonOutput) {
        // Replace rather than throw on bytes that are not valid UTF-8
        string rendered = PacketPrinter::toJson(packet).dump(
            2, ' ', false, json::error_handler_t::replace);
        CLOG(INFO, "stdout") << rendered << endl;
      } else {
        CLOG(INFO, "stdout") << PacketPrinter::toText(packet);
      }
    }
  } catch (const cxxopts::exceptions::exception &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const VortexException &ve) {
    LOG(ERROR) << "Packet error: " << ve.what();
    CLOG(INFO, "stdout") << ve.what() << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    LOG(ERROR) << re.what();
    CLOG(INFO, "stdout") << re.what() << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
