#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace vortex;
using Catch::Matchers::StartsWith;

TEST_CASE("LogHandler creates a fresh log file per run", "[LogHandler]") {
  string logDirectory = LogHandler::createTempLogDirectory("vortex_logtest");
  REQUIRE(fs::is_directory(logDirectory));

  SECTION("Log file lives under the directory with the prefix") {
    el::Configurations conf;
    conf.setToDefault();
    string logFile = LogHandler::setupLogFiles(&conf, logDirectory + "/nested",
                                               "vortex-packet", false, "1024");
    REQUIRE(fs::exists(logFile));
    REQUIRE_THAT(fs::path(logFile).filename().string(),
                 StartsWith("vortex-packet-"));
    REQUIRE(fs::path(logFile).extension() == ".log");
    REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::Filename)
                ->value() == logFile);
    REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::ToFile)
                ->value() == "true");
    REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::MaxLogFileSize)
                ->value() == "1024");
  }

  SECTION("Temp directories are unique") {
    string other = LogHandler::createTempLogDirectory("vortex_logtest");
    REQUIRE(other != logDirectory);
    fs::remove_all(other);
  }

  fs::remove_all(logDirectory);
}

TEST_CASE("LogHandler silences the default logger", "[LogHandler]") {
  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Enabled, "true");

  LogHandler::applyVerbosity(&conf, 0, false);
  REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::Enabled)
              ->value() == "true");

  LogHandler::applyVerbosity(&conf, 0, true);
  REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::Enabled)
              ->value() == "false");
}
