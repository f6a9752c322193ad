#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace vortex;

int main(int argc, char **argv) {
  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      vortex::LogHandler::setupLogHandler(&argc, &argv);
  vortex::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  vortex::HandleTerminate();

  string logDirectory =
      vortex::LogHandler::createTempLogDirectory("vortex_test");
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  vortex::LogHandler::setupLogFiles(&defaultConf, logDirectory, "log", false);

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  fs::remove_all(logDirectory);
  return result;
}
