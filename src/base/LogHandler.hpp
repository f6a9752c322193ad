#ifndef __VORTEX_LOG_HANDLER__
#define __VORTEX_LOG_HANDLER__

#include "Headers.hpp"

namespace vortex {
/**
 * @brief Configures easylogging++ for the vortex binaries.
 *
 * Two loggers are used: "default" for diagnostics, which goes to a log file,
 * and "stdout" for what the user asked to see (decoded packets, help text).
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Applies the verbosity settings from the command line or cfgfile.
   * A silent run disables the default logger entirely.
   */
  static void applyVerbosity(el::Configurations *defaultConf, int verbose,
                             bool silent);

  /**
   * @brief Sends the default logger to a fresh file under `path`.
   * @param maxlogsize Size in bytes after which the file is rolled out.
   * @return Full path of the created log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout = false,
                              string maxlogsize = "20971520");

  /**
   * @brief Creates a new, uniquely named directory under the temp directory.
   */
  static string createTempLogDirectory(const string &prefix);

  /**
   * @brief Removes a log file that easylogging has rolled out.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Configures the "stdout" logger used for user facing output.
   */
  static void setupStdoutLogger();

 private:
  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace vortex
#endif  // __VORTEX_LOG_HANDLER__
