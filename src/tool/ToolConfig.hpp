#ifndef __VORTEX_TOOL_CONFIG__
#define __VORTEX_TOOL_CONFIG__

#include "Headers.hpp"

namespace vortex {
/**
 * @brief Settings for vortex-packet, read from an INI file:
 *
 *   [Debug]
 *   verbose = 0
 *   silent = 0
 *   logdir = /tmp/vortex
 *   logsize = 20971520
 *   [Output]
 *   json = 0
 *
 * Command line flags override whatever is loaded here.
 */
struct ToolConfig {
  ToolConfig()
      : verbose(0),
        silent(false),
        logDirectory(GetTempDirectory() + "vortex"),
        maxLogSize("20971520"),
        jsonOutput(false) {}

  /**
   * @throws VortexException(INVALID_ARGUMENT) if the file cannot be loaded or
   * a value is malformed.
   */
  static ToolConfig fromFile(const string &filename);
  static ToolConfig fromIniData(const string &data);

  int verbose;
  bool silent;
  string logDirectory;
  string maxLogSize;
  bool jsonOutput;
};
}  // namespace vortex

#endif  // __VORTEX_TOOL_CONFIG__
