#include "ToolConfig.hpp"

#include "SimpleIni.h"
#include "VortexException.hpp"

namespace vortex {
namespace {
int readInt(const CSimpleIniA &ini, const char *section, const char *key,
            int defaultValue) {
  const char *value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return defaultValue;
  }
  try {
    size_t consumed = 0;
    int result = stoi(value, &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument("trailing characters");
    }
    return result;
  } catch (const std::logic_error &le) {
    throw VortexException(VortexErrorType::INVALID_ARGUMENT,
                          string("invalid integer for [") + section + "] " +
                              key + ": '" + value + "'");
  }
}

ToolConfig fromLoadedIni(const CSimpleIniA &ini) {
  ToolConfig config;
  config.verbose = readInt(ini, "Debug", "verbose", config.verbose);
  config.silent = readInt(ini, "Debug", "silent", 0) != 0;

  const char *logdir = ini.GetValue("Debug", "logdir", NULL);
  if (logdir && strlen(logdir) > 0) {
    config.logDirectory = string(logdir);
  }

  // make sure maxLogSize is a string of int value
  int logsize = readInt(ini, "Debug", "logsize", 0);
  if (logsize > 0) {
    config.maxLogSize = to_string(logsize);
  }

  config.jsonOutput = readInt(ini, "Output", "json", 0) != 0;
  return config;
}
}  // namespace

ToolConfig ToolConfig::fromFile(const string &filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw VortexException(VortexErrorType::INVALID_ARGUMENT,
                          "Invalid config file: " + filename);
  }
  return fromLoadedIni(ini);
}

ToolConfig ToolConfig::fromIniData(const string &data) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(data);
  if (rc < 0) {
    throw VortexException(VortexErrorType::INVALID_ARGUMENT,
                          "Invalid config data");
  }
  return fromLoadedIni(ini);
}
}  // namespace vortex
