#pragma once

#include "pulse/Config.hpp"
#include "pulse/util/Logger.hpp"

#include <string>

namespace pulse {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if the file was read (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Push the values into logger() and MetricRegistry::instance().
  void apply() const;

  LogLevel    logLevel  = Defaults::LogLevelInit;
  bool        logJson   = Defaults::JsonLogs;
  std::string logFile;                                      // empty -> stdout
  unsigned    metricsReportMs = Defaults::MetricsReportMs;  // 0 -> no periodic reporter

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
};

} // namespace util
} // namespace pulse
