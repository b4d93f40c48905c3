#include "pulse/util/Config.hpp"

#include "pulse/util/Metrics.hpp"
#include "pulse/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

namespace pulse {
namespace util {

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

bool Config::loadFromFile(const std::string& path) {
  // key=value per line, '#' or ';' start comments.
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  line.reserve(Defaults::ConfigLineMax);

  char tmp[Defaults::ConfigLineMax];
  while (std::fgets(tmp, sizeof(tmp), f)) {
    line.assign(tmp);

    // Strip CR/LF
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue; // comment

    std::string key, val;
    if (!parseLineKV(s, key, val)) continue;

    if      (key == "log.level")  logLevel = parseLevel(val);
    else if (key == "log.format") logJson  = (val == "json" || val == "JSON");
    else if (key == "log.file")   logFile  = val;
    else if (key == "metrics.report_ms") {
      const long long ms  = std::strtoll(val.c_str(), nullptr, 10);
      const long long cap = std::numeric_limits<unsigned>::max();
      metricsReportMs = ms <= 0 ? 0u : static_cast<unsigned>(std::min(ms, cap));
    }
  }

  std::fclose(f);
  return true;
}

void Config::apply() const {
  auto& log = logger();
  log.setLevel(logLevel);
  log.setFormatJson(logJson);
  if (!log.setFile(logFile)) {
    log.log(LogLevel::Warn, "config.log_file.unavailable", { {"path", logFile} });
  }

  if (metricsReportMs > 0) {
    MetricRegistry::instance().startReporter(metricsReportMs);
  } else {
    MetricRegistry::instance().stopReporter();
  }
}

} // namespace util
} // namespace pulse
