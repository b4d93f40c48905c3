#include "pulse/Config.hpp"
#include "pulse/util/Config.hpp"
#include "pulse/util/Logger.hpp"
#include "pulse/util/Metrics.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

using namespace pulse::util;

namespace {

std::string writeTemp(const std::string& name, const std::string& body) {
    auto p = (std::filesystem::temp_directory_path() / name).string();
    std::ofstream out(p, std::ios::trunc);
    out << body;
    return p;
}

} // namespace

TEST(ConfigTest, Defaults) {
    Config cfg;
    EXPECT_EQ(cfg.logLevel, pulse::Defaults::LogLevelInit);
    EXPECT_EQ(cfg.logLevel, LogLevel::Info);
    EXPECT_EQ(cfg.logJson, pulse::Defaults::JsonLogs);
    EXPECT_TRUE(cfg.logFile.empty());
    EXPECT_EQ(cfg.metricsReportMs, pulse::Defaults::MetricsReportMs);
}

TEST(ConfigTest, MissingFileReturnsFalse) {
    Config cfg;
    EXPECT_FALSE(cfg.loadFromFile("/nonexistent-dir/pulse.conf"));
    EXPECT_EQ(cfg.logLevel, LogLevel::Info);
}

TEST(ConfigTest, ParsesKnownKeysAndSkipsNoise) {
    auto p = writeTemp("pulse_config_parse.conf",
        "# comment\n"
        "; also a comment\n"
        "\n"
        "  log.level = debug  \r\n"
        "log.format=json\n"
        "log.file = /tmp/pulse.log\n"
        "metrics.report_ms = 250\n"
        "no_equals_sign_here\n"
        "unknown.key = whatever\n");

    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(p));
    EXPECT_EQ(cfg.logLevel, LogLevel::Debug);
    EXPECT_TRUE(cfg.logJson);
    EXPECT_EQ(cfg.logFile, "/tmp/pulse.log");
    EXPECT_EQ(cfg.metricsReportMs, 250u);

    std::filesystem::remove(p);
}

TEST(ConfigTest, NegativeReportPeriodDisablesReporter) {
    auto p = writeTemp("pulse_config_negative.conf", "metrics.report_ms=-5\n");
    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(p));
    EXPECT_EQ(cfg.metricsReportMs, 0u);
    std::filesystem::remove(p);
}

TEST(ConfigTest, OversizedReportPeriodIsClamped) {
    auto p = writeTemp("pulse_config_oversized.conf", "metrics.report_ms=5000000000\n");
    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(p));
    EXPECT_EQ(cfg.metricsReportMs, std::numeric_limits<unsigned>::max());
    std::filesystem::remove(p);
}

TEST(ConfigTest, ApplyConfiguresLoggerAndReporter) {
    auto& log = logger();
    const auto savedLevel = log.level();

    Config cfg;
    cfg.logLevel = LogLevel::Error;
    cfg.metricsReportMs = 50;
    cfg.apply();

    EXPECT_EQ(log.level(), LogLevel::Error);
    EXPECT_TRUE(MetricRegistry::instance().reporterRunning());

    Config off;
    off.logLevel = savedLevel;
    off.apply();
    EXPECT_FALSE(MetricRegistry::instance().reporterRunning());
    EXPECT_EQ(log.level(), savedLevel);
}
