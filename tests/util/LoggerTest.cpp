#include "pulse/util/Logger.hpp"
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace pulse::util;

// Helper: a Logger writing to a scratch file that is removed afterwards.
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("pulse_logger_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".log")).string();
        std::filesystem::remove(path_);
        ASSERT_TRUE(log_.setFile(path_));
    }

    void TearDown() override {
        log_.setFile("");
        std::filesystem::remove(path_);
    }

    std::vector<std::string> lines() {
        std::ifstream in(path_);
        std::vector<std::string> out;
        for (std::string l; std::getline(in, l);) out.push_back(l);
        return out;
    }

    std::string path_;
    Logger      log_;
};

TEST_F(LoggerTest, TextLineCarriesLevelMessageAndFields) {
    log_.log(LogLevel::Info, "ticker.start", {{"interval_us", "5000"}});

    auto ls = lines();
    ASSERT_EQ(ls.size(), 1u);
    EXPECT_NE(ls[0].find("INFO"), std::string::npos);
    EXPECT_NE(ls[0].find("ticker.start"), std::string::npos);
    EXPECT_NE(ls[0].find("interval_us=5000"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltersLowerSeverities) {
    log_.setLevel(LogLevel::Warn);
    EXPECT_FALSE(log_.enabled(LogLevel::Info));
    EXPECT_TRUE(log_.enabled(LogLevel::Error));

    log_.log(LogLevel::Debug, "dropped");
    log_.log(LogLevel::Info, "dropped");
    log_.log(LogLevel::Warn, "kept");
    log_.log(LogLevel::Error, "kept");

    auto ls = lines();
    ASSERT_EQ(ls.size(), 2u);
    EXPECT_NE(ls[0].find("WARN"), std::string::npos);
    EXPECT_NE(ls[1].find("ERROR"), std::string::npos);
}

TEST_F(LoggerTest, JsonLinesAreValidAndEscaped) {
    log_.setFormatJson(true);
    log_.log(LogLevel::Error, "say \"hi\"\nbye", {{"path", "C:\\tmp"}});

    auto ls = lines();
    ASSERT_EQ(ls.size(), 1u);

    rapidjson::Document doc;
    doc.Parse(ls[0].c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsObject());
    EXPECT_STREQ(doc["lvl"].GetString(), "ERROR");
    EXPECT_STREQ(doc["msg"].GetString(), "say \"hi\"\nbye");
    EXPECT_STREQ(doc["path"].GetString(), "C:\\tmp");
    EXPECT_TRUE(doc.HasMember("ts"));
}

TEST_F(LoggerTest, ScopedContextIsAddedAndRestored) {
    log_.setFormatJson(true);
    {
        Logger::Scoped outer(std::vector<Field>{{"ticker", "a"}});
        {
            Logger::Scoped inner(std::vector<Field>{{"ticker", "b"}, {"phase", "reset"}});
            log_.log(LogLevel::Info, "inner");
        }
        log_.log(LogLevel::Info, "outer");
    }
    log_.log(LogLevel::Info, "none");

    auto ls = lines();
    ASSERT_EQ(ls.size(), 3u);

    rapidjson::Document d0, d1, d2;
    d0.Parse(ls[0].c_str());
    d1.Parse(ls[1].c_str());
    d2.Parse(ls[2].c_str());
    ASSERT_FALSE(d0.HasParseError() || d1.HasParseError() || d2.HasParseError());

    EXPECT_STREQ(d0["ticker"].GetString(), "b");
    EXPECT_STREQ(d0["phase"].GetString(), "reset");
    EXPECT_STREQ(d1["ticker"].GetString(), "a");
    EXPECT_FALSE(d1.HasMember("phase"));
    EXPECT_FALSE(d2.HasMember("ticker"));
}

TEST_F(LoggerTest, ScopedRepeatedKeyLeavesNothingBehind) {
    log_.setFormatJson(true);
    {
        Logger::Scoped s(std::vector<Field>{{"ticker", "a"}, {"ticker", "b"}});
        log_.log(LogLevel::Info, "inside");
    }
    log_.log(LogLevel::Info, "after");

    auto ls = lines();
    ASSERT_EQ(ls.size(), 2u);

    rapidjson::Document d0, d1;
    d0.Parse(ls[0].c_str());
    d1.Parse(ls[1].c_str());
    ASSERT_FALSE(d0.HasParseError() || d1.HasParseError());
    EXPECT_STREQ(d0["ticker"].GetString(), "b");
    EXPECT_FALSE(d1.HasMember("ticker"));
}

TEST_F(LoggerTest, UnopenableFileFallsBackToStdout) {
    EXPECT_FALSE(log_.setFile("/nonexistent-dir/pulse.log"));
    log_.log(LogLevel::Info, "to stdout");
    EXPECT_TRUE(lines().empty());
}

TEST(LogLevelTest, ParseLevel) {
    EXPECT_EQ(parseLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLevel("warn"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("Error"), LogLevel::Error);
    EXPECT_EQ(parseLevel("bogus"), LogLevel::Info);
    EXPECT_STREQ(levelName(LogLevel::Warn), "WARN");
}
