#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <string>
#include <filesystem>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace jsxfer::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path dir;
    std::filesystem::path log_path;

    void SetUp() override {
        dir = jsxfer::test::make_temp_dir("jsxfer_logger");
        log_path = dir / "jsxfer.log";

        LogOptions options;
        options.level = boost::log::trivial::trace;
        options.log_file = log_path.string();
        init_logging(options);
    }

    void TearDown() override {
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        std::filesystem::remove_all(dir);
    }

    std::string log_content() {
        boost::log::core::get()->flush();
        std::ifstream file(log_path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }
};

TEST_F(LoggerTest, WritesToLogFile) {
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    const std::string content = log_content();
    EXPECT_NE(content.find("Test info message"), std::string::npos);
    EXPECT_NE(content.find("Test error message"), std::string::npos);
    EXPECT_NE(content.find("[error]"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltersMessages) {
    set_log_level(boost::log::trivial::warning);
    BOOST_LOG_TRIVIAL(debug) << "hidden debug line";
    BOOST_LOG_TRIVIAL(warning) << "visible warning line";

    const std::string content = log_content();
    EXPECT_EQ(content.find("hidden debug line"), std::string::npos);
    EXPECT_NE(content.find("visible warning line"), std::string::npos);
}

TEST_F(LoggerTest, ReinitializeAppends) {
    BOOST_LOG_TRIVIAL(info) << "first run";

    LogOptions options;
    options.log_file = log_path.string();
    init_logging(options);
    BOOST_LOG_TRIVIAL(info) << "second run";

    const std::string content = log_content();
    EXPECT_NE(content.find("first run"), std::string::npos);
    EXPECT_NE(content.find("second run"), std::string::npos);
}

TEST(SeverityTest, ParseAndPrint) {
    EXPECT_EQ(parse_severity("DEBUG"), boost::log::trivial::debug);
    EXPECT_EQ(parse_severity("warn"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_FALSE(parse_severity("verbose").has_value());

    EXPECT_STREQ(jsxfer::logging::to_string(boost::log::trivial::info), "INFO");
    EXPECT_STREQ(jsxfer::logging::to_string(boost::log::trivial::error), "ERROR");
}
