#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <string>
#include <filesystem>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace pastebox::logger;

class LoggerTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path log_file;

  void SetUp() override {
    test_dir = make_temp_dir("logger_test");
    log_file = test_dir / "logs" / "pastebox.log";

    init_logging(log_file.string(), boost::log::trivial::trace);
  }

  void TearDown() override {
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();
    enable_logging();
    std::filesystem::remove_all(test_dir);
  }

  std::string log_content() {
    boost::log::core::get()->flush();
    std::ifstream file(log_file, std::ios::in | std::ios::binary);
    std::stringstream content;
    content << file.rdbuf();
    return content.str();
  }
};

TEST_F(LoggerTest, BasicLogging) {
  BOOST_LOG_TRIVIAL(info) << "Test info message";
  BOOST_LOG_TRIVIAL(error) << "Test error message";

  std::string content = log_content();
  EXPECT_NE(content.find("[info] Test info message"), std::string::npos);
  EXPECT_NE(content.find("[error] Test error message"), std::string::npos);
}

TEST_F(LoggerTest, CreatesLogDirectory) {
  BOOST_LOG_TRIVIAL(info) << "Directory test";
  EXPECT_TRUE(std::filesystem::exists(log_file));
}

TEST_F(LoggerTest, LogLevelFiltering) {
  set_log_level(boost::log::trivial::warning);

  BOOST_LOG_TRIVIAL(debug) << "Filtered debug message";
  BOOST_LOG_TRIVIAL(info) << "Filtered info message";
  BOOST_LOG_TRIVIAL(warning) << "Visible warning message";

  std::string content = log_content();
  EXPECT_EQ(content.find("Filtered debug message"), std::string::npos);
  EXPECT_EQ(content.find("Filtered info message"), std::string::npos);
  EXPECT_NE(content.find("Visible warning message"), std::string::npos);
}

TEST_F(LoggerTest, DisableAndEnable) {
  disable_logging();
  BOOST_LOG_TRIVIAL(error) << "Suppressed message";
  enable_logging();
  BOOST_LOG_TRIVIAL(error) << "Restored message";

  std::string content = log_content();
  EXPECT_EQ(content.find("Suppressed message"), std::string::npos);
  EXPECT_NE(content.find("Restored message"), std::string::npos);
}

TEST_F(LoggerTest, AppendsAcrossInitialization) {
  BOOST_LOG_TRIVIAL(info) << "First session";
  init_logging(log_file.string(), boost::log::trivial::info);
  BOOST_LOG_TRIVIAL(info) << "Second session";

  std::string content = log_content();
  EXPECT_NE(content.find("First session"), std::string::npos);
  EXPECT_NE(content.find("Second session"), std::string::npos);
}

TEST_F(LoggerTest, ParsesLevelNames) {
  severity_level level = boost::log::trivial::info;

  EXPECT_TRUE(parse_level("debug", level));
  EXPECT_EQ(level, boost::log::trivial::debug);
  EXPECT_TRUE(parse_level("fatal", level));
  EXPECT_EQ(level, boost::log::trivial::fatal);
  EXPECT_FALSE(parse_level("loud", level));
}
