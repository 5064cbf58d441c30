#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <filesystem>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"

using namespace docxfer::logger;

class LoggerTest : public ::testing::Test {
protected:
  std::filesystem::path log_dir = std::filesystem::temp_directory_path() / "docxfer_logger_test";
  std::filesystem::path log_file = log_dir / "test.log";

  void SetUp() override {
    std::filesystem::remove_all(log_dir);
    std::filesystem::create_directories(log_dir);
    init_logging(log_file.string(), boost::log::trivial::trace, false);
  }

  void TearDown() override {
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();
    std::filesystem::remove_all(log_dir);
  }

  std::string log_content() {
    boost::log::core::get()->flush();
    std::ifstream file(log_file);
    std::stringstream content;
    content << file.rdbuf();
    return content.str();
  }
};

TEST_F(LoggerTest, BasicLogging) {
  BOOST_LOG_TRIVIAL(info) << "Test info message";
  BOOST_LOG_TRIVIAL(error) << "Test error message";

  std::string content = log_content();
  EXPECT_NE(content.find("Test info message"), std::string::npos);
  EXPECT_NE(content.find("Test error message"), std::string::npos);
  EXPECT_NE(content.find("[error]"), std::string::npos);
}

TEST_F(LoggerTest, ThreadLogging) {
  std::thread t([]() {
    BOOST_LOG_TRIVIAL(info) << "Message from thread";
  });
  t.join();

  EXPECT_NE(log_content().find("Message from thread"), std::string::npos);
}

TEST_F(LoggerTest, LogLevelFiltering) {
  set_log_level(boost::log::trivial::warning);

  BOOST_LOG_TRIVIAL(debug) << "Should not appear";
  BOOST_LOG_TRIVIAL(warning) << "Should appear";

  std::string content = log_content();
  EXPECT_EQ(content.find("Should not appear"), std::string::npos);
  EXPECT_NE(content.find("Should appear"), std::string::npos);
}

TEST_F(LoggerTest, ReinitializingReplacesSinks) {
  std::filesystem::path second = log_dir / "second.log";
  init_logging(second.string(), boost::log::trivial::info, false);
  BOOST_LOG_TRIVIAL(info) << "Only in second";
  boost::log::core::get()->flush();

  std::ifstream file(second);
  std::stringstream content;
  content << file.rdbuf();
  EXPECT_NE(content.str().find("Only in second"), std::string::npos);
  EXPECT_EQ(log_content().find("Only in second"), std::string::npos);
}

TEST(LogLevelTest, ParseLogLevel) {
  boost::log::trivial::severity_level level = boost::log::trivial::info;
  EXPECT_TRUE(parse_log_level("trace", level));
  EXPECT_EQ(level, boost::log::trivial::trace);
  EXPECT_TRUE(parse_log_level("warning", level));
  EXPECT_EQ(level, boost::log::trivial::warning);
  EXPECT_TRUE(parse_log_level("fatal", level));
  EXPECT_EQ(level, boost::log::trivial::fatal);
  EXPECT_FALSE(parse_log_level("verbose", level));
  EXPECT_EQ(level, boost::log::trivial::fatal);
}
