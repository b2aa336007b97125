#include "logger.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <sstream>

class LoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    logFile_ = (dir_.path() / "logs" / "test.log").string();
    config_.consoleOutput = false;
    config_.fileOutput = true;
    config_.logFile = logFile_;
    config_.level = LogLevel::DEBUG;
  }

  void TearDown() override {
    Logger::getInstance().shutdown();
    LogConfig quiet;
    quiet.consoleOutput = false;
    Logger::getInstance().configure(quiet);
  }

  std::string readLog() {
    Logger::getInstance().flush();
    std::ifstream in(logFile_);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  logpager::test::TempDirectory dir_;
  std::string logFile_;
  LogConfig config_;
};

TEST_F(LoggerTest, WritesTextLinesWithComponent) {
  Logger::getInstance().configure(config_);
  LOG_INFO("Main", "server started");
  PAGER_LOG_DEBUG("first {} count={}", "app.txt", 3);

  const auto log = readLog();
  EXPECT_NE(log.find("[INFO ] [Main] server started"), std::string::npos);
  EXPECT_NE(log.find("[DEBUG] [PageReader] first app.txt count=3"),
            std::string::npos);
}

TEST_F(LoggerTest, WritesJsonLines) {
  config_.format = LogFormat::JSON;
  Logger::getInstance().configure(config_);
  Logger::getInstance().warn("FileRepository", "quote \" and\nnewline",
                             {{"path", "/tmp/x"}});

  const auto log = readLog();
  EXPECT_NE(log.find("\"level\":\"WARN\""), std::string::npos);
  EXPECT_NE(log.find("\"component\":\"FileRepository\""), std::string::npos);
  EXPECT_NE(log.find("quote \\\" and\\nnewline"), std::string::npos);
  EXPECT_NE(log.find("\"context\":{\"path\":\"/tmp/x\"}"), std::string::npos);
}

TEST_F(LoggerTest, LevelFilterDropsLowerLevels) {
  config_.level = LogLevel::WARN;
  Logger::getInstance().configure(config_);

  EXPECT_FALSE(Logger::getInstance().isEnabled(LogLevel::INFO, "Main"));
  LOG_INFO("Main", "hidden message");
  LOG_ERROR("Main", "visible message");

  const auto log = readLog();
  EXPECT_EQ(log.find("hidden message"), std::string::npos);
  EXPECT_NE(log.find("visible message"), std::string::npos);
}

TEST_F(LoggerTest, ComponentFilterKeepsListedComponents) {
  config_.componentFilter = {"HttpServer"};
  Logger::getInstance().configure(config_);

  HTTP_LOG_INFO("listening");
  REPO_LOG_INFO("listing");

  const auto log = readLog();
  EXPECT_NE(log.find("[HttpServer] listening"), std::string::npos);
  EXPECT_EQ(log.find("[FileRepository] listing"), std::string::npos);
}

TEST_F(LoggerTest, MetricsCountWarningsAndErrors) {
  Logger::getInstance().configure(config_);
  const auto before = Logger::getInstance().getMetrics();

  LOG_WARN("Main", "w");
  LOG_ERROR("Main", "e");
  LOG_FATAL("Main", "f");

  const auto after = Logger::getInstance().getMetrics();
  EXPECT_EQ(after.warningCount - before.warningCount, 1u);
  EXPECT_EQ(after.errorCount - before.errorCount, 2u);
  EXPECT_EQ(after.totalMessages - before.totalMessages, 3u);
}

TEST_F(LoggerTest, AsyncLoggingDrainsOnShutdown) {
  config_.asyncLogging = true;
  Logger::getInstance().configure(config_);
  for (int i = 0; i < 50; ++i) {
    LOG_INFO("Main", "async line " + std::to_string(i));
  }
  Logger::getInstance().shutdown();

  std::ifstream in(logFile_);
  std::stringstream ss;
  ss << in.rdbuf();
  EXPECT_NE(ss.str().find("async line 49"), std::string::npos);
}

TEST(LoggerParseTest, ParsesLevelsAndFormats) {
  EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
  EXPECT_EQ(Logger::parseLevel("WARN"), LogLevel::WARN);
  EXPECT_EQ(Logger::parseLevel("bogus"), LogLevel::INFO);
  EXPECT_EQ(Logger::parseFormat("json"), LogFormat::JSON);
  EXPECT_EQ(Logger::parseFormat("TEXT"), LogFormat::TEXT);
  EXPECT_EQ(Logger::levelToString(LogLevel::ERROR), "ERROR");
}
