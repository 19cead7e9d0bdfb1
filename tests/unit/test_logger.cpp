#include "logger.hpp"
#include "test_support.hpp"
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace xfer {

class LoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.level = LogLevel::DEBUG;
    config_.consoleOutput = false;
    config_.fileOutput = true;
    config_.logFile = dir_.file("logs/mongoxfer.log");
  }

  void TearDown() override {
    Logger::getInstance().shutdown();
    test::configureTestLogging();
  }

  std::vector<std::string> lines() {
    Logger::getInstance().flush();
    std::vector<std::string> result;
    std::ifstream in(config_.logFile);
    std::string line;
    while (std::getline(in, line)) {
      result.push_back(line);
    }
    return result;
  }

  test::TempDirectory dir_{"mongoxfer_logger"};
  LogConfig config_;
};

TEST_F(LoggerTest, TextLineCarriesLevelComponentAndJob) {
  Logger::getInstance().configure(config_);

  EngineLogger::infoJob("Exported {} documents to {}", "export_7", 42, "/tmp/x.zip");

  auto written = lines();
  ASSERT_EQ(written.size(), 1u);
  EXPECT_NE(written[0].find("[INFO ] [TransferEngine] Exported 42 documents to /tmp/x.zip"),
            std::string::npos);
  EXPECT_NE(written[0].find("| job_id=export_7"), std::string::npos);
}

TEST_F(LoggerTest, JsonLinesAreParseable) {
  config_.format = LogFormat::JSON;
  Logger::getInstance().configure(config_);

  Logger::getInstance().warn("ToolTransfer", "archive skipped", {{"file", "b.archive"}});

  auto written = lines();
  ASSERT_EQ(written.size(), 1u);
  auto entry = nlohmann::json::parse(written[0]);
  EXPECT_EQ(entry["level"], "WARN");
  EXPECT_EQ(entry["component"], "ToolTransfer");
  EXPECT_EQ(entry["message"], "archive skipped");
  EXPECT_EQ(entry["context"]["file"], "b.archive");
}

TEST_F(LoggerTest, LevelThresholdCanBeLowered) {
  config_.level = LogLevel::WARN;
  auto &logger = Logger::getInstance();
  logger.configure(config_);

  logger.info("CommandLine", "hidden");
  logger.setLogLevel(LogLevel::DEBUG);
  logger.debug("CommandLine", "shown");

  auto written = lines();
  ASSERT_EQ(written.size(), 1u);
  EXPECT_NE(written[0].find("shown"), std::string::npos);
  EXPECT_EQ(logger.getConfig().level, LogLevel::DEBUG);
}

TEST_F(LoggerTest, ComponentFilterKeepsListedComponents) {
  config_.componentFilter = {"ToolTransfer"};
  Logger::getInstance().configure(config_);

  ToolLogger::info("kept");
  EngineLogger::info("dropped");

  auto written = lines();
  ASSERT_EQ(written.size(), 1u);
  EXPECT_NE(written[0].find("kept"), std::string::npos);
}

TEST_F(LoggerTest, MetricsCountBySeverity) {
  auto &logger = Logger::getInstance();
  logger.configure(config_);
  auto before = logger.getMetrics();

  logger.info("CommandLine", "a");
  logger.warn("CommandLine", "b");
  logger.error("CommandLine", "c");
  logger.fatalForJob("CommandLine", "d", "export_1");

  auto after = logger.getMetrics();
  EXPECT_EQ(after.totalMessages - before.totalMessages, 4u);
  EXPECT_EQ(after.warningCount - before.warningCount, 1u);
  EXPECT_EQ(after.errorCount - before.errorCount, 2u);
}

TEST_F(LoggerTest, RotationKeepsBoundedBackups) {
  config_.maxFileSize = 300;
  config_.maxBackupFiles = 2;
  Logger::getInstance().configure(config_);

  for (int i = 0; i < 30; ++i) {
    ConfigLogger::info("rotation line {} {}", i, std::string(40, 'x'));
  }
  Logger::getInstance().flush();

  EXPECT_TRUE(std::filesystem::exists(config_.logFile + ".1"));
  EXPECT_TRUE(std::filesystem::exists(config_.logFile + ".2"));
  EXPECT_FALSE(std::filesystem::exists(config_.logFile + ".3"));
  EXPECT_LE(std::filesystem::file_size(config_.logFile), 300u);
}

TEST_F(LoggerTest, AsyncWorkerDrainsOnShutdown) {
  config_.asyncLogging = true;
  auto &logger = Logger::getInstance();
  logger.configure(config_);
  EXPECT_TRUE(logger.getConfig().asyncLogging);

  for (int i = 0; i < 100; ++i) {
    CliLogger::debug("async line {}", i);
  }
  logger.shutdown();

  auto written = lines();
  ASSERT_EQ(written.size(), 100u);
  EXPECT_NE(written.back().find("async line 99"), std::string::npos);
}

TEST_F(LoggerTest, ParseLevel) {
  EXPECT_EQ(Logger::parseLevel("warning"), LogLevel::WARN);
  EXPECT_EQ(Logger::parseLevel("DEBUG"), LogLevel::DEBUG);
  EXPECT_EQ(Logger::parseLevel("fatal"), LogLevel::FATAL);
  EXPECT_EQ(Logger::parseLevel("bogus"), LogLevel::INFO);
}

} // namespace xfer
