#include "config_manager.hpp"
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace xfer {

class ConfigManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogConfig logConfig;
    logConfig.level = LogLevel::DEBUG;
    logConfig.consoleOutput = true;
    logConfig.fileOutput = false;
    Logger::getInstance().configure(logConfig);

    ConfigManager::getInstance().clear();
  }

  void TearDown() override { ConfigManager::getInstance().clear(); }

  ConfigManager &config() { return ConfigManager::getInstance(); }
};

TEST_F(ConfigManagerTest, FlattensNestedKeys) {
  ASSERT_TRUE(config().loadConfigFromString(R"({
    "database": {"uri": "mongodb://localhost:27017"},
    "transfer": {"poll_interval_records": 250, "archive_extension": ".archive"},
    "logging": {"async_logging": true, "component_filter": ["ToolTransfer", "NativeExporter"]}
  })"));

  EXPECT_EQ(config().getString("database.uri"), "mongodb://localhost:27017");
  EXPECT_EQ(config().getInt("transfer.poll_interval_records"), 250);
  EXPECT_TRUE(config().getBool("logging.async_logging"));
  EXPECT_EQ(config().getString("missing.key", "fallback"), "fallback");

  auto filter = config().getStringSet("logging.component_filter");
  EXPECT_EQ(filter.size(), 2u);
  EXPECT_TRUE(filter.count("ToolTransfer"));
  EXPECT_TRUE(filter.count("NativeExporter"));
}

TEST_F(ConfigManagerTest, RejectsMalformedJson) {
  EXPECT_FALSE(config().loadConfigFromString("{ not json"));
  EXPECT_FALSE(config().loadConfigFromString("[1, 2, 3]"));
}

TEST_F(ConfigManagerTest, MissingFileFails) {
  EXPECT_FALSE(config().loadConfig("/nonexistent/mongoxfer/config.json"));
}

TEST_F(ConfigManagerTest, LoadsFromFileAndReloads) {
  auto path = std::filesystem::temp_directory_path() / "mongoxfer_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"transfer": {"gzip_scan_depth": 3}})";
  }
  ASSERT_TRUE(config().loadConfig(path.string()));
  EXPECT_EQ(config().getTransferConfig().gzipScanDepth, 3);

  {
    std::ofstream out(path, std::ios::trunc);
    out << R"({"transfer": {"gzip_scan_depth": 7}})";
  }
  ASSERT_TRUE(config().reloadConfiguration());
  EXPECT_EQ(config().getTransferConfig().gzipScanDepth, 7);

  std::filesystem::remove(path);
}

TEST_F(ConfigManagerTest, TransferDefaults) {
  ASSERT_TRUE(config().loadConfigFromString("{}"));
  auto tc = config().getTransferConfig();

  EXPECT_EQ(tc, TransferConfig{});
  EXPECT_TRUE(tc.mongodumpPath.empty());
  EXPECT_EQ(tc.diagnosticTailLines, 10u);
  EXPECT_EQ(tc.previewTailLines, 20u);
  EXPECT_EQ(tc.pollIntervalRecords, 100u);
  EXPECT_EQ(tc.progressIntervalRecords, 1000u);
  EXPECT_EQ(tc.gzipScanDepth, 5);
  EXPECT_EQ(tc.archiveExtension, ".archive");
  EXPECT_EQ(tc.nativeExtension, ".zip");
  EXPECT_EQ(tc.previewTimeout, std::chrono::milliseconds(30000));
  EXPECT_TRUE(tc.validate().isValid);
}

TEST_F(ConfigManagerTest, ReadsTransferOverrides) {
  ASSERT_TRUE(config().loadConfigFromString(R"({"transfer": {
    "mongodump_path": "/opt/tools/mongodump",
    "diagnostic_tail_lines": 15,
    "progress_interval_records": 500,
    "preview_timeout_ms": 1000
  }})"));
  auto tc = config().getTransferConfig();

  EXPECT_EQ(tc.mongodumpPath, "/opt/tools/mongodump");
  EXPECT_EQ(tc.diagnosticTailLines, 15u);
  EXPECT_EQ(tc.progressIntervalRecords, 500u);
  EXPECT_EQ(tc.previewTimeout, std::chrono::milliseconds(1000));
}

TEST_F(ConfigManagerTest, NonPositiveIntervalsFallBackPerKey) {
  ASSERT_TRUE(config().loadConfigFromString(
      R"({"transfer": {"poll_interval_records": 0, "event_queue_size": -4}})"));
  auto tc = TransferConfig::fromConfig(config());

  EXPECT_EQ(tc.pollIntervalRecords, 100u);
  EXPECT_EQ(tc.eventQueueSize, 1000u);
}

TEST_F(ConfigManagerTest, InvalidTransferConfigFallsBackToDefaults) {
  ASSERT_TRUE(config().loadConfigFromString(
      R"({"transfer": {"archive_extension": "archive", "gzip_scan_depth": 2}})"));

  auto validation = TransferConfig::fromConfig(config()).validate();
  EXPECT_FALSE(validation.isValid);
  ASSERT_EQ(validation.errors.size(), 1u);
  EXPECT_NE(validation.errors[0].find("archive_extension"), std::string::npos);

  auto tc = config().getTransferConfig();
  EXPECT_EQ(tc.archiveExtension, ".archive");
  EXPECT_EQ(tc.gzipScanDepth, 5);
}

TEST_F(ConfigManagerTest, UnusualTailLengthIsOnlyAWarning) {
  TransferConfig tc;
  tc.diagnosticTailLines = 40;
  auto validation = tc.validate();

  EXPECT_TRUE(validation.isValid);
  EXPECT_EQ(validation.warnings.size(), 1u);
}

TEST_F(ConfigManagerTest, LoggingConfigFromKeys) {
  ASSERT_TRUE(config().loadConfigFromString(R"({"logging": {
    "level": "WARN", "format": "json", "file_output": true,
    "log_file": "/tmp/mongoxfer-test.log", "max_backup_files": 2
  }})"));
  auto logConfig = config().getLoggingConfig();

  EXPECT_EQ(logConfig.level, LogLevel::WARN);
  EXPECT_EQ(logConfig.format, LogFormat::JSON);
  EXPECT_TRUE(logConfig.fileOutput);
  EXPECT_EQ(logConfig.logFile, "/tmp/mongoxfer-test.log");
  EXPECT_EQ(logConfig.maxBackupFiles, 2);
  EXPECT_TRUE(config().validateConfiguration().isValid);
}

} // namespace xfer
