#include "cancellation.hpp"
#include "logger.hpp"
#include "tool_runner.hpp"
#include "transfer_exceptions.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <random>
#include <stdexcept>

namespace fs = std::filesystem;

namespace xfer {

class ToolRunnerTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogConfig config;
    config.level = LogLevel::DEBUG;
    config.consoleOutput = true;
    config.fileOutput = false;
    Logger::getInstance().configure(config);

    std::random_device rd;
    dir_ = fs::temp_directory_path() / ("mongoxfer_runner_" + std::to_string(rd()));
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::string script(const std::string &name, const std::string &body) {
    auto path = dir_ / name;
    std::ofstream(path) << "#!/bin/sh\n" << body << "\n";
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
    return path.string();
  }

  fs::path dir_;
  ProcessRunner runner_{10, std::chrono::milliseconds(10)};
};

TEST_F(ToolRunnerTest, StreamsStderrLinesToHandler) {
  auto tool = script("tool.sh", "echo ignored on stdout\n"
                                "echo \"first $1\" >&2\n"
                                "printf 'second\\r\\n' >&2\n"
                                "exit 0");
  std::vector<std::string> lines;

  auto outcome = runner_.run(tool, {"arg"}, nullptr,
                             [&lines](const std::string &line) { lines.push_back(line); });

  EXPECT_TRUE(outcome.succeeded());
  EXPECT_EQ(outcome.exitCode, 0);
  EXPECT_EQ(lines, (std::vector<std::string>{"first arg", "second"}));
  EXPECT_EQ(outcome.tail.size(), 2u);
}

TEST_F(ToolRunnerTest, NonZeroExitKeepsBoundedTail) {
  auto tool = script("fail.sh", "i=1\n"
                                "while [ $i -le 15 ]; do echo \"line $i\" >&2; i=$((i+1)); done\n"
                                "exit 3");
  ProcessRunner runner(5, std::chrono::milliseconds(10));

  auto outcome = runner.run(tool, {}, nullptr, nullptr);

  EXPECT_FALSE(outcome.succeeded());
  EXPECT_FALSE(outcome.cancelled);
  EXPECT_EQ(outcome.exitCode, 3);
  ASSERT_EQ(outcome.tail.size(), 5u);
  EXPECT_EQ(outcome.tail.lines().front(), "line 11");
  EXPECT_EQ(outcome.tail.lines().back(), "line 15");
}

TEST_F(ToolRunnerTest, CancellationTerminatesTheProcess) {
  auto tool = script("slow.sh", "echo started >&2\nexec sleep 30");
  CancellationToken token("job");

  auto begin = std::chrono::steady_clock::now();
  auto outcome = runner_.run(tool, {}, &token, [&token](const std::string &line) {
    if (line == "started") {
      token.cancel();
    }
  });

  EXPECT_TRUE(outcome.cancelled);
  EXPECT_FALSE(outcome.succeeded());
  EXPECT_NE(outcome.exitCode, 0);
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(20));
}

TEST_F(ToolRunnerTest, CancellationAlsoStopsForkedHelpers) {
  // The background sleep inherits stderr and would keep the pipe open
  auto tool = script("forking.sh", "echo started >&2\nsleep 30 &\nwait");
  CancellationToken token("job");

  auto begin = std::chrono::steady_clock::now();
  auto outcome = runner_.run(tool, {}, &token, [&token](const std::string &line) {
    if (line == "started") {
      token.cancel();
    }
  });

  EXPECT_TRUE(outcome.cancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(10));
}

TEST_F(ToolRunnerTest, TimeoutAlsoStopsForkedHelpers) {
  auto tool = script("forking_hang.sh", "sleep 30 &\nwait");

  auto begin = std::chrono::steady_clock::now();
  auto outcome = runner_.run(tool, {}, nullptr, nullptr, std::chrono::milliseconds(200));

  EXPECT_TRUE(outcome.timedOut);
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(10));
}

TEST_F(ToolRunnerTest, TimeoutTerminatesTheProcess) {
  auto tool = script("hang.sh", "exec sleep 30");

  auto outcome = runner_.run(tool, {}, nullptr, nullptr, std::chrono::milliseconds(200));

  EXPECT_TRUE(outcome.timedOut);
  EXPECT_FALSE(outcome.cancelled);
  EXPECT_FALSE(outcome.succeeded());
}

TEST_F(ToolRunnerTest, HandlerFailureIsRethrownAfterExit) {
  auto tool = script("noisy.sh", "echo one >&2\necho two >&2\necho three >&2");
  int seen = 0;

  EXPECT_THROW(runner_.run(tool, {}, nullptr,
                           [&seen](const std::string &) {
                             ++seen;
                             throw std::runtime_error("observer broke");
                           }),
               std::runtime_error);
  EXPECT_EQ(seen, 1);
}

TEST_F(ToolRunnerTest, MissingExecutableIsSystemError) {
  try {
    runner_.run((dir_ / "does-not-exist").string(), {}, nullptr, nullptr);
    FAIL() << "expected SystemException";
  } catch (const SystemException &e) {
    EXPECT_EQ(e.getCode(), ErrorCode::PROCESS_ERROR);
  }
}

TEST_F(ToolRunnerTest, LocatorUsesConfiguredPath) {
  auto dump = script("mongodump", "exit 0");
  ToolLocator locator(dump, "");

  EXPECT_EQ(locator.mongodump(), dump);
}

TEST_F(ToolRunnerTest, LocatorRejectsNonExecutableConfiguredPath) {
  auto plain = dir_ / "mongorestore";
  std::ofstream(plain) << "not a program";
  fs::permissions(plain, fs::perms::owner_read | fs::perms::owner_write,
                  fs::perm_options::replace);
  ToolLocator locator("", plain.string());

  try {
    locator.mongorestore();
    FAIL() << "expected EnvironmentException";
  } catch (const EnvironmentException &e) {
    EXPECT_EQ(e.getCode(), ErrorCode::TOOL_NOT_FOUND);
    EXPECT_EQ(e.getTool(), "mongorestore");
    EXPECT_NE(e.getMessage().find(TOOL_DOWNLOAD_URL), std::string::npos);
  }
}

TEST_F(ToolRunnerTest, LocatorRejectsDirectories) {
  ToolLocator locator(dir_.string(), "");
  EXPECT_THROW(locator.mongodump(), EnvironmentException);
}

TEST_F(ToolRunnerTest, VersionIsFirstNonEmptyStdoutLine) {
  auto tool = script("mongodump", "echo\n"
                                  "echo '  mongodump version: 100.9.4  '\n"
                                  "echo 'git version: abc'");

  EXPECT_EQ(toolVersion(tool, std::chrono::milliseconds(5000)), "mongodump version: 100.9.4");
}

TEST_F(ToolRunnerTest, VersionOfUnstartableToolIsEmpty) {
  EXPECT_EQ(toolVersion((dir_ / "missing").string(), std::chrono::milliseconds(500)), "");
}

TEST_F(ToolRunnerTest, AvailabilityReportsBothTools) {
  auto dump = script("mongodump", "echo 'mongodump version: 100.9.4'");
  ToolLocator locator(dump, (dir_ / "absent").string());

  auto availability = checkToolAvailability(locator, std::chrono::milliseconds(5000));

  EXPECT_TRUE(availability.mongodump.available);
  EXPECT_EQ(availability.mongodump.path, dump);
  EXPECT_EQ(availability.mongodump.version, "mongodump version: 100.9.4");
  EXPECT_FALSE(availability.mongorestore.available);
  EXPECT_EQ(availability.installUrl, TOOL_DOWNLOAD_URL);
}

} // namespace xfer
