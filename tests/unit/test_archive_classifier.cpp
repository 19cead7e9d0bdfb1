#include "archive_classifier.hpp"
#include "logger.hpp"
#include "transfer_exceptions.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <random>

namespace fs = std::filesystem;

namespace xfer {

class ArchiveClassifierTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogConfig config;
    config.level = LogLevel::DEBUG;
    config.consoleOutput = true;
    config.fileOutput = false;
    Logger::getInstance().configure(config);

    std::random_device rd;
    root_ = fs::temp_directory_path() /
            ("mongoxfer_classifier_" + std::to_string(rd()));
    fs::create_directories(root_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  fs::path touch(const fs::path &relative, const std::string &content = "x") {
    auto path = root_ / relative;
    fs::create_directories(path.parent_path());
    std::ofstream(path) << content;
    return path;
  }

  fs::path root_;
  ArchiveClassifier classifier_;
};

TEST_F(ArchiveClassifierTest, RegularFileIsArchive) {
  auto file = touch("backup.archive");
  auto source = classifier_.classify(file);

  EXPECT_EQ(source.kind, ImportSourceKind::ARCHIVE);
  EXPECT_EQ(source.path, file);
  EXPECT_FALSE(source.gzip);
}

TEST_F(ArchiveClassifierTest, AnyRegularFileIsTreatedAsArchive) {
  auto source = classifier_.classify(touch("dump.bin"));
  EXPECT_EQ(source.kind, ImportSourceKind::ARCHIVE);
}

TEST_F(ArchiveClassifierTest, DirectoryWithArchivesIsArchiveDirectory) {
  touch("batch/shop.orders.archive");
  touch("batch/shop.users.ARCHIVE");
  touch("batch/notes.txt");

  auto source = classifier_.classify(root_ / "batch");
  EXPECT_EQ(source.kind, ImportSourceKind::ARCHIVE_DIRECTORY);
}

TEST_F(ArchiveClassifierTest, ListArchivesIsSortedAndFiltered) {
  touch("batch/b.archive");
  touch("batch/a.archive");
  touch("batch/readme.md");
  fs::create_directories(root_ / "batch" / "nested.archive");

  auto archives = classifier_.listArchives(root_ / "batch");

  ASSERT_EQ(archives.size(), 2u);
  EXPECT_EQ(archives[0].filename(), "a.archive");
  EXPECT_EQ(archives[1].filename(), "b.archive");
}

TEST_F(ArchiveClassifierTest, PlainDumpDirectory) {
  touch("dump/shop/orders.bson");
  touch("dump/shop/orders.metadata.json");

  auto source = classifier_.classify(root_ / "dump");
  EXPECT_EQ(source.kind, ImportSourceKind::DUMP_DIRECTORY);
  EXPECT_FALSE(source.gzip);
}

TEST_F(ArchiveClassifierTest, GzipDumpDirectory) {
  touch("dump/shop/orders.bson.gz");
  touch("dump/shop/orders.metadata.json.gz");

  auto source = classifier_.classify(root_ / "dump");
  EXPECT_EQ(source.kind, ImportSourceKind::DUMP_DIRECTORY);
  EXPECT_TRUE(source.gzip);
}

TEST_F(ArchiveClassifierTest, GzipScanDepthIsBounded) {
  ArchiveClassifier shallow(".archive", 2);
  touch("near/db/coll.bson.gz");
  touch("far/a/b/coll.bson.gz");

  EXPECT_TRUE(shallow.containsGzipPayload(root_ / "near"));
  EXPECT_FALSE(shallow.containsGzipPayload(root_ / "far"));
  EXPECT_TRUE(classifier_.containsGzipPayload(root_ / "far"));
}

TEST_F(ArchiveClassifierTest, SymlinkedDirectoriesAreNotEntered) {
  touch("elsewhere/db/coll.bson.gz");
  fs::create_directories(root_ / "dump");
  fs::create_directory_symlink(root_ / "elsewhere", root_ / "dump" / "link");

  EXPECT_FALSE(classifier_.containsGzipPayload(root_ / "dump"));
}

TEST_F(ArchiveClassifierTest, CustomExtension) {
  ArchiveClassifier custom(".dump", 5);
  touch("batch/one.dump");

  EXPECT_EQ(custom.classify(root_ / "batch").kind, ImportSourceKind::ARCHIVE_DIRECTORY);
  EXPECT_EQ(classifier_.classify(root_ / "batch").kind, ImportSourceKind::DUMP_DIRECTORY);
}

TEST_F(ArchiveClassifierTest, MissingPathIsValidationError) {
  try {
    classifier_.classify(root_ / "missing");
    FAIL() << "expected ValidationException";
  } catch (const ValidationException &e) {
    EXPECT_EQ(e.getField(), "inputPath");
    EXPECT_NE(e.getMessage().find("missing"), std::string::npos);
  }
}

TEST_F(ArchiveClassifierTest, ScanListsRegularFilesWithSizes) {
  touch("incoming/b.archive", "12345");
  touch("incoming/a.archive", "12");
  fs::create_directories(root_ / "incoming" / "subdir");

  auto entries = scanImportDirectory(root_ / "incoming");

  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].name, "a.archive");
  EXPECT_EQ(entries[0].size, 2u);
  EXPECT_EQ(entries[1].name, "b.archive");
  EXPECT_EQ(entries[1].size, 5u);
}

TEST_F(ArchiveClassifierTest, ScanOfMissingDirectoryFails) {
  EXPECT_THROW(scanImportDirectory(root_ / "nope"), SystemException);
}

TEST_F(ArchiveClassifierTest, KindNames) {
  EXPECT_EQ(importSourceKindToString(ImportSourceKind::ARCHIVE), "archive");
  EXPECT_EQ(importSourceKindToString(ImportSourceKind::ARCHIVE_DIRECTORY), "archive-directory");
  EXPECT_EQ(importSourceKindToString(ImportSourceKind::DUMP_DIRECTORY), "dump-directory");
}

} // namespace xfer
