#include "progress_parser.hpp"
#include <gtest/gtest.h>

namespace xfer {

class ProgressParserTest : public ::testing::Test {};

TEST_F(ProgressParserTest, DumpDoneLine) {
  auto matches = matchToolLine(
      "2024-05-01T10:00:00.000+0000\tdone dumping shop.orders (1523 documents)");

  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].kind, ToolLineKind::DUMP_DONE);
  EXPECT_EQ(matches[0].database, "shop");
  EXPECT_EQ(matches[0].collection, "orders");
  EXPECT_EQ(matches[0].count, 1523);
}

TEST_F(ProgressParserTest, DottedCollectionNamesSplitAtFirstDot) {
  auto matches = matchToolLine("done dumping admin.system.version (1 document)");

  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].database, "admin");
  EXPECT_EQ(matches[0].collection, "system.version");
  EXPECT_EQ(matches[0].count, 1);
}

TEST_F(ProgressParserTest, RestoreFinishedLine) {
  auto matches = matchToolLine("finished restoring shop.users (40 documents, 2 failures)");

  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].kind, ToolLineKind::RESTORE_FINISHED);
  EXPECT_EQ(matches[0].database, "shop");
  EXPECT_EQ(matches[0].collection, "users");
  EXPECT_EQ(matches[0].count, 40);
  EXPECT_EQ(matches[0].failures, 2);
}

TEST_F(ProgressParserTest, SummaryLineCarriesTwoShapes) {
  auto matches = matchToolLine(
      "42 document(s) restored successfully. 3 document(s) failed to restore.");

  ASSERT_EQ(matches.size(), 2u);
  EXPECT_EQ(matches[0].kind, ToolLineKind::RESTORE_SUCCEEDED);
  EXPECT_EQ(matches[0].count, 42);
  EXPECT_EQ(matches[1].kind, ToolLineKind::RESTORE_FAILED);
  EXPECT_EQ(matches[1].count, 3);
}

TEST_F(ProgressParserTest, ArchivePreludeLine) {
  auto matches = matchToolLine("archive prelude shop.orders");

  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].kind, ToolLineKind::ARCHIVE_PRELUDE);
  EXPECT_EQ(matches[0].database, "shop");
  EXPECT_EQ(matches[0].collection, "orders");
}

TEST_F(ProgressParserTest, UnmatchedLinesAreOpaque) {
  EXPECT_TRUE(matchToolLine("writing shop.orders to archive").empty());
  EXPECT_TRUE(matchToolLine("").empty());
  EXPECT_TRUE(matchToolLine("connected to: mongodb://localhost/").empty());
}

TEST_F(ProgressParserTest, ErrorLines) {
  EXPECT_TRUE(isToolErrorLine("continuing through error: E11000 duplicate key"));
  EXPECT_TRUE(isToolErrorLine("Failed: error connecting to db server"));
  EXPECT_FALSE(isToolErrorLine("finished restoring shop.users (40 documents, 0 failures)"));
}

TEST_F(ProgressParserTest, DiagnosticTailKeepsMostRecentLines) {
  DiagnosticTail tail(3);
  for (int i = 1; i <= 5; ++i) {
    tail.push("line " + std::to_string(i));
  }

  EXPECT_EQ(tail.size(), 3u);
  EXPECT_EQ(tail.lines(), (std::vector<std::string>{"line 3", "line 4", "line 5"}));

  tail.clear();
  EXPECT_TRUE(tail.empty());
}

TEST_F(ProgressParserTest, DiagnosticTailMasksCredentials) {
  DiagnosticTail tail(10);
  tail.push("error connecting to mongodb://root:topsecret@db:27017");
  tail.push("Failed: exit");

  EXPECT_EQ(tail.maskedText(), "error connecting to mongodb://root:***@db:27017\nFailed: exit");
  EXPECT_EQ(tail.lines()[0], "error connecting to mongodb://root:topsecret@db:27017");
}

TEST_F(ProgressParserTest, ZeroCapacityTailStillKeepsLastLine) {
  DiagnosticTail tail(0);
  tail.push("a");
  tail.push("b");
  EXPECT_EQ(tail.lines(), (std::vector<std::string>{"b"}));
}

TEST_F(ProgressParserTest, DumpAccumulatorCountsNamespaces) {
  DumpAccumulator dump;

  EXPECT_FALSE(dump.consume("writing shop.orders to archive").has_value());
  auto first = dump.consume("done dumping shop.orders (3 documents)");
  auto second = dump.consume("done dumping shop.users (0 documents)");

  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->collection, "users");
  EXPECT_EQ(dump.namespacesDone(), 2);
  EXPECT_EQ(dump.recordsDumped(), 3);
}

TEST_F(ProgressParserTest, RestoreAccumulatorBuildsBreakdown) {
  RestoreAccumulator restore;

  auto finished = restore.consume("finished restoring shop.orders (3 documents, 0 failures)");
  restore.consume("finished restoring crm.leads (5 documents, 1 failure)");
  restore.consume("finished restoring shop.users (2 documents, 0 failures)");

  ASSERT_TRUE(finished.has_value());
  EXPECT_EQ(finished->count, 3);

  const auto &result = restore.result();
  EXPECT_EQ(result.recordsInserted, 10);
  EXPECT_EQ(result.recordsFailed, 1);
  ASSERT_EQ(result.databases.size(), 2u);
  EXPECT_EQ(result.databases[0].name, "shop");
  ASSERT_EQ(result.databases[0].collections.size(), 2u);
  EXPECT_EQ(result.databases[0].collections[1].name, "users");
  EXPECT_EQ(result.databases[1].name, "crm");
  EXPECT_EQ(result.databases[1].collections[0].recordsFailed, 1);
}

TEST_F(ProgressParserTest, RestoreSummaryOverridesRunningTotals) {
  RestoreAccumulator restore;
  restore.consume("finished restoring shop.orders (3 documents, 0 failures)");
  restore.consume("4 document(s) restored successfully. 1 document(s) failed to restore.");

  EXPECT_EQ(restore.result().recordsInserted, 4);
  EXPECT_EQ(restore.result().recordsFailed, 1);
}

TEST_F(ProgressParserTest, RestoreErrorsAreMaskedAndDeduplicated) {
  RestoreAccumulator restore;
  restore.consume("continuing through error: E11000 duplicate key error");
  restore.consume("continuing through error: E11000 duplicate key error");
  restore.consume("Failed: cannot reach mongodb://u:pw@h");

  auto result = restore.takeResult();
  ASSERT_EQ(result.errors.size(), 2u);
  EXPECT_EQ(result.errors[0], "continuing through error: E11000 duplicate key error");
  EXPECT_EQ(result.errors[1], "Failed: cannot reach mongodb://u:***@h");
}

TEST_F(ProgressParserTest, RestoreErrorListIsCapped) {
  RestoreAccumulator restore;
  const int lines = 20000;
  for (int i = 0; i < lines; ++i) {
    restore.consume("continuing through error: E11000 duplicate key error dup key: { _id: " +
                    std::to_string(i) + " }");
  }
  restore.consume("continuing through error: E11000 duplicate key error dup key: { _id: 0 }");

  auto result = restore.takeResult();
  ASSERT_EQ(result.errors.size(), ImportResult::MAX_ERRORS);
  EXPECT_EQ(result.errors.front(),
            "continuing through error: E11000 duplicate key error dup key: { _id: 0 }");
  EXPECT_EQ(result.omittedErrors, lines - static_cast<int64_t>(ImportResult::MAX_ERRORS));
}

TEST_F(ProgressParserTest, MergeKeepsCapAndOmittedCount) {
  ImportResult first;
  for (size_t i = 0; i < ImportResult::MAX_ERRORS; ++i) {
    first.addError("first " + std::to_string(i));
  }
  ImportResult second;
  second.addError("first 0");
  second.addError("second");
  second.omittedErrors = 3;

  first.merge(second);

  EXPECT_EQ(first.errors.size(), ImportResult::MAX_ERRORS);
  EXPECT_EQ(first.omittedErrors, 4);
}

TEST_F(ProgressParserTest, PreviewDeduplicatesInFirstSeenOrder) {
  PreviewAccumulator preview;

  EXPECT_TRUE(preview.consume("archive prelude shop.orders"));
  EXPECT_TRUE(preview.consume("archive prelude crm.leads"));
  EXPECT_FALSE(preview.consume("archive prelude shop.orders"));
  EXPECT_TRUE(preview.consume("archive prelude shop.users"));
  EXPECT_FALSE(preview.consume("restoring shop.orders from archive"));

  const auto &result = preview.preview();
  EXPECT_FALSE(preview.empty());
  EXPECT_EQ(result.namespaceCount(), 3u);
  ASSERT_EQ(result.databases.size(), 2u);
  EXPECT_EQ(result.databases[0].name, "shop");
  ASSERT_EQ(result.databases[0].collections.size(), 2u);
  EXPECT_EQ(result.databases[0].collections[0].name, "orders");
  EXPECT_EQ(result.databases[0].collections[1].name, "users");
  EXPECT_EQ(result.databases[1].name, "crm");
}

} // namespace xfer
