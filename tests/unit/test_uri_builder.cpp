#include "logger.hpp"
#include "transfer_exceptions.hpp"
#include "uri_builder.hpp"
#include <gtest/gtest.h>

namespace xfer {

namespace {

class FakeProbe : public AuthMechanismProbe {
public:
  std::vector<std::string> mechanisms;
  bool fail = false;
  int calls = 0;
  std::string lastNamespace;

  std::vector<std::string>
  saslSupportedMechanisms(const std::string &userNamespace,
                          std::chrono::milliseconds) override {
    ++calls;
    lastNamespace = userNamespace;
    if (fail) {
      throw createSystemError(ErrorCode::DATABASE_ERROR, "FakeProbe",
                              "server selection timeout");
    }
    return mechanisms;
  }
};

} // namespace

class UriBuilderTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogConfig config;
    config.level = LogLevel::DEBUG;
    config.consoleOutput = true;
    config.fileOutput = false;
    Logger::getInstance().configure(config);
  }

  FakeProbe mechanisms_;
  ToolUriBuilder builder_{&mechanisms_, std::chrono::milliseconds(100)};
};

TEST_F(UriBuilderTest, DatabaseSegment) {
  EXPECT_EQ(uri::databaseSegment("mongodb://h:27017/app"), "app");
  EXPECT_EQ(uri::databaseSegment("mongodb://u:p@h1,h2/app?replicaSet=rs"), "app");
  EXPECT_EQ(uri::databaseSegment("mongodb://h:27017/"), "");
  EXPECT_EQ(uri::databaseSegment("mongodb://h:27017"), "");
  EXPECT_EQ(uri::databaseSegment("mongodb://h/?authSource=admin"), "");
}

TEST_F(UriBuilderTest, StripMovesDatabaseToAuthSource) {
  EXPECT_EQ(uri::stripDatabase("mongodb://u:p@h:27017/app"),
            "mongodb://u:p@h:27017/?authSource=app");
  EXPECT_EQ(uri::stripDatabase("mongodb://u:p@h/app?replicaSet=rs"),
            "mongodb://u:p@h/?authSource=app&replicaSet=rs");
}

TEST_F(UriBuilderTest, StripMovesDatabaseWithoutCredentialsToo) {
  EXPECT_EQ(uri::stripDatabase("mongodb://h:27017/app"), "mongodb://h:27017/?authSource=app");
}

TEST_F(UriBuilderTest, StripKeepsExistingAuthSource) {
  EXPECT_EQ(uri::stripDatabase("mongodb://u:p@h/app?authSource=admin"),
            "mongodb://u:p@h/?authSource=admin");
}

TEST_F(UriBuilderTest, StripWithoutDatabaseIsUnchanged) {
  EXPECT_EQ(uri::stripDatabase("mongodb://h:27017"), "mongodb://h:27017");
  EXPECT_EQ(uri::stripDatabase("mongodb://h:27017/"), "mongodb://h:27017/");
}

TEST_F(UriBuilderTest, StripIsIdempotent) {
  for (const std::string input :
       {"mongodb://u:p@h/app", "mongodb://h/app?ssl=true",
        "mongodb+srv://u:p@cluster.example.net/reports"}) {
    auto once = uri::stripDatabase(input);
    EXPECT_EQ(uri::stripDatabase(once), once) << input;
  }
}

TEST_F(UriBuilderTest, UsernameIsDecoded) {
  EXPECT_EQ(uri::username("mongodb://app%40corp:pw@h/db"), "app@corp");
  EXPECT_EQ(uri::username("mongodb://reader@h"), "reader");
  EXPECT_EQ(uri::username("mongodb://h:27017"), "");
}

TEST_F(UriBuilderTest, QueryParamLookup) {
  const std::string s = "mongodb://h/?authSource=admin&AUTHMECHANISM=SCRAM-SHA-1&tls";
  EXPECT_EQ(uri::queryParam(s, "authSource"), "admin");
  EXPECT_EQ(uri::queryParam(s, "authMechanism"), "SCRAM-SHA-1");
  EXPECT_EQ(uri::queryParam(s, "tls"), "");
  EXPECT_FALSE(uri::queryParam(s, "replicaSet").has_value());
}

TEST_F(UriBuilderTest, AppendQueryParam) {
  EXPECT_EQ(uri::appendQueryParam("mongodb://h", "a", "1"), "mongodb://h?a=1");
  EXPECT_EQ(uri::appendQueryParam("mongodb://h/?x=y", "a", "1"), "mongodb://h/?x=y&a=1");
  EXPECT_EQ(uri::appendQueryParam("mongodb://h/?", "a", "1"), "mongodb://h/?a=1");
}

TEST_F(UriBuilderTest, PrefersStrongestScram) {
  EXPECT_EQ(preferredAuthMechanism({"SCRAM-SHA-1", "SCRAM-SHA-256"}), "SCRAM-SHA-256");
  EXPECT_EQ(preferredAuthMechanism({"SCRAM-SHA-1"}), "SCRAM-SHA-1");
  EXPECT_EQ(preferredAuthMechanism({"PLAIN"}), "");
  EXPECT_EQ(preferredAuthMechanism({}), "");
}

TEST_F(UriBuilderTest, NegotiatesMechanismForCredentials) {
  mechanisms_.mechanisms = {"SCRAM-SHA-1", "SCRAM-SHA-256"};

  auto result = builder_.build("mongodb://alice:pw@h/app", std::nullopt);

  EXPECT_EQ(result, "mongodb://alice:pw@h/app?authMechanism=SCRAM-SHA-256");
  EXPECT_EQ(mechanisms_.calls, 1);
  EXPECT_EQ(mechanisms_.lastNamespace, "app.alice");
}

TEST_F(UriBuilderTest, LookupUsesAuthSourceThenAdmin) {
  mechanisms_.mechanisms = {"SCRAM-SHA-1"};

  builder_.build("mongodb://alice:pw@h/app?authSource=users", std::nullopt);
  EXPECT_EQ(mechanisms_.lastNamespace, "users.alice");

  builder_.build("mongodb://alice:pw@h", std::nullopt);
  EXPECT_EQ(mechanisms_.lastNamespace, "admin.alice");
}

TEST_F(UriBuilderTest, ExplicitMechanismIsNeverTouched) {
  mechanisms_.mechanisms = {"SCRAM-SHA-256"};
  const std::string stored = "mongodb://alice:pw@h/?authMechanism=SCRAM-SHA-1";

  EXPECT_EQ(builder_.build(stored, std::nullopt), stored);
  EXPECT_EQ(mechanisms_.calls, 0);
}

TEST_F(UriBuilderTest, NoCredentialsSkipsLookup) {
  EXPECT_EQ(builder_.build("mongodb://h:27017/app", std::nullopt), "mongodb://h:27017/app");
  EXPECT_EQ(mechanisms_.calls, 0);
}

TEST_F(UriBuilderTest, LookupFailureKeepsStoredUri) {
  mechanisms_.fail = true;
  const std::string stored = "mongodb://alice:pw@h/app";

  EXPECT_EQ(builder_.build(stored, std::nullopt), stored);
  EXPECT_EQ(mechanisms_.calls, 1);
}

TEST_F(UriBuilderTest, NoScramOfferedKeepsStoredUri) {
  mechanisms_.mechanisms = {"MONGODB-X509"};
  EXPECT_EQ(builder_.build("mongodb://alice:pw@h", std::nullopt), "mongodb://alice:pw@h");
}

TEST_F(UriBuilderTest, TargetDatabaseStripsSegment) {
  mechanisms_.mechanisms = {"SCRAM-SHA-256"};

  auto result = builder_.build("mongodb://alice:pw@h/app", std::string("other"));

  EXPECT_EQ(result, "mongodb://alice:pw@h/?authSource=app&authMechanism=SCRAM-SHA-256");
}

TEST_F(UriBuilderTest, NullLookupLeavesUriAlone) {
  ToolUriBuilder builder(nullptr, std::chrono::milliseconds(10));
  EXPECT_EQ(builder.build("mongodb://alice:pw@h/app", std::nullopt), "mongodb://alice:pw@h/app");
}

} // namespace xfer
