#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "config/config.hpp"
#include "test_utils.hpp"

using namespace bucketd::config;

namespace {

Settings parse(const std::string& json) {
  std::istringstream input(json);
  return parse_config(input);
}

} // namespace

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
  Settings settings = parse("{}");
  EXPECT_EQ(settings.address, "0.0.0.0");
  EXPECT_EQ(settings.port, 8080);
  EXPECT_EQ(settings.database, "bucketd.db");
  EXPECT_TRUE(settings.log_file.empty());
  EXPECT_EQ(settings.log_level, "info");
  EXPECT_FALSE(settings.csrf.enabled());
}

TEST(ConfigTest, FieldsOverrideDefaults) {
  Settings settings = parse(R"({
    "address": "127.0.0.1",
    "port": 9090,
    "database": "/var/lib/bucketd/data.db",
    "log_file": "/var/log/bucketd.log",
    "log_level": "debug",
    "csrf": { "key": "0123456789abcdef0123456789abcdef" }
  })");

  EXPECT_EQ(settings.address, "127.0.0.1");
  EXPECT_EQ(settings.port, 9090);
  EXPECT_EQ(settings.database, "/var/lib/bucketd/data.db");
  EXPECT_EQ(settings.log_file, "/var/log/bucketd.log");
  EXPECT_EQ(settings.log_level, "debug");
  EXPECT_TRUE(settings.csrf.enabled());
  EXPECT_EQ(settings.csrf.key, "0123456789abcdef0123456789abcdef");
}

TEST(ConfigTest, CsrfKeyMustBe32Bytes) {
  EXPECT_THROW(parse(R"({"csrf": {"key": "0123456789abcdef0123456789abcde"}})"), ConfigError);
  EXPECT_THROW(parse(R"({"csrf": {"key": "0123456789abcdef0123456789abcdef0"}})"), ConfigError);
  EXPECT_NO_THROW(parse(R"({"csrf": {"key": ""}})"));
}

TEST(ConfigTest, PortOutOfRange) {
  EXPECT_THROW(parse(R"({"port": 0})"), ConfigError);
  EXPECT_THROW(parse(R"({"port": 70000})"), ConfigError);
  EXPECT_THROW(parse(R"({"port": -1})"), ConfigError);
  EXPECT_THROW(parse(R"({"port": "http"})"), ConfigError);
}

TEST(ConfigTest, RejectsUnknownLogLevel) {
  EXPECT_THROW(parse(R"({"log_level": "loud"})"), ConfigError);
}

TEST(ConfigTest, RejectsEmptyDatabasePath) {
  EXPECT_THROW(parse(R"({"database": ""})"), ConfigError);
}

TEST(ConfigTest, RejectsMalformedJson) {
  EXPECT_THROW(parse("{\"port\": "), ConfigError);
  EXPECT_THROW(parse("not json"), ConfigError);
  EXPECT_THROW(parse("[8080]"), ConfigError);
}

TEST(ConfigTest, RejectsValuesOfWrongType) {
  EXPECT_THROW(parse(R"({"address": 127})"), ConfigError);
  EXPECT_THROW(parse(R"({"csrf": "0123456789abcdef0123456789abcdef"})"), ConfigError);
  EXPECT_THROW(parse(R"({"csrf": {"key": 32}})"), ConfigError);
}

TEST(ConfigTest, ErrorMessageNamesTheProblem) {
  try {
    parse(R"({"csrf": {"key": "short"}})");
    FAIL() << "Expected ConfigError";
  } catch (const ConfigError& e) {
    std::string message = e.what();
    EXPECT_EQ(message.rfind("Config error: ", 0), 0u);
    EXPECT_NE(message.find("CSRF"), std::string::npos);
  }
}

TEST(ConfigTest, ValidateChecksOverriddenSettings) {
  Settings settings;
  EXPECT_NO_THROW(validate(settings));

  settings.log_level = "chatty";
  EXPECT_THROW(validate(settings), ConfigError);
}

class ConfigFileTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("bucketd_config_test");
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir);
  }
};

TEST_F(ConfigFileTest, LoadsFromFile) {
  auto path = test_dir / "bucketd.json";
  {
    std::ofstream file(path);
    file << R"({"port": 8443, "database": "store.db"})";
  }

  Settings settings = load_config(path.string());
  EXPECT_EQ(settings.port, 8443);
  EXPECT_EQ(settings.database, "store.db");
  EXPECT_EQ(settings.address, "0.0.0.0");
}

TEST_F(ConfigFileTest, MissingFileThrows) {
  EXPECT_THROW(load_config((test_dir / "missing.json").string()), ConfigError);
}
