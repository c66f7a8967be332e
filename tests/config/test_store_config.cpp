/**
 * @file test_store_config.cpp
 * @brief Unit tests for configuration loading and the store/logging sections
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "config/core/config_loader.hpp"
#include "config/core/exception.hpp"
#include "config/sections/logging_config.hpp"
#include "config/sections/store_config.hpp"

namespace docstore::config::test {

namespace fs = std::filesystem;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / "docstore_config_test";
        fs::create_directories(dir);
    }

    void TearDown() override { fs::remove_all(dir); }

    fs::path write(const std::string& name, const std::string& content) {
        auto path = dir / name;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    fs::path dir;
};

// ============================================================================
// loadConfigFile Tests
// ============================================================================

TEST_F(ConfigLoaderTest, LoadsObjectDocument) {
    auto path = write("ok.json",
                      R"({"docstore": {"store": {"relationalUrl": "a.db"}}})");
    auto root = loadConfigFile(path);
    EXPECT_EQ(root["docstore"]["store"]["relationalUrl"], "a.db");
}

TEST_F(ConfigLoaderTest, EmptyFileYieldsEmptyObject) {
    auto root = loadConfigFile(write("empty.json", ""));
    EXPECT_TRUE(root.is_object());
    EXPECT_TRUE(root.empty());
}

TEST_F(ConfigLoaderTest, MissingFileThrowsIoError) {
    EXPECT_THROW(loadConfigFile(dir / "missing.json"), ConfigIoError);
}

TEST_F(ConfigLoaderTest, MalformedJsonThrowsInvalidConfig) {
    EXPECT_THROW(loadConfigFile(write("bad.json", "{\"a\": ")),
                 InvalidConfigError);
}

TEST_F(ConfigLoaderTest, NonObjectRootThrowsInvalidConfig) {
    EXPECT_THROW(loadConfigFile(write("array.json", "[1, 2]")),
                 InvalidConfigError);
}

TEST_F(ConfigLoaderTest, ConfigErrorsAreAtomExceptions) {
    try {
        (void)loadConfigFile(dir / "missing.json");
        FAIL() << "Expected ConfigIoError to be thrown";
    } catch (const atom::error::Exception& e) {
        EXPECT_NE(std::string(e.what()).find("missing.json"),
                  std::string::npos);
    }
}

// ============================================================================
// StoreConfig Tests
// ============================================================================

class StoreConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnvironment(); }
    void TearDown() override { clearEnvironment(); }

    static void clearEnvironment() {
        unsetenv(StoreConfig::RELATIONAL_ENV);
        unsetenv(StoreConfig::DOCUMENT_URI_ENV);
        unsetenv(StoreConfig::DOCUMENT_DATABASE_ENV);
    }
};

TEST_F(StoreConfigTest, Defaults) {
    StoreConfig cfg;
    EXPECT_FALSE(cfg.hasRelational());
    EXPECT_FALSE(cfg.hasDocument());
    EXPECT_EQ(cfg.documentDatabase, "docstore");
    EXPECT_EQ(StoreConfig::path(), "/docstore/store");
}

TEST_F(StoreConfigTest, FromDocumentReadsSection) {
    json root = {{"docstore",
                  {{"store",
                    {{"relationalUrl", "sqlite:///var/lib/docs.db"},
                     {"documentUri", "mongodb://db:27017"},
                     {"documentDatabase", "notes"}}}}}};
    auto cfg = StoreConfig::fromDocument(root);
    EXPECT_EQ(cfg.relationalUrl, "sqlite:///var/lib/docs.db");
    EXPECT_EQ(cfg.documentUri, "mongodb://db:27017");
    EXPECT_EQ(cfg.documentDatabase, "notes");
}

TEST_F(StoreConfigTest, FromDocumentWithoutSectionUsesDefaults) {
    auto cfg = StoreConfig::fromDocument(json{{"other", 1}});
    EXPECT_TRUE(cfg == StoreConfig::defaults());
}

TEST_F(StoreConfigTest, EmptyDatabaseNameFallsBackToDefault) {
    auto cfg = StoreConfig::fromJson({{"documentDatabase", ""}});
    EXPECT_EQ(cfg.documentDatabase, "docstore");
}

TEST_F(StoreConfigTest, WrongTypeFailsTryFromJson) {
    EXPECT_FALSE(StoreConfig::tryFromJson({{"relationalUrl", 42}}).has_value());
    EXPECT_TRUE(StoreConfig::tryFromJson(json::object()).has_value());
}

TEST_F(StoreConfigTest, MistypedSectionIsInvalid) {
    json notObject = {{"docstore", {{"store", "sqlite:///x.db"}}}};
    EXPECT_THROW(StoreConfig::fromDocument(notObject), InvalidConfigError);

    json badField = {{"docstore", {{"store", {{"documentUri", 27017}}}}}};
    EXPECT_THROW(StoreConfig::fromDocument(badField), InvalidConfigError);
}

TEST_F(StoreConfigTest, EnvironmentOverridesFileValues) {
    StoreConfig cfg;
    cfg.relationalUrl = "file.db";
    cfg.documentUri = "mongodb://file:27017";

    setenv(StoreConfig::RELATIONAL_ENV, "sqlite:///env.db", 1);
    setenv(StoreConfig::DOCUMENT_DATABASE_ENV, "envdb", 1);
    cfg.applyEnvironment();

    EXPECT_EQ(cfg.relationalUrl, "sqlite:///env.db");
    EXPECT_EQ(cfg.documentUri, "mongodb://file:27017");
    EXPECT_EQ(cfg.documentDatabase, "envdb");
}

TEST_F(StoreConfigTest, EmptyEnvironmentValuesAreIgnored) {
    StoreConfig cfg;
    cfg.relationalUrl = "file.db";
    setenv(StoreConfig::RELATIONAL_ENV, "", 1);
    cfg.applyEnvironment();
    EXPECT_EQ(cfg.relationalUrl, "file.db");
}

TEST_F(StoreConfigTest, MergeKeepsUnsetValues) {
    StoreConfig base;
    base.relationalUrl = "a.db";
    StoreConfig overlay;
    overlay.documentUri = "mongodb://x";
    base.merge(overlay);
    // Empty strings are values, not nulls, so they override too
    EXPECT_EQ(base.relationalUrl, "");
    EXPECT_EQ(base.documentUri, "mongodb://x");
}

TEST_F(StoreConfigTest, SchemaListsEveryField) {
    auto schema = StoreConfig::schema();
    ASSERT_TRUE(schema.contains("properties"));
    for (const auto* key : {"relationalUrl", "documentUri", "documentDatabase"}) {
        EXPECT_TRUE(schema["properties"].contains(key)) << key;
    }
}

// ============================================================================
// LoggingConfig Tests
// ============================================================================

TEST(LoggingConfigTest, LevelNamesRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                       LogLevel::Warn, LogLevel::Error, LogLevel::Critical,
                       LogLevel::Off}) {
        EXPECT_EQ(logLevelFromString(logLevelToString(level)), level);
    }
    EXPECT_EQ(logLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(logLevelFromString("bogus"), LogLevel::Info);
}

TEST(LoggingConfigTest, FromDocumentOverridesDefaults) {
    json root = {{"docstore",
                  {{"logging",
                    {{"consoleLevel", "debug"}, {"enableFile", true}}}}}};
    auto cfg = LoggingConfig::fromDocument(root);
    EXPECT_EQ(cfg.consoleLevel, LogLevel::Debug);
    EXPECT_TRUE(cfg.enableFile);
    EXPECT_EQ(cfg.logFilename, "docstore");
    EXPECT_TRUE(cfg.enableConsole);
}

}  // namespace docstore::config::test
