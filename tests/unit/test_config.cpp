#include <gtest/gtest.h>
#include "handoff/core/config.hpp"
#include "handoff/core/limits.hpp"
#include <fstream>
#include <filesystem>
#include <iterator>

using namespace handoff::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() / "handoff_config_test.conf";
        std::filesystem::remove(path);
    }
    
    void TearDown() override {
        std::filesystem::remove(path);
    }
    
    void write(const std::string& text) {
        std::ofstream(path) << text;
    }
    
    std::filesystem::path path;
};

TEST_F(ConfigTest, ReadsBackWhatWasSet) {
    Config config;
    config.set("transport.port", "47801");
    
    ASSERT_TRUE(config.get("transport.port").has_value());
    EXPECT_EQ(*config.get("transport.port"), "47801");
    EXPECT_FALSE(config.get("transport.address").has_value());
}

TEST_F(ConfigTest, TypedGettersParseOrFallBack) {
    Config config;
    config.set("security.pin_length", "6");
    config.set("transfer.max_session_size", "10737418240");
    config.set("log.level", "warn");
    config.set("ui.auto_approve", "yes");
    
    EXPECT_EQ(config.get_int("security.pin_length"), 6);
    EXPECT_EQ(config.get_uint64("transfer.max_session_size"), 10737418240ULL);
    EXPECT_EQ(config.get_string("log.level"), "warn");
    EXPECT_TRUE(config.get_bool("ui.auto_approve"));
    EXPECT_EQ(config.get_as<int>("security.pin_length"), 6);
    EXPECT_FALSE(config.get_as<int>("log.level").has_value());
    
    EXPECT_EQ(config.get_int("log.level", 7), 7);
    EXPECT_EQ(config.get_string("log.file", "fallback.log"), "fallback.log");
    EXPECT_TRUE(config.get_bool("missing", true));
}

TEST_F(ConfigTest, ProcessWideInstanceIsShared) {
    auto& config = Config::instance();
    config.clear();
    config.set("log.file", "shared.log");
    
    EXPECT_EQ(Config::instance().get_string("log.file"), "shared.log");
    config.clear();
    EXPECT_TRUE(Config::instance().empty());
}

TEST_F(ConfigTest, LoadsCommentsAndPaddedPairs) {
    write("# handoff\n"
          "security.max_pin_attempts=5\n"
          "  log.level =  debug  \n"
          "\n"
          "# transport.port=1\n");
    
    Config config;
    ASSERT_TRUE(config.load_from_file(path.string()));
    EXPECT_EQ(config.size(), 2u);
    EXPECT_EQ(config.get_int("security.max_pin_attempts"), 5);
    EXPECT_EQ(config.get_string("log.level"), "debug");
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    Config config;
    EXPECT_FALSE(config.load_from_file((path.parent_path() / "handoff_missing.conf").string()));
}

TEST_F(ConfigTest, SavedFileLoadsIdentically) {
    Config config;
    config.set_defaults();
    config.set("transfer.chunk_size", "4096");
    ASSERT_TRUE(config.save_to_file(path.string()));
    
    std::ifstream saved(path);
    std::string text((std::istreambuf_iterator<char>(saved)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("# security\n"), std::string::npos);
    
    Config reloaded;
    ASSERT_TRUE(reloaded.load_from_file(path.string()));
    EXPECT_EQ(reloaded.size(), config.size());
    EXPECT_EQ(reloaded.get_uint64("transfer.chunk_size"), 4096u);
    EXPECT_EQ(reloaded.get_string("log.file"), "handoff.log");
}

TEST_F(ConfigTest, DefaultsMatchLimits) {
    Config config;
    config.set_defaults();
    
    auto transfer = TransferLimits::from_config(config);
    EXPECT_EQ(transfer.chunk_size, 65536u);
    EXPECT_EQ(transfer.max_file_size, 2ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(transfer.max_session_size, 10ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(transfer.max_files_per_batch, 500u);
    
    auto security = SecurityLimits::from_config(config);
    EXPECT_EQ(security.room_code_length, 8u);
    EXPECT_EQ(security.room_code_expiry, std::chrono::hours(1));
    EXPECT_EQ(security.pin_length, 4u);
    EXPECT_EQ(security.max_pin_attempts, 3u);
    EXPECT_EQ(security.max_connection_attempts, 3u);
    EXPECT_EQ(security.connection_attempt_window, std::chrono::minutes(5));
    EXPECT_EQ(security.approval_timeout, std::chrono::seconds(30));
    EXPECT_EQ(security.heartbeat_interval, std::chrono::seconds(5));
    
    auto transport = TransportLimits::from_config(config);
    EXPECT_EQ(transport.max_reconnect_attempts, 5u);
    EXPECT_EQ(config.get_int("transport.port"), 47800);
}

TEST_F(ConfigTest, LimitsFollowOverrides) {
    Config config;
    config.set_defaults();
    config.set("transfer.chunk_size", "1024");
    config.set("security.max_pin_attempts", "5");
    config.set("security.approval_timeout_ms", "250");
    
    EXPECT_EQ(TransferLimits::from_config(config).chunk_size, 1024u);
    EXPECT_EQ(SecurityLimits::from_config(config).max_pin_attempts, 5u);
    EXPECT_EQ(SecurityLimits::from_config(config).approval_timeout, std::chrono::milliseconds(250));
}

TEST_F(ConfigTest, ZeroChunkSizeFallsBackToDefault) {
    Config config;
    config.set("transfer.chunk_size", "0");
    
    EXPECT_EQ(TransferLimits::from_config(config).chunk_size, DEFAULT_CHUNK_SIZE);
}

TEST_F(ConfigTest, MalformedLinesAreSkipped) {
    write("transfer.chunk_size=2048\n"
          "just some words\n"
          "=orphan\n"
          "log.level = debug\n");
    
    Config config;
    ASSERT_TRUE(config.load_from_file(path.string()));
    EXPECT_EQ(config.size(), 2u);
    EXPECT_EQ(config.get_uint64("transfer.chunk_size"), 2048u);
    EXPECT_EQ(config.get_string("log.level"), "debug");
}

TEST_F(ConfigTest, UnrecognizedBoolKeepsDefault) {
    Config config;
    config.set("a", "off");
    config.set("b", "maybe");
    
    EXPECT_FALSE(config.get_bool("a", true));
    EXPECT_TRUE(config.get_bool("b", true));
    EXPECT_FALSE(config.get_bool("b", false));
}

TEST_F(ConfigTest, DefaultsKeepExplicitSettings) {
    Config config;
    config.set("transport.port", "9000");
    config.set_defaults();
    
    EXPECT_EQ(config.get_int("transport.port"), 9000);
    EXPECT_EQ(config.get_string("log.file"), "handoff.log");
}

TEST_F(ConfigTest, NegativeValueIsNotAnUnsigned) {
    Config config;
    config.set("transfer.max_files_per_batch", "-1");
    
    EXPECT_EQ(config.get_uint64("transfer.max_files_per_batch", 500), 500u);
}
