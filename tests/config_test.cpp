// Tests for hashdiff/config.hpp
// Tests: config file parsing, validation, info log levels

#include <gtest/gtest.h>

#include <hashdiff/config.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>

namespace hashdiff {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

std::string RandomSuffix() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

class TempDir {
 public:
  TempDir() {
    path_ = std::filesystem::temp_directory_path() / ("hashdiff_config_test_" + RandomSuffix());
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  std::filesystem::path path() const { return path_; }

 private:
  std::filesystem::path path_;
};

// =============================================================================
// Config Tests
// =============================================================================

class ConfigTest : public ::testing::Test {
 protected:
  std::string Write(const std::string& contents) {
    auto config_path = temp_dir_.path() / "config.yaml";
    std::ofstream out(config_path);
    out << contents;
    out.close();
    return config_path.string();
  }

  TempDir temp_dir_;
};

TEST_F(ConfigTest, DefaultValues) {
  Config config;
  EXPECT_TRUE(config.db_path.empty());
  EXPECT_EQ(config.store.lock_timeout_ms, 2000);
  EXPECT_EQ(config.store.max_retries, 16);
  EXPECT_TRUE(config.store.sync_commits);
  EXPECT_EQ(config.store.info_log_level, rocksdb::InfoLogLevel::INFO_LEVEL);
}

TEST_F(ConfigTest, LoadFromFile_Basic) {
  auto config = Config::LoadFromFile(Write("# hashdiff\n"
                                           "store:\n"
                                           "  path: \"/var/lib/hashdiff\"\n"
                                           "  block_cache_bytes: 1048576\n"
                                           "  bloom_bits_per_key: 0\n"
                                           "  lock_timeout_ms: 500\n"
                                           "  max_retries: 3\n"
                                           "  sync_commits: false\n"
                                           "  info_log_level: warn\n"));

  EXPECT_EQ(config.db_path, "/var/lib/hashdiff");
  EXPECT_EQ(config.store.block_cache_bytes, 1048576u);
  EXPECT_EQ(config.store.bloom_bits_per_key, 0);
  EXPECT_EQ(config.store.lock_timeout_ms, 500);
  EXPECT_EQ(config.store.max_retries, 3);
  EXPECT_FALSE(config.store.sync_commits);
  EXPECT_EQ(config.store.info_log_level, rocksdb::InfoLogLevel::WARN_LEVEL);
  EXPECT_NO_THROW(config.Validate());
}

TEST_F(ConfigTest, LoadFromFile_TopLevelDbPath) {
  auto config = Config::LoadFromFile(Write("db_path: '/data'\n"));
  EXPECT_EQ(config.db_path, "/data");
}

TEST_F(ConfigTest, LoadFromFile_UnknownKeysIgnored) {
  auto config = Config::LoadFromFile(Write("store:\n"
                                           "  path: /data\n"
                                           "  compression: zstd\n"
                                           "other:\n"
                                           "  path: /elsewhere\n"));
  EXPECT_EQ(config.db_path, "/data");
}

TEST_F(ConfigTest, LoadFromFile_BadNumber) {
  EXPECT_THROW(Config::LoadFromFile(Write("store:\n  max_retries: lots\n")), std::runtime_error);
  EXPECT_THROW(Config::LoadFromFile(Write("store:\n  lock_timeout_ms: -5\n")), std::runtime_error);
  EXPECT_THROW(Config::LoadFromFile(Write("store:\n  max_retries: 99999999999\n")),
               std::runtime_error);
}

TEST_F(ConfigTest, LoadFromFile_BadBool) {
  EXPECT_THROW(Config::LoadFromFile(Write("store:\n  sync_commits: maybe\n")), std::runtime_error);
}

TEST_F(ConfigTest, LoadFromFile_BadLogLevel) {
  EXPECT_THROW(Config::LoadFromFile(Write("store:\n  info_log_level: loud\n")),
               std::runtime_error);
}

TEST_F(ConfigTest, LoadFromFile_NonExistent) {
  EXPECT_THROW(Config::LoadFromFile("/nonexistent/path/config.yaml"), std::runtime_error);
}

TEST_F(ConfigTest, Validate_MissingDbPath) {
  Config config;
  EXPECT_THROW(config.Validate(), std::runtime_error);
}

TEST_F(ConfigTest, Validate_BadStoreOptions) {
  Config config;
  config.db_path = "/data";
  EXPECT_NO_THROW(config.Validate());

  config.store.max_retries = 0;
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config.store.max_retries = 1;
  config.store.lock_timeout_ms = 0;
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config.store.lock_timeout_ms = 1;
  config.store.block_cache_bytes = 0;
  EXPECT_THROW(config.Validate(), std::runtime_error);
}

TEST(InfoLogLevelTest, ParsesAllLevels) {
  EXPECT_EQ(ParseInfoLogLevel("debug"), rocksdb::InfoLogLevel::DEBUG_LEVEL);
  EXPECT_EQ(ParseInfoLogLevel("info"), rocksdb::InfoLogLevel::INFO_LEVEL);
  EXPECT_EQ(ParseInfoLogLevel("warn"), rocksdb::InfoLogLevel::WARN_LEVEL);
  EXPECT_EQ(ParseInfoLogLevel("error"), rocksdb::InfoLogLevel::ERROR_LEVEL);
  EXPECT_EQ(ParseInfoLogLevel("fatal"), rocksdb::InfoLogLevel::FATAL_LEVEL);
  EXPECT_EQ(ParseInfoLogLevel("header"), rocksdb::InfoLogLevel::HEADER_LEVEL);
  EXPECT_THROW(ParseInfoLogLevel("INFO"), std::runtime_error);
}

}  // namespace
}  // namespace hashdiff
