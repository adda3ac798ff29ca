#include <hashdiff/config.hpp>

#include <fstream>
#include <limits>
#include <stdexcept>

namespace hashdiff {

namespace {

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

uint64_t ParseUnsigned(const std::string& key, const std::string& value) {
  if (value.empty() || value[0] == '-') {
    throw std::runtime_error("Invalid value for " + key + ": " + value);
  }
  try {
    size_t used = 0;
    unsigned long long v = std::stoull(value, &used);
    if (used != value.size()) {
      throw std::runtime_error("Invalid value for " + key + ": " + value);
    }
    return v;
  } catch (const std::logic_error&) {
    // std::stoull reports bad input as invalid_argument or out_of_range.
    throw std::runtime_error("Invalid value for " + key + ": " + value);
  }
}

int ParseInt(const std::string& key, const std::string& value) {
  uint64_t v = ParseUnsigned(key, value);
  if (v > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("Value out of range for " + key + ": " + value);
  }
  return static_cast<int>(v);
}

bool ParseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  throw std::runtime_error("Invalid boolean for " + key + ": " + value);
}

}  // namespace

rocksdb::InfoLogLevel ParseInfoLogLevel(const std::string& level) {
  if (level == "debug") return rocksdb::InfoLogLevel::DEBUG_LEVEL;
  if (level == "info") return rocksdb::InfoLogLevel::INFO_LEVEL;
  if (level == "warn") return rocksdb::InfoLogLevel::WARN_LEVEL;
  if (level == "error") return rocksdb::InfoLogLevel::ERROR_LEVEL;
  if (level == "fatal") return rocksdb::InfoLogLevel::FATAL_LEVEL;
  if (level == "header") return rocksdb::InfoLogLevel::HEADER_LEVEL;
  throw std::runtime_error("Invalid info_log_level: " + level +
                           " (must be debug, info, warn, error, fatal, or header)");
}

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;

  while (std::getline(file, line)) {
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) continue;

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    if (current_section == "store") {
      if (key == "path") {
        config.db_path = value;
      } else if (key == "block_cache_bytes") {
        config.store.block_cache_bytes = ParseUnsigned(key, value);
      } else if (key == "bloom_bits_per_key") {
        config.store.bloom_bits_per_key = ParseInt(key, value);
      } else if (key == "lock_timeout_ms") {
        config.store.lock_timeout_ms = ParseInt(key, value);
      } else if (key == "max_retries") {
        config.store.max_retries = ParseInt(key, value);
      } else if (key == "sync_commits") {
        config.store.sync_commits = ParseBool(key, value);
      } else if (key == "info_log_level") {
        config.store.info_log_level = ParseInfoLogLevel(value);
      }
    } else if (current_section.empty()) {
      // Top-level keys
      if (key == "db_path") {
        config.db_path = value;
      }
    }
  }

  return config;
}

void Config::Validate() const {
  if (db_path.empty()) {
    throw std::runtime_error("db_path is required (store.path in the config file)");
  }
  if (store.block_cache_bytes == 0) {
    throw std::runtime_error("block_cache_bytes must be positive");
  }
  if (store.lock_timeout_ms <= 0) {
    throw std::runtime_error("lock_timeout_ms must be positive");
  }
  if (store.max_retries <= 0) {
    throw std::runtime_error("max_retries must be positive");
  }
  if (store.bloom_bits_per_key < 0) {
    throw std::runtime_error("bloom_bits_per_key must not be negative");
  }
}

}  // namespace hashdiff
