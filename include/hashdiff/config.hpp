#pragma once

#include <string>

#include <rocksdb/env.h>

#include <hashdiff/options.hpp>

namespace hashdiff {

/**
 * File-based configuration for programs embedding hashdiff.
 *
 * Format (YAML-like):
 *   store:
 *     path: /data/hashdiff
 *     block_cache_bytes: 67108864
 *     bloom_bits_per_key: 10
 *     lock_timeout_ms: 2000
 *     max_retries: 16
 *     sync_commits: true
 *     info_log_level: info
 *
 * A top-level `db_path:` is accepted as an alias for `store.path`.
 */
struct Config {
  std::string db_path;
  Options store;

  /**
   * Load configuration from a YAML file.
   * @throws std::runtime_error if the file cannot be read or a value is invalid.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;
};

/**
 * Parse debug, info, warn, error, fatal or header.
 * @throws std::runtime_error on any other value.
 */
rocksdb::InfoLogLevel ParseInfoLogLevel(const std::string& level);

}  // namespace hashdiff
