#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

#include <hashdiff/differential.hpp>
#include <hashdiff/options.hpp>

namespace hashdiff {

namespace internal {
struct RocksContext;
}  // namespace internal

/**
 * hashdiff::DB
 *
 * A RocksDB store holding any number of named differentials. Each
 * differential is an isolated namespace; deleting one never touches another.
 *
 * Thread-safe. Differentials opened from a DB keep working until Close(),
 * after which their operations return InvalidArgument("db is closed").
 */
class DB {
 public:
  ~DB();

  DB(const DB&) = delete;
  DB& operator=(const DB&) = delete;

  /**
   * Open or create a hashdiff store at db_path.
   *
   * This uses RocksDB TransactionDB and creates required column families:
   * - hashdiff_namespaces
   * - hashdiff_committed
   * - hashdiff_pending
   * - hashdiff_payload
   * - hashdiff_conflicts
   * - hashdiff_user_data
   * - hashdiff_meta
   */
  static rocksdb::Status Open(const std::string& db_path,
                              std::unique_ptr<DB>* out,
                              const Options& opt = Options{});

  /** Open the named differential, creating it if needed. */
  rocksdb::Status OpenDifferential(std::string_view name, std::unique_ptr<Differential>* out);

  /** Delete a differential and all its state. NotFound if absent. */
  rocksdb::Status DeleteDifferential(std::string_view name);

  rocksdb::Status ListDifferentials(std::vector<std::string>* names) const;

  /**
   * Close the store and release RocksDB resources. Waits for in-flight
   * transactions. Safe to call multiple times.
   */
  void Close();

 private:
  explicit DB(std::shared_ptr<internal::RocksContext> ctx);

  std::shared_ptr<internal::RocksContext> ctx_;
};

}  // namespace hashdiff
