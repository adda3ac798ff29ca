#pragma once

#include <array>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>
#include <rocksdb/utilities/transaction_db.h>

#include <hashdiff/kv.hpp>
#include <hashdiff/options.hpp>

namespace hashdiff::internal {

/**
 * RocksDB resources shared by a DB and every namespace opened from it.
 *
 * Open transactions hold `mu` shared; closing takes it exclusively, so Close
 * waits for in-flight transactions instead of pulling the database out from
 * under them.
 *
 * Column families:
 * - hashdiff_namespaces: name -> namespace id (8 bytes BE)
 * - hashdiff_committed, hashdiff_pending, hashdiff_payload,
 *   hashdiff_conflicts, hashdiff_user_data, hashdiff_meta:
 *   [namespace id: 8 BE][key] -> value
 */
struct RocksContext {
  mutable std::shared_mutex mu;
  rocksdb::TransactionDB* db = nullptr;
  std::vector<rocksdb::ColumnFamilyHandle*> handles;
  rocksdb::ColumnFamilyHandle* registry_cf = nullptr;
  std::array<rocksdb::ColumnFamilyHandle*, kNumTables> table_cfs{};

  // Copy of the DB options with info_log resolved to the logger in use.
  Options opt;
};

rocksdb::Status OpenRocksContext(const std::string& db_path,
                                 const Options& opt,
                                 std::shared_ptr<RocksContext>* out);

/** Releases RocksDB resources. Safe to call multiple times. */
void CloseRocksContext(RocksContext* ctx);

/** Open or create the named namespace. */
rocksdb::Status OpenRocksNamespace(const std::shared_ptr<RocksContext>& ctx,
                                   std::string_view name,
                                   std::shared_ptr<KvNamespace>* out);

/** Delete every entry of the named namespace and its registry row. */
rocksdb::Status DeleteRocksNamespace(const std::shared_ptr<RocksContext>& ctx,
                                     std::string_view name);

rocksdb::Status ListRocksNamespaces(const std::shared_ptr<RocksContext>& ctx,
                                    std::vector<std::string>* out);

}  // namespace hashdiff::internal
