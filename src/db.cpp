#include <hashdiff/db.hpp>

#include <utility>

#include <hashdiff/rocks_kv.hpp>

namespace hashdiff {

DB::DB(std::shared_ptr<internal::RocksContext> ctx) : ctx_(std::move(ctx)) {}

DB::~DB() { Close(); }

rocksdb::Status DB::Open(const std::string& db_path,
                         std::unique_ptr<DB>* out,
                         const Options& opt) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (db_path.empty()) return rocksdb::Status::InvalidArgument("db_path is empty");
  if (opt.lock_timeout_ms <= 0) {
    return rocksdb::Status::InvalidArgument("lock_timeout_ms must be positive");
  }
  if (opt.max_retries <= 0) {
    return rocksdb::Status::InvalidArgument("max_retries must be positive");
  }
  if (opt.bloom_bits_per_key < 0) {
    return rocksdb::Status::InvalidArgument("bloom_bits_per_key must not be negative");
  }

  std::shared_ptr<internal::RocksContext> ctx;
  rocksdb::Status s = internal::OpenRocksContext(db_path, opt, &ctx);
  if (!s.ok()) return s;

  *out = std::unique_ptr<DB>(new DB(std::move(ctx)));
  return rocksdb::Status::OK();
}

rocksdb::Status DB::OpenDifferential(std::string_view name, std::unique_ptr<Differential>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::shared_ptr<KvNamespace> ns;
  rocksdb::Status s = internal::OpenRocksNamespace(ctx_, name, &ns);
  if (!s.ok()) return s;

  // ctx_->opt carries the resolved info log.
  *out = std::make_unique<Differential>(std::move(ns), ctx_->opt);
  return rocksdb::Status::OK();
}

rocksdb::Status DB::DeleteDifferential(std::string_view name) {
  return internal::DeleteRocksNamespace(ctx_, name);
}

rocksdb::Status DB::ListDifferentials(std::vector<std::string>* names) const {
  return internal::ListRocksNamespaces(ctx_, names);
}

void DB::Close() { internal::CloseRocksContext(ctx_.get()); }

}  // namespace hashdiff
