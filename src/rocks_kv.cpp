#include <hashdiff/rocks_kv.hpp>

#include <mutex>
#include <utility>

#include <rocksdb/cache.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/iterator.h>
#include <rocksdb/table.h>
#include <rocksdb/utilities/transaction.h>

#include <hashdiff/internal.hpp>
#include <hashdiff/version.hpp>

namespace hashdiff::internal {

namespace {

static constexpr const char* kNamespacesCF = "hashdiff_namespaces";
static constexpr const char* kTableCFs[kNumTables] = {
    "hashdiff_committed", "hashdiff_pending",   "hashdiff_payload",
    "hashdiff_conflicts", "hashdiff_user_data", "hashdiff_meta",
};

// Next namespace id, in the default column family.
static constexpr const char* kNextNamespaceIdKey = "hashdiff.next_namespace_id";

// Helper: build a ColumnFamilyOptions with shared cache + bloom
rocksdb::ColumnFamilyOptions MakeCFOptions(const std::shared_ptr<rocksdb::Cache>& cache,
                                           int bloom_bits_per_key) {
  rocksdb::BlockBasedTableOptions table;
  table.block_cache = cache;
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(bloom_bits_per_key, false));
  table.whole_key_filtering = true;

  rocksdb::ColumnFamilyOptions cfo;
  cfo.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));
  return cfo;
}

rocksdb::Slice ToSlice(std::string_view s) { return rocksdb::Slice(s.data(), s.size()); }

class RocksCursor final : public KvCursor {
 public:
  RocksCursor(std::unique_ptr<rocksdb::Iterator> it, std::string prefix)
      : it_(std::move(it)), prefix_(std::move(prefix)) {}

  void SeekToFirst() override { it_->Seek(prefix_); }

  void Seek(std::string_view key) override {
    std::string k = prefix_;
    k.append(key.data(), key.size());
    it_->Seek(k);
  }

  bool Valid() const override {
    return it_->Valid() && it_->key().starts_with(prefix_);
  }

  void Next() override { it_->Next(); }

  std::string_view key() const override {
    rocksdb::Slice k = it_->key();
    return std::string_view(k.data() + prefix_.size(), k.size() - prefix_.size());
  }

  std::string_view value() const override {
    rocksdb::Slice v = it_->value();
    return std::string_view(v.data(), v.size());
  }

  rocksdb::Status status() const override { return it_->status(); }

 private:
  std::unique_ptr<rocksdb::Iterator> it_;
  std::string prefix_;
};

/**
 * Write transactions wrap a pessimistic rocksdb::Transaction that holds the
 * registry row lock; read transactions are a plain DB snapshot.
 */
class RocksTransaction final : public KvTransaction {
 public:
  RocksTransaction(std::shared_ptr<RocksContext> ctx,
                   std::shared_lock<std::shared_mutex> guard,
                   std::string prefix,
                   std::unique_ptr<rocksdb::Transaction> txn,
                   const rocksdb::Snapshot* snapshot)
      : ctx_(std::move(ctx)),
        guard_(std::move(guard)),
        prefix_(std::move(prefix)),
        txn_(std::move(txn)),
        snapshot_(snapshot) {}

  ~RocksTransaction() override {
    if (done_) return;
    rocksdb::Status s = Rollback();
    if (!s.ok()) {
      rocksdb::Log(rocksdb::InfoLogLevel::WARN_LEVEL, ctx_->opt.info_log,
                   "hashdiff: rollback on destroy failed: %s", s.ToString().c_str());
    }
  }

  bool writable() const override { return txn_ != nullptr; }

  rocksdb::Status Get(Table t, std::string_view key, std::string* value) override {
    if (done_) return rocksdb::Status::InvalidArgument("transaction is finished");
    if (!value) return rocksdb::Status::InvalidArgument("value is null");
    const std::string k = Key(key);
    if (txn_) return txn_->Get(rocksdb::ReadOptions(), Cf(t), k, value);

    rocksdb::ReadOptions ro;
    ro.snapshot = snapshot_;
    return ctx_->db->Get(ro, Cf(t), k, value);
  }

  rocksdb::Status Put(Table t, std::string_view key, std::string_view value) override {
    if (done_) return rocksdb::Status::InvalidArgument("transaction is finished");
    if (!txn_) return rocksdb::Status::InvalidArgument("transaction is read-only");
    return txn_->Put(Cf(t), Key(key), ToSlice(value));
  }

  rocksdb::Status Delete(Table t, std::string_view key) override {
    if (done_) return rocksdb::Status::InvalidArgument("transaction is finished");
    if (!txn_) return rocksdb::Status::InvalidArgument("transaction is read-only");
    return txn_->Delete(Cf(t), Key(key));
  }

  std::unique_ptr<KvCursor> NewCursor(Table t) override {
    rocksdb::ReadOptions ro;
    ro.snapshot = snapshot_;
    std::unique_ptr<rocksdb::Iterator> it(ctx_->db->NewIterator(ro, Cf(t)));
    return std::make_unique<RocksCursor>(std::move(it), prefix_);
  }

  rocksdb::Status Commit() override {
    if (done_) return rocksdb::Status::InvalidArgument("transaction is finished");
    done_ = true;

    if (!txn_) {
      ReleaseSnapshot();
      return rocksdb::Status::OK();
    }

    rocksdb::Status s = txn_->Commit();
    if (!s.ok()) {
      // A failed commit leaves nothing applied; release the locks now.
      rocksdb::Status rs = txn_->Rollback();
      if (!rs.ok()) {
        rocksdb::Log(rocksdb::InfoLogLevel::WARN_LEVEL, ctx_->opt.info_log,
                     "hashdiff: rollback after failed commit: %s", rs.ToString().c_str());
      }
      return s;
    }

    auto hooks = std::move(on_commit_);
    for (auto& fn : hooks) fn();
    return s;
  }

  rocksdb::Status Rollback() override {
    if (done_) return rocksdb::Status::InvalidArgument("transaction is finished");
    done_ = true;
    on_commit_.clear();

    if (!txn_) {
      ReleaseSnapshot();
      return rocksdb::Status::OK();
    }
    return txn_->Rollback();
  }

  void OnCommit(std::function<void()> fn) override { on_commit_.push_back(std::move(fn)); }

 private:
  rocksdb::ColumnFamilyHandle* Cf(Table t) const {
    return ctx_->table_cfs[static_cast<size_t>(t)];
  }

  std::string Key(std::string_view key) const {
    std::string k = prefix_;
    k.append(key.data(), key.size());
    return k;
  }

  // Read transactions own their snapshot; write transactions borrow the one
  // set on the rocksdb::Transaction.
  void ReleaseSnapshot() {
    if (snapshot_ && !txn_) ctx_->db->ReleaseSnapshot(snapshot_);
    snapshot_ = nullptr;
  }

  // Declaration order matters: the transaction must be destroyed before the
  // guard lets Close() delete the database.
  std::shared_ptr<RocksContext> ctx_;
  std::shared_lock<std::shared_mutex> guard_;
  std::string prefix_;
  std::unique_ptr<rocksdb::Transaction> txn_;
  const rocksdb::Snapshot* snapshot_ = nullptr;
  std::vector<std::function<void()>> on_commit_;
  bool done_ = false;
};

class RocksNamespace final : public KvNamespace {
 public:
  RocksNamespace(std::shared_ptr<RocksContext> ctx, std::string name, std::string id)
      : ctx_(std::move(ctx)), name_(std::move(name)), id_(std::move(id)) {}

  const std::string& name() const override { return name_; }

  rocksdb::Status Begin(bool writable, std::unique_ptr<KvTransaction>* out) override {
    if (!out) return rocksdb::Status::InvalidArgument("out is null");

    std::shared_lock<std::shared_mutex> guard(ctx_->mu);
    rocksdb::TransactionDB* db = ctx_->db;
    if (!db) return rocksdb::Status::InvalidArgument("db is closed");

    if (!writable) {
      const rocksdb::Snapshot* snap = db->GetSnapshot();
      rocksdb::ReadOptions ro;
      ro.snapshot = snap;
      std::string id;
      rocksdb::Status s = db->Get(ro, ctx_->registry_cf, name_, &id);
      if (!s.ok() || id != id_) {
        db->ReleaseSnapshot(snap);
        return s.ok() || s.IsNotFound() ? Deleted() : s;
      }
      *out = std::make_unique<RocksTransaction>(ctx_, std::move(guard), id_, nullptr, snap);
      return rocksdb::Status::OK();
    }

    rocksdb::WriteOptions wo;
    wo.sync = ctx_->opt.sync_commits;

    rocksdb::TransactionOptions to;
    to.lock_timeout = ctx_->opt.lock_timeout_ms;

    for (int attempt = 0; attempt < ctx_->opt.max_retries; ++attempt) {
      std::unique_ptr<rocksdb::Transaction> txn(db->BeginTransaction(wo, to));
      if (!txn) return rocksdb::Status::IOError("BeginTransaction returned null");

      // The registry row is the namespace writer lock.
      std::string id;
      rocksdb::Status s = txn->GetForUpdate(rocksdb::ReadOptions(), ctx_->registry_cf, name_, &id);
      if (IsRetryableTxnStatus(s)) {
        EmitCounter(ctx_->opt, "hashdiff.txn.lock_retry_total", 1);
        continue;
      }
      if (s.IsNotFound() || (s.ok() && id != id_)) return Deleted();
      if (!s.ok()) return s;

      txn->SetSnapshot();
      const rocksdb::Snapshot* snap = txn->GetSnapshot();
      *out = std::make_unique<RocksTransaction>(ctx_, std::move(guard), id_, std::move(txn), snap);
      return rocksdb::Status::OK();
    }

    return rocksdb::Status::TimedOut("writer lock exceeded max_retries", name_);
  }

 private:
  rocksdb::Status Deleted() const {
    return rocksdb::Status::NotFound("differential deleted", name_);
  }

  std::shared_ptr<RocksContext> ctx_;
  std::string name_;
  std::string id_;  // 8-byte BE id; also the key prefix
};

}  // namespace

rocksdb::Status OpenRocksContext(const std::string& db_path,
                                 const Options& opt,
                                 std::shared_ptr<RocksContext>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  rocksdb::Options options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;
  options.info_log_level = opt.info_log_level;
  if (opt.info_log) options.info_log = opt.info_log;

  rocksdb::TransactionDBOptions txn_opts;
  txn_opts.transaction_lock_timeout = opt.lock_timeout_ms;

  // Shared cache for all CFs
  auto cache = rocksdb::NewLRUCache(opt.block_cache_bytes);

  std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
  cfs.emplace_back(rocksdb::kDefaultColumnFamilyName, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kNamespacesCF, MakeCFOptions(cache, opt.bloom_bits_per_key));
  for (const char* name : kTableCFs) {
    cfs.emplace_back(name, MakeCFOptions(cache, opt.bloom_bits_per_key));
  }

  std::vector<rocksdb::ColumnFamilyHandle*> handles;
  rocksdb::TransactionDB* db = nullptr;

  rocksdb::Status s = rocksdb::TransactionDB::Open(options, txn_opts, db_path, cfs, &handles, &db);
  if (!s.ok()) {
    for (auto* h : handles) delete h;
    return s;
  }

  auto ctx = std::make_shared<RocksContext>();
  ctx->db = db;
  ctx->handles = std::move(handles);
  ctx->opt = opt;
  ctx->opt.info_log = db->GetDBOptions().info_log;

  // Descriptor order = handle order
  ctx->registry_cf = ctx->handles[1];
  for (size_t i = 0; i < kNumTables; ++i) ctx->table_cfs[i] = ctx->handles[2 + i];

  rocksdb::Log(rocksdb::InfoLogLevel::INFO_LEVEL, ctx->opt.info_log,
               "hashdiff: opened %s (version %s)", db_path.c_str(), Version());

  *out = std::move(ctx);
  return rocksdb::Status::OK();
}

void CloseRocksContext(RocksContext* ctx) {
  if (!ctx) return;
  std::unique_lock<std::shared_mutex> lock(ctx->mu);
  if (!ctx->db) return;

  rocksdb::Log(rocksdb::InfoLogLevel::INFO_LEVEL, ctx->opt.info_log, "hashdiff: closing");

  for (auto* h : ctx->handles) {
    rocksdb::Status s = ctx->db->DestroyColumnFamilyHandle(h);
    if (!s.ok()) {
      rocksdb::Log(rocksdb::InfoLogLevel::WARN_LEVEL, ctx->opt.info_log,
                   "hashdiff: destroy column family handle: %s", s.ToString().c_str());
    }
  }
  ctx->handles.clear();
  ctx->registry_cf = nullptr;
  ctx->table_cfs.fill(nullptr);

  delete ctx->db;
  ctx->db = nullptr;
}

rocksdb::Status OpenRocksNamespace(const std::shared_ptr<RocksContext>& ctx,
                                   std::string_view name,
                                   std::shared_ptr<KvNamespace>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (name.empty()) return rocksdb::Status::InvalidArgument("differential name is empty");

  std::shared_lock<std::shared_mutex> guard(ctx->mu);
  rocksdb::TransactionDB* db = ctx->db;
  if (!db) return rocksdb::Status::InvalidArgument("db is closed");

  rocksdb::WriteOptions wo;
  wo.sync = ctx->opt.sync_commits;
  rocksdb::TransactionOptions to;
  to.lock_timeout = ctx->opt.lock_timeout_ms;
  rocksdb::ReadOptions ro;

  // Fast path: an existing namespace needs no lock, so opening one never
  // waits on its writer.
  {
    std::string id;
    rocksdb::Status s = db->Get(ro, ctx->registry_cf, ToSlice(name), &id);
    if (s.ok()) {
      *out = std::make_shared<RocksNamespace>(ctx, std::string(name), std::move(id));
      return rocksdb::Status::OK();
    }
    if (!s.IsNotFound()) return s;
  }

  for (int attempt = 0; attempt < ctx->opt.max_retries; ++attempt) {
    std::unique_ptr<rocksdb::Transaction> txn(db->BeginTransaction(wo, to));
    if (!txn) return rocksdb::Status::IOError("BeginTransaction returned null");

    std::string id;
    rocksdb::Status s = txn->GetForUpdate(ro, ctx->registry_cf, ToSlice(name), &id);
    if (IsRetryableTxnStatus(s)) continue;

    if (s.ok()) {
      rocksdb::Status rs = txn->Rollback();
      if (!rs.ok()) return rs;
      *out = std::make_shared<RocksNamespace>(ctx, std::string(name), std::move(id));
      return rocksdb::Status::OK();
    }
    if (!s.IsNotFound()) return s;

    // Allocate a fresh id. Ids are never reused, so a namespace deleted and
    // re-created under the same name cannot see stale rows.
    std::string counter;
    uint64_t next = 1;
    s = txn->GetForUpdate(ro, ctx->handles[0], kNextNamespaceIdKey, &counter);
    if (IsRetryableTxnStatus(s)) continue;
    if (s.ok()) {
      if (!DecodeU64LE(counter, &next)) {
        return rocksdb::Status::Corruption("bad namespace id counter");
      }
    } else if (!s.IsNotFound()) {
      return s;
    }

    id = EncodeU64BE(next);
    s = txn->Put(ctx->handles[0], kNextNamespaceIdKey, EncodeU64LE(next + 1));
    if (!s.ok()) return s;
    s = txn->Put(ctx->registry_cf, ToSlice(name), id);
    if (!s.ok()) return s;

    rocksdb::Status cs = txn->Commit();
    if (IsRetryableTxnStatus(cs)) continue;
    if (!cs.ok()) return cs;

    rocksdb::Log(rocksdb::InfoLogLevel::INFO_LEVEL, ctx->opt.info_log,
                 "hashdiff: created differential %s (id %llu)",
                 PrintableKey(name).c_str(), static_cast<unsigned long long>(next));

    *out = std::make_shared<RocksNamespace>(ctx, std::string(name), std::move(id));
    return rocksdb::Status::OK();
  }

  return rocksdb::Status::TimedOut("open differential exceeded max_retries");
}

rocksdb::Status DeleteRocksNamespace(const std::shared_ptr<RocksContext>& ctx,
                                     std::string_view name) {
  std::shared_lock<std::shared_mutex> guard(ctx->mu);
  rocksdb::TransactionDB* db = ctx->db;
  if (!db) return rocksdb::Status::InvalidArgument("db is closed");

  rocksdb::WriteOptions wo;
  wo.sync = ctx->opt.sync_commits;
  rocksdb::TransactionOptions to;
  to.lock_timeout = ctx->opt.lock_timeout_ms;

  for (int attempt = 0; attempt < ctx->opt.max_retries; ++attempt) {
    std::unique_ptr<rocksdb::Transaction> txn(db->BeginTransaction(wo, to));
    if (!txn) return rocksdb::Status::IOError("BeginTransaction returned null");

    // Taking the registry row waits out any writer on this namespace.
    std::string id;
    rocksdb::Status s = txn->GetForUpdate(rocksdb::ReadOptions(), ctx->registry_cf, ToSlice(name), &id);
    if (IsRetryableTxnStatus(s)) continue;
    if (s.IsNotFound()) return rocksdb::Status::NotFound("no such differential", ToSlice(name));
    if (!s.ok()) return s;

    txn->SetSnapshot();
    rocksdb::ReadOptions ro;
    ro.snapshot = txn->GetSnapshot();

    uint64_t deleted = 0;
    for (rocksdb::ColumnFamilyHandle* cf : ctx->table_cfs) {
      std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(ro, cf));
      for (it->Seek(id); it->Valid() && it->key().starts_with(id); it->Next()) {
        s = txn->Delete(cf, it->key());
        if (!s.ok()) return s;
        ++deleted;
      }
      if (!it->status().ok()) return it->status();
    }

    s = txn->Delete(ctx->registry_cf, ToSlice(name));
    if (!s.ok()) return s;

    rocksdb::Status cs = txn->Commit();
    if (IsRetryableTxnStatus(cs)) continue;
    if (!cs.ok()) return cs;

    rocksdb::Log(rocksdb::InfoLogLevel::INFO_LEVEL, ctx->opt.info_log,
                 "hashdiff: deleted differential %s (%llu rows)",
                 PrintableKey(name).c_str(), static_cast<unsigned long long>(deleted));
    return rocksdb::Status::OK();
  }

  return rocksdb::Status::TimedOut("delete differential exceeded max_retries");
}

rocksdb::Status ListRocksNamespaces(const std::shared_ptr<RocksContext>& ctx,
                                    std::vector<std::string>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::shared_lock<std::shared_mutex> guard(ctx->mu);
  if (!ctx->db) return rocksdb::Status::InvalidArgument("db is closed");

  std::vector<std::string> names;
  std::unique_ptr<rocksdb::Iterator> it(ctx->db->NewIterator(rocksdb::ReadOptions(), ctx->registry_cf));
  for (it->SeekToFirst(); it->Valid(); it->Next()) names.push_back(it->key().ToString());
  if (!it->status().ok()) return it->status();

  *out = std::move(names);
  return rocksdb::Status::OK();
}

}  // namespace hashdiff::internal
