#pragma once

#include <hashdiff/kv.hpp>
#include <hashdiff/object.hpp>
#include <hashdiff/options.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hashdiff::testing {

// =============================================================================
// In-memory namespace with fault injection
// =============================================================================

using MemoryTables = std::array<std::map<std::string, std::string>, kNumTables>;

class MemoryCursor final : public KvCursor {
 public:
  MemoryCursor(std::shared_ptr<const MemoryTables> snapshot, Table t)
      : snapshot_(std::move(snapshot)),
        table_(&(*snapshot_)[static_cast<size_t>(t)]),
        it_(table_->end()) {}

  void SeekToFirst() override { it_ = table_->begin(); }
  void Seek(std::string_view key) override { it_ = table_->lower_bound(std::string(key)); }
  bool Valid() const override { return it_ != table_->end(); }
  void Next() override { ++it_; }
  std::string_view key() const override { return it_->first; }
  std::string_view value() const override { return it_->second; }
  rocksdb::Status status() const override { return rocksdb::Status::OK(); }

 private:
  std::shared_ptr<const MemoryTables> snapshot_;
  const std::map<std::string, std::string>* table_;
  std::map<std::string, std::string>::const_iterator it_;
};

/**
 * KvNamespace over std::map tables. Same visibility rules as the RocksDB
 * implementation: a write transaction holds the writer lock for its
 * lifetime, cursors see the state at transaction start, Get sees own writes.
 *
 * Tests can inject a commit failure, read and edit the raw tables, and mark
 * the namespace deleted.
 */
class MemoryNamespace final : public KvNamespace {
 public:
  explicit MemoryNamespace(std::string name = "test")
      : name_(std::move(name)), state_(std::make_shared<const MemoryTables>()) {}

  const std::string& name() const override { return name_; }

  rocksdb::Status Begin(bool writable, std::unique_ptr<KvTransaction>* out) override;

  // Fail the next write commit with s; nothing from that transaction lands.
  void FailNextCommit(rocksdb::Status s = rocksdb::Status::IOError("injected commit failure")) {
    std::lock_guard<std::mutex> lock(state_mu_);
    fail_next_commit_ = std::move(s);
  }

  std::map<std::string, std::string> Dump(Table t) const {
    return (*Snapshot())[static_cast<size_t>(t)];
  }

  void RawPut(Table t, const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(state_mu_);
    auto next = std::make_shared<MemoryTables>(*state_);
    (*next)[static_cast<size_t>(t)][key] = value;
    state_ = std::move(next);
  }

  void RawDelete(Table t, const std::string& key) {
    std::lock_guard<std::mutex> lock(state_mu_);
    auto next = std::make_shared<MemoryTables>(*state_);
    (*next)[static_cast<size_t>(t)].erase(key);
    state_ = std::move(next);
  }

  void MarkDeleted() { deleted_.store(true); }

  uint64_t commits() const { return commits_.load(); }

  std::shared_ptr<const MemoryTables> Snapshot() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return state_;
  }

  rocksdb::Status Install(MemoryTables next) {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (fail_next_commit_) {
      rocksdb::Status s = *fail_next_commit_;
      fail_next_commit_.reset();
      return s;
    }
    state_ = std::make_shared<const MemoryTables>(std::move(next));
    commits_.fetch_add(1);
    return rocksdb::Status::OK();
  }

 private:
  std::string name_;

  mutable std::mutex state_mu_;
  std::shared_ptr<const MemoryTables> state_;
  std::optional<rocksdb::Status> fail_next_commit_;

  std::mutex writer_mu_;
  std::atomic<bool> deleted_{false};
  std::atomic<uint64_t> commits_{0};
};

class MemoryTransaction final : public KvTransaction {
 public:
  MemoryTransaction(MemoryNamespace* ns,
                    std::unique_lock<std::mutex> writer,
                    std::shared_ptr<const MemoryTables> snapshot,
                    bool writable)
      : ns_(ns), writer_(std::move(writer)), snapshot_(std::move(snapshot)), writable_(writable) {
    if (writable_) work_ = *snapshot_;
  }

  bool writable() const override { return writable_; }

  rocksdb::Status Get(Table t, std::string_view key, std::string* value) override {
    if (done_) return rocksdb::Status::InvalidArgument("transaction is finished");
    const MemoryTables& tables = writable_ ? work_ : *snapshot_;
    const auto& table = tables[static_cast<size_t>(t)];
    auto it = table.find(std::string(key));
    if (it == table.end()) return rocksdb::Status::NotFound();
    *value = it->second;
    return rocksdb::Status::OK();
  }

  rocksdb::Status Put(Table t, std::string_view key, std::string_view value) override {
    if (done_) return rocksdb::Status::InvalidArgument("transaction is finished");
    if (!writable_) return rocksdb::Status::InvalidArgument("transaction is read-only");
    work_[static_cast<size_t>(t)][std::string(key)] = std::string(value);
    return rocksdb::Status::OK();
  }

  rocksdb::Status Delete(Table t, std::string_view key) override {
    if (done_) return rocksdb::Status::InvalidArgument("transaction is finished");
    if (!writable_) return rocksdb::Status::InvalidArgument("transaction is read-only");
    work_[static_cast<size_t>(t)].erase(std::string(key));
    return rocksdb::Status::OK();
  }

  std::unique_ptr<KvCursor> NewCursor(Table t) override {
    return std::make_unique<MemoryCursor>(snapshot_, t);
  }

  rocksdb::Status Commit() override {
    if (done_) return rocksdb::Status::InvalidArgument("transaction is finished");
    done_ = true;
    if (!writable_) return rocksdb::Status::OK();

    rocksdb::Status s = ns_->Install(std::move(work_));
    writer_.unlock();
    if (!s.ok()) return s;

    auto hooks = std::move(on_commit_);
    for (auto& fn : hooks) fn();
    return s;
  }

  rocksdb::Status Rollback() override {
    if (done_) return rocksdb::Status::InvalidArgument("transaction is finished");
    done_ = true;
    on_commit_.clear();
    if (writer_.owns_lock()) writer_.unlock();
    return rocksdb::Status::OK();
  }

  void OnCommit(std::function<void()> fn) override { on_commit_.push_back(std::move(fn)); }

 private:
  MemoryNamespace* ns_;
  std::unique_lock<std::mutex> writer_;
  std::shared_ptr<const MemoryTables> snapshot_;
  MemoryTables work_;
  bool writable_;
  bool done_ = false;
  std::vector<std::function<void()>> on_commit_;
};

inline rocksdb::Status MemoryNamespace::Begin(bool writable, std::unique_ptr<KvTransaction>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (deleted_.load()) return rocksdb::Status::NotFound("differential deleted", name_);

  std::unique_lock<std::mutex> writer;
  if (writable) writer = std::unique_lock<std::mutex>(writer_mu_);

  *out = std::make_unique<MemoryTransaction>(this, std::move(writer), Snapshot(), writable);
  return rocksdb::Status::OK();
}

// =============================================================================
// Objects
// =============================================================================

class TestObject final : public Object {
 public:
  TestObject(std::string id, Json::Value content) : id_(std::move(id)), content_(std::move(content)) {}

  std::string Id() const override { return id_; }
  Json::Value Content() const override { return content_; }

 private:
  std::string id_;
  Json::Value content_;
};

inline std::shared_ptr<const Object> MakeObject(std::string id, Json::Value content) {
  return std::make_shared<TestObject>(std::move(id), std::move(content));
}

// {"name": name, "rev": rev}
inline std::shared_ptr<const Object> MakeRecord(std::string id, const std::string& name, int64_t rev) {
  Json::Value v;
  v["name"] = name;
  v["rev"] = static_cast<Json::Int64>(rev);
  return MakeObject(std::move(id), std::move(v));
}

// =============================================================================
// Observability fakes
// =============================================================================

class RecordingMetrics : public MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[std::string(name)] += delta;
  }

  void Histogram(std::string_view name, uint64_t value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    histograms_[std::string(name)].push_back(value);
  }

  void Gauge(std::string_view name, double value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[std::string(name)] = value;
  }

  uint64_t counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
  }

  double gauge(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gauges_.find(name);
    return it == gauges_.end() ? 0.0 : it->second;
  }

  size_t histogram_count(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find(name);
    return it == histograms_.end() ? 0 : it->second.size();
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, uint64_t> counters_;
  std::map<std::string, std::vector<uint64_t>> histograms_;
  std::map<std::string, double> gauges_;
};

/** Records the name and final status kind of every span. */
class RecordingTracer : public Tracer {
 public:
  struct Finished {
    std::string name;
    rocksdb::Status status;
    std::map<std::string, uint64_t> int_attrs;
    std::vector<std::string> events;
  };

  std::unique_ptr<TraceSpan> StartSpan(std::string_view name) override {
    return std::make_unique<Span>(this, std::string(name));
  }

  std::vector<Finished> finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
  }

 private:
  class Span : public TraceSpan {
   public:
    Span(RecordingTracer* tracer, std::string name) : tracer_(tracer) { rec_.name = std::move(name); }

    void SetAttribute(std::string_view key, uint64_t value) override {
      rec_.int_attrs[std::string(key)] = value;
    }
    void SetAttribute(std::string_view key, std::string_view value) override {
      (void)key;
      (void)value;
    }
    void AddEvent(std::string_view name) override { rec_.events.emplace_back(name); }

    void End(const rocksdb::Status& status) override {
      rec_.status = status;
      std::lock_guard<std::mutex> lock(tracer_->mutex_);
      tracer_->finished_.push_back(rec_);
    }

   private:
    RecordingTracer* tracer_;
    Finished rec_;
  };

  mutable std::mutex mutex_;
  std::vector<Finished> finished_;
};

// =============================================================================
// Test Result Aggregation (for thread-safe assertions)
// =============================================================================

/**
 * Thread-safe result collector for concurrent tests.
 * Collects results from multiple threads for assertion on main thread.
 */
class TestResultCollector {
 public:
  void RecordSuccess() { success_count_.fetch_add(1); }

  void RecordFailure(const std::string& message = "") {
    failure_count_.fetch_add(1);
    if (!message.empty()) {
      std::lock_guard<std::mutex> lock(mutex_);
      failure_messages_.push_back(message);
    }
  }

  uint64_t SuccessCount() const { return success_count_.load(); }
  uint64_t FailureCount() const { return failure_count_.load(); }

  bool AllSucceeded() const { return FailureCount() == 0; }

  std::vector<std::string> GetFailureMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_messages_;
  }

 private:
  std::atomic<uint64_t> success_count_{0};
  std::atomic<uint64_t> failure_count_{0};
  mutable std::mutex mutex_;
  std::vector<std::string> failure_messages_;
};

// Check condition and record result; use instead of EXPECT_* inside threads
#define HASHDIFF_CHECK_AND_RECORD(collector, condition, fail_msg) \
  do {                                                            \
    if (condition) {                                              \
      (collector).RecordSuccess();                                \
    } else {                                                      \
      (collector).RecordFailure(fail_msg);                        \
    }                                                             \
  } while (0)

}  // namespace hashdiff::testing
