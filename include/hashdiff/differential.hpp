#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

#include <hashdiff/codec.hpp>
#include <hashdiff/hasher.hpp>
#include <hashdiff/kv.hpp>
#include <hashdiff/object.hpp>
#include <hashdiff/options.hpp>

namespace hashdiff {

class CancellationToken;
class ObjectQueue;

/**
 * Applies one pending change downstream. Returning a non-OK status leaves the
 * item pending for a later run; it does not stop the run.
 *
 * The callback must not start write operations on the same differential: the
 * apply run holds its writer lock.
 */
using ApplyFunc = std::function<rocksdb::Status(std::string_view id, const Decoder& data)>;

struct ApplyFailure {
  std::string id;
  rocksdb::Status status;
};

/** Outcome of one EachN/Each run. */
struct ApplyResult {
  uint64_t promoted = 0;               // items committed as known-good
  std::vector<ApplyFailure> failures;  // callback failures, in key order
  bool cancelled = false;              // the run stopped on cancellation

  bool ok() const { return failures.empty() && !cancelled; }

  std::vector<std::string> FailedIds() const;

  /** OK, or Incomplete("apply incomplete", summary). */
  rocksdb::Status ToStatus() const;
};

/**
 * Accessor for a differential's free-form scratch table (run times, export
 * markers and the like). Bound to the transaction of one ViewUserData or
 * UpdateUserData call.
 */
class UserData {
 public:
  explicit UserData(KvTransaction* txn) : txn_(txn) {}

  rocksdb::Status Get(std::string_view key, std::string* value) const;

  /** InvalidArgument inside ViewUserData. */
  rocksdb::Status Put(std::string_view key, std::string_view value);
  rocksdb::Status Delete(std::string_view key);

  /**
   * Visit entries in key order until fn returns false. Sees the table as of
   * the start of the transaction, without this call's own Put/Delete.
   */
  rocksdb::Status ForEach(
      const std::function<bool(std::string_view key, std::string_view value)>& fn) const;

 private:
  KvTransaction* txn_;
};

/**
 * hashdiff::Differential
 *
 * Change tracking for one named collection of objects:
 * - Add(obj) stages obj if its content differs from the last applied and the
 *   currently staged version.
 * - Each(f) hands every staged change to f and promotes the ones f accepts.
 *
 * Internally (per namespace):
 *  committed: id -> content hash of last applied version
 *  pending:   id -> content hash of staged version
 *  payload:   content hash -> [refcount][encoded content]
 *  conflicts: id -> content hash staged in the current tracking epoch
 *
 * Thread-safe. Writes to one differential serialize on its writer lock;
 * reads run against snapshots and never block.
 */
class Differential {
 public:
  Differential(std::shared_ptr<KvNamespace> ns, const Options& opt = Options{});

  Differential(const Differential&) = delete;
  Differential& operator=(const Differential&) = delete;

  const std::string& Name() const { return ns_->name(); }

  /**
   * Stage obj in its own transaction.
   * *updated is false when the content equals the committed or the pending
   * version. ConflictingKey if conflict tracking is on and obj's ID was
   * already staged with different content in this epoch.
   */
  rocksdb::Status Add(const Object& obj, bool* updated);

  /** Begin a write transaction for batching AddTx calls. */
  rocksdb::Status BeginWrite(std::unique_ptr<KvTransaction>* out);

  /**
   * Stage obj inside txn (from BeginWrite). The caller commits or rolls back.
   * The differential must outlive txn.
   */
  rocksdb::Status AddTx(KvTransaction* txn, const Object& obj, bool* updated);

  /**
   * Stage every object in one transaction. All or nothing: on any error
   * nothing is staged. *staged counts the objects actually updated.
   */
  rocksdb::Status AddAll(const std::vector<std::shared_ptr<const Object>>& objs,
                         uint64_t* staged);

  /**
   * Stage objects from queue until a null sentinel or the queue is closed and
   * drained, then commit once.
   *
   * On a staging error or cancellation the whole run is rolled back and
   * nothing from it survives; cancellation returns Cancelled(). The queue is
   * closed when the run ends.
   */
  rocksdb::Status AddStream(ObjectQueue* queue,
                            const CancellationToken* cancel,
                            uint64_t* staged);

  /**
   * Apply up to n pending changes (all if n <= 0) in ascending ID order.
   *
   * Each successful callback promotes its item; failures are collected in
   * *result and stay pending. The limit counts promotions. Cancellation is
   * checked before each item. Promotions are committed once at the end; if
   * that commit fails, none survive.
   *
   * Returns OK, Incomplete when any item failed or the run was cancelled, or
   * the storage error that aborted the run. A pending hash without payload is
   * Corruption and aborts the run with nothing promoted.
   */
  rocksdb::Status EachN(const ApplyFunc& f,
                        int n,
                        ApplyResult* result = nullptr,
                        const CancellationToken* cancel = nullptr);

  rocksdb::Status Each(const ApplyFunc& f,
                       ApplyResult* result = nullptr,
                       const CancellationToken* cancel = nullptr) {
    return EachN(f, 0, result, cancel);
  }

  /** Whether candidate differs from the last applied version of id. */
  rocksdb::Status Changed(std::string_view id, const Json::Value& candidate, bool* changed) const;

  rocksdb::Status CountTracking(uint64_t* out) const;
  rocksdb::Status CountChanges(uint64_t* out) const;

  /** Pending IDs in apply order. limit == 0 means no limit. */
  rocksdb::Status ListChanges(std::vector<std::string>* ids, uint64_t limit = 0) const;

  /**
   * Start a new conflict-tracking epoch: clear all markers and persist the
   * flag. Takes effect for stages that begin after this commits.
   */
  rocksdb::Status EnableConflictTracking();
  rocksdb::Status DisableConflictTracking();
  rocksdb::Status IsTrackingConflicts(bool* out) const;

  rocksdb::Status ViewUserData(const std::function<rocksdb::Status(const UserData&)>& fn) const;

  /** Commits only if fn returns OK. */
  rocksdb::Status UpdateUserData(const std::function<rocksdb::Status(UserData*)>& fn);

 private:
  rocksdb::Status StageLocked(KvTransaction* txn,
                              const Object& obj,
                              bool tracking,
                              bool* updated);
  rocksdb::Status ReadTracking(KvTransaction* txn, bool* tracking) const;
  rocksdb::Status SetConflictTracking(bool enabled);
  rocksdb::Status CountTable(Table t, uint64_t* out) const;

  // Payload records are shared by every pending ID with the same content.
  rocksdb::Status AcquirePayload(KvTransaction* txn,
                                 const std::string& hash,
                                 std::string_view encoded);
  rocksdb::Status ReleasePayload(KvTransaction* txn, const std::string& hash);
  rocksdb::Status LoadPayload(KvTransaction* txn,
                              const std::string& hash,
                              std::string* encoded) const;

  // Roll back after a failure, logging if the rollback itself fails.
  void Abort(KvTransaction* txn, const char* op) const;

  std::shared_ptr<KvNamespace> ns_;
  Options opt_;
  std::shared_ptr<Hasher> hasher_;
};

}  // namespace hashdiff
