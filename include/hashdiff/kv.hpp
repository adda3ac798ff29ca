#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <rocksdb/status.h>

namespace hashdiff {

/** Logical tables of one differential namespace. */
enum class Table : uint8_t {
  kCommitted = 0,  // id -> content hash of last applied version
  kPending,        // id -> content hash of staged version
  kPayload,        // content hash -> [refcount:8 LE][encoded value]
  kConflicts,      // id -> content hash staged in the current epoch
  kUserData,       // free-form caller scratch
  kMeta            // namespace mode state
};

constexpr size_t kNumTables = 6;

const char* TableName(Table t);

/**
 * Forward iterator over one table in ascending byte order of keys.
 *
 * A cursor sees the table as of the start of its transaction; writes made
 * through the transaction afterwards are not visible to it. Destroy cursors
 * before committing or rolling back.
 */
class KvCursor {
 public:
  virtual ~KvCursor() = default;

  virtual void SeekToFirst() = 0;
  virtual void Seek(std::string_view key) = 0;
  virtual bool Valid() const = 0;
  virtual void Next() = 0;

  // Only meaningful while Valid(). Keys are namespace-relative.
  virtual std::string_view key() const = 0;
  virtual std::string_view value() const = 0;

  virtual rocksdb::Status status() const = 0;
};

/**
 * A transaction against one namespace.
 *
 * Destroying a transaction that was neither committed nor rolled back rolls
 * it back. A write transaction holds the namespace writer lock for its whole
 * lifetime.
 */
class KvTransaction {
 public:
  virtual ~KvTransaction() = default;

  virtual bool writable() const = 0;

  /** NotFound if absent. Sees this transaction's own writes. */
  virtual rocksdb::Status Get(Table t, std::string_view key, std::string* value) = 0;

  /** InvalidArgument on a read-only transaction. */
  virtual rocksdb::Status Put(Table t, std::string_view key, std::string_view value) = 0;
  virtual rocksdb::Status Delete(Table t, std::string_view key) = 0;

  virtual std::unique_ptr<KvCursor> NewCursor(Table t) = 0;

  virtual rocksdb::Status Commit() = 0;
  virtual rocksdb::Status Rollback() = 0;

  /** Registers fn to run after a successful Commit(). Never runs on rollback. */
  virtual void OnCommit(std::function<void()> fn) = 0;
};

/** A named transactional namespace (the storage capability). */
class KvNamespace {
 public:
  virtual ~KvNamespace() = default;

  virtual const std::string& name() const = 0;

  /**
   * Begin a transaction. A writable transaction first acquires the
   * namespace writer lock, blocking while another writer holds it.
   * NotFound if the namespace has been deleted.
   */
  virtual rocksdb::Status Begin(bool writable, std::unique_ptr<KvTransaction>* out) = 0;
};

}  // namespace hashdiff
