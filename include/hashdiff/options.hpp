#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include <rocksdb/env.h>
#include <rocksdb/status.h>

namespace hashdiff {

class Hasher;

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., calls, promotions, conflicts). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., latency in microseconds, batch sizes). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values (e.g., pending backlog).
   *  Default implementation does nothing. */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

/** A trace span interface (very small surface area). */
struct TraceSpan {
  virtual ~TraceSpan() = default;

  virtual void SetAttribute(std::string_view key, uint64_t value) = 0;
  virtual void SetAttribute(std::string_view key, std::string_view value) = 0;
  virtual void AddEvent(std::string_view name) = 0;

  /** Must be called exactly once to finish the span. */
  virtual void End(const rocksdb::Status& status) = 0;
};

/** A tracer creates spans. If unset, tracing is disabled. */
struct Tracer {
  virtual ~Tracer() = default;
  virtual std::unique_ptr<TraceSpan> StartSpan(std::string_view name) = 0;
};

/**
 * Options for a hashdiff database.
 *
 * These are layered on top of RocksDB's Options/TransactionDBOptions. The
 * database creates one column family per logical table and uses RocksDB
 * TransactionDB so that staging and apply runs are atomic.
 */
struct Options {
  // RocksDB performance knobs
  size_t block_cache_bytes = 64ull * 1024ull * 1024ull;
  int bloom_bits_per_key = 10;

  // fsync the WAL on every commit. Promotions are only "known-good" once
  // durable, so this defaults to on.
  bool sync_commits = true;

  // Writer lock behavior. Every write transaction takes the namespace writer
  // lock; a busy lock is retried up to max_retries times, each attempt
  // waiting at most lock_timeout_ms.
  int lock_timeout_ms = 2000;
  int max_retries = 16;

  // Diagnostic logging through the RocksDB info log (the LOG file in the
  // database directory). If info_log is unset, RocksDB's own logger is used.
  rocksdb::InfoLogLevel info_log_level = rocksdb::InfoLogLevel::INFO_LEVEL;
  std::shared_ptr<rocksdb::Logger> info_log;

  // Content hasher. If unset, StructuralHasher is used.
  std::shared_ptr<Hasher> hasher;

  // Observability hooks (optional)
  //
  // If set, operations emit a small number of counters/histograms and
  // attach attributes/events to spans.
  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Tracer> tracer;
};

}  // namespace hashdiff
