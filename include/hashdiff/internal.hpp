#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <openssl/evp.h>
#include <rocksdb/slice.h>
#include <rocksdb/status.h>

#include <hashdiff/options.hpp>

namespace hashdiff::internal {

// Monotonic timestamp helper for metrics/tracing (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

// SHA-256 wrapper using OpenSSL's EVP API.
class Sha256 {
 public:
  static constexpr size_t kDigestBytes = 32;

  // Returns false if any EVP call fails; *out is then unspecified.
  static bool Digest(std::string_view data, std::array<uint8_t, kDigestBytes>* out) {
    unsigned int len = 0;
    bool ok = false;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx) {
      ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) &&
           EVP_DigestUpdate(ctx, data.data(), data.size()) &&
           EVP_DigestFinal_ex(ctx, out->data(), &len) &&
           len == kDigestBytes;
      EVP_MD_CTX_free(ctx);
    }

    return ok;
  }
};

inline std::string EncodeU64LE(uint64_t v) {
  std::string s(8, '\0');
  for (int i = 0; i < 8; ++i) {
    s[i] = static_cast<char>(v & 0xffu);
    v >>= 8;
  }
  return s;
}

inline bool DecodeU64LE(std::string_view s, uint64_t* out) {
  if (s.size() != 8) return false;
  uint64_t v = 0;
  // little endian decode
  for (int i = 7; i >= 0; --i) {
    v <<= 8;
    v |= static_cast<uint8_t>(s[static_cast<size_t>(i)]);
  }
  *out = v;
  return true;
}

// Big-endian so that namespace prefixes sort by id and keys within one
// namespace keep their own byte order.
inline std::string EncodeU64BE(uint64_t v) {
  std::string s(8, '\0');
  for (int i = 7; i >= 0; --i) {
    s[static_cast<size_t>(i)] = static_cast<char>(v & 0xffu);
    v >>= 8;
  }
  return s;
}

inline bool DecodeU64BE(std::string_view s, uint64_t* out) {
  if (s.size() != 8) return false;
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v = (v << 8) | static_cast<uint8_t>(s[static_cast<size_t>(i)]);
  }
  *out = v;
  return true;
}

inline bool IsRetryableTxnStatus(const rocksdb::Status& s) {
  return s.IsBusy() || s.IsTimedOut() || s.IsTryAgain() || s.IsAborted();
}

// IDs are opaque bytes; log them hex-encoded.
inline std::string PrintableKey(std::string_view key) {
  return rocksdb::Slice(key.data(), key.size()).ToString(true);
}

// --------------------------
// Observability helpers
// --------------------------
inline void EmitCounter(const Options& opt, std::string_view name, uint64_t delta = 1) {
  if (opt.metrics) opt.metrics->Counter(name, delta);
}

inline void EmitHistogram(const Options& opt, std::string_view name, uint64_t value) {
  if (opt.metrics) opt.metrics->Histogram(name, value);
}

inline void EmitGauge(const Options& opt, std::string_view name, double value) {
  if (opt.metrics) opt.metrics->Gauge(name, value);
}

// Map RocksDB statuses to low-cardinality strings for tracing.
// (Avoid putting status.ToString() into attributes; it's high-cardinality.)
inline std::string_view StatusKind(const rocksdb::Status& s) {
  if (s.ok()) return "ok";
  if (s.IsNotFound()) return "not_found";
  if (s.IsInvalidArgument()) return "invalid_argument";
  if (s.IsNotSupported()) return "not_supported";
  if (s.IsIncomplete()) return "incomplete";
  if (s.IsTimedOut()) return "timed_out";
  if (s.IsBusy()) return "busy";
  if (s.IsTryAgain()) return "try_again";
  if (s.IsAborted()) return "aborted";
  if (s.IsCorruption()) return "corruption";
  if (s.IsIOError()) return "io_error";
  return "other";
}

inline void SpanAttr(TraceSpan* span, std::string_view key, uint64_t value) {
  if (span) span->SetAttribute(key, value);
}

inline void SpanAttr(TraceSpan* span, std::string_view key, std::string_view value) {
  if (span) span->SetAttribute(key, value);
}

inline void SpanEvent(TraceSpan* span, std::string_view name) {
  if (span) span->AddEvent(name);
}

}  // namespace hashdiff::internal
