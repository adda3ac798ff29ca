#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <json/json.h>
#include <rocksdb/status.h>

namespace hashdiff {

constexpr size_t kContentHashBytes = 8;

/** Fixed-width digest of an object's structural content. */
using ContentHash = std::array<uint8_t, kContentHashBytes>;

std::string HashToBytes(const ContentHash& h);
bool HashFromBytes(std::string_view bytes, ContentHash* out);
std::string HashToHex(const ContentHash& h);

/**
 * Computes content hashes.
 *
 * Implementations must be deterministic for equal content, including across
 * processes, since committed hashes are persisted and compared later.
 */
class Hasher {
 public:
  virtual ~Hasher() = default;

  /** Returns a HashingError status (NotSupported) for unhashable values. */
  virtual rocksdb::Status Hash(const Json::Value& v, ContentHash* out) const = 0;
};

/**
 * Default hasher: first 8 bytes of SHA-256 over the canonical encoding
 * (EncodeValue). Content is compared as JSON text, so 1 and 1u hash the same
 * while 1 and 1.0 do not.
 *
 * Rejects values containing NaN (no stable equality) or nesting deeper than
 * kMaxValueDepth.
 */
class StructuralHasher final : public Hasher {
 public:
  rocksdb::Status Hash(const Json::Value& v, ContentHash* out) const override;
};

/** Shared StructuralHasher instance. */
std::shared_ptr<Hasher> DefaultHasher();

}  // namespace hashdiff
