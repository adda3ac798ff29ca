#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <json/json.h>
#include <rocksdb/status.h>

namespace hashdiff {

// Deepest array/object nesting the hasher and codec accept.
constexpr size_t kMaxValueDepth = 64;

/** Depth of the deepest array/object nesting (scalars are 0). */
size_t ValueDepth(const Json::Value& v);

/**
 * Encode content as compact JSON.
 *
 * Json::Value keeps object members ordered by key, so equal content always
 * produces identical bytes regardless of the order members were set in.
 *
 * Returns InvalidArgument if the value nests deeper than kMaxValueDepth.
 */
rocksdb::Status EncodeValue(const Json::Value& v, std::string* out);

/** Decode bytes produced by EncodeValue. Corruption on malformed input. */
rocksdb::Status DecodeValue(std::string_view data, Json::Value* out);

/**
 * Read-only view of one pending payload, handed to apply callbacks.
 * Only valid for the duration of the callback.
 */
class Decoder {
 public:
  explicit Decoder(std::string_view data) : data_(data) {}

  rocksdb::Status Decode(Json::Value* out) const { return DecodeValue(data_, out); }

  /** The encoded bytes, for callers that forward payloads verbatim. */
  std::string_view raw() const { return data_; }

 private:
  std::string_view data_;
};

}  // namespace hashdiff
