#include <hashdiff/hasher.hpp>

#include <cmath>
#include <cstring>

#include <hashdiff/codec.hpp>
#include <hashdiff/internal.hpp>
#include <hashdiff/status.hpp>

namespace hashdiff {

namespace {

rocksdb::Status CheckHashable(const Json::Value& v, size_t depth) {
  if (v.isDouble()) {
    // The JSON writer prints NaN as null.
    if (std::isnan(v.asDouble())) return HashingError("NaN has no stable equality");
    return rocksdb::Status::OK();
  }
  if (!v.isArray() && !v.isObject()) return rocksdb::Status::OK();

  if (depth >= kMaxValueDepth) return HashingError("nesting exceeds max depth");
  for (const auto& child : v) {
    rocksdb::Status s = CheckHashable(child, depth + 1);
    if (!s.ok()) return s;
  }
  return rocksdb::Status::OK();
}

}  // namespace

std::string HashToBytes(const ContentHash& h) {
  return std::string(reinterpret_cast<const char*>(h.data()), h.size());
}

bool HashFromBytes(std::string_view bytes, ContentHash* out) {
  if (bytes.size() != kContentHashBytes) return false;
  std::memcpy(out->data(), bytes.data(), kContentHashBytes);
  return true;
}

std::string HashToHex(const ContentHash& h) {
  static const char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(h.size() * 2);
  for (uint8_t b : h) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0f]);
  }
  return out;
}

rocksdb::Status StructuralHasher::Hash(const Json::Value& v, ContentHash* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  rocksdb::Status s = CheckHashable(v, 0);
  if (!s.ok()) return s;

  std::string encoded;
  s = EncodeValue(v, &encoded);
  if (!s.ok()) return HashingError(s.ToString());

  std::array<uint8_t, internal::Sha256::kDigestBytes> digest{};
  if (!internal::Sha256::Digest(encoded, &digest)) {
    return rocksdb::Status::IOError("SHA-256 digest failed");
  }

  std::memcpy(out->data(), digest.data(), kContentHashBytes);
  return rocksdb::Status::OK();
}

std::shared_ptr<Hasher> DefaultHasher() {
  static std::shared_ptr<Hasher> instance = std::make_shared<StructuralHasher>();
  return instance;
}

}  // namespace hashdiff
