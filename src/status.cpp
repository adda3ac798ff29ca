#include <hashdiff/status.hpp>

#include <cstring>

#include <rocksdb/slice.h>

namespace hashdiff {

namespace {

constexpr const char* kConflictingKeyMsg = "conflicting key";
constexpr const char* kCancelledMsg = "cancelled";

bool StateStartsWith(const rocksdb::Status& s, const char* prefix) {
  const char* state = s.getState();
  return state != nullptr && std::strncmp(state, prefix, std::strlen(prefix)) == 0;
}

}  // namespace

rocksdb::Status ConflictingKey(std::string_view id) {
  return rocksdb::Status::InvalidArgument(
      kConflictingKeyMsg, rocksdb::Slice(id.data(), id.size()).ToString(true));
}

bool IsConflictingKey(const rocksdb::Status& s) {
  return s.IsInvalidArgument() && StateStartsWith(s, kConflictingKeyMsg);
}

rocksdb::Status HashingError(std::string_view reason) {
  return rocksdb::Status::NotSupported("unhashable value",
                                       rocksdb::Slice(reason.data(), reason.size()));
}

bool IsHashingError(const rocksdb::Status& s) {
  return s.IsNotSupported() && StateStartsWith(s, "unhashable value");
}

rocksdb::Status Cancelled() {
  return rocksdb::Status::Incomplete(kCancelledMsg);
}

bool IsCancelled(const rocksdb::Status& s) {
  return s.IsIncomplete() && StateStartsWith(s, kCancelledMsg);
}

}  // namespace hashdiff
