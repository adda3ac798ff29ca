#include <hashdiff/codec.hpp>

#include <algorithm>
#include <memory>
#include <utility>

namespace hashdiff {

namespace {

const Json::StreamWriterBuilder& CompactWriter() {
  static const Json::StreamWriterBuilder builder = [] {
    Json::StreamWriterBuilder b;
    b["indentation"] = "";
    b["precision"] = 17;
    return b;
  }();
  return builder;
}

}  // namespace

size_t ValueDepth(const Json::Value& v) {
  if (!v.isArray() && !v.isObject()) return 0;
  size_t deepest = 0;
  for (const auto& child : v) deepest = std::max(deepest, ValueDepth(child));
  return deepest + 1;
}

rocksdb::Status EncodeValue(const Json::Value& v, std::string* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (ValueDepth(v) > kMaxValueDepth) {
    return rocksdb::Status::InvalidArgument("value nesting exceeds max depth");
  }
  *out = Json::writeString(CompactWriter(), v);
  return rocksdb::Status::OK();
}

rocksdb::Status DecodeValue(std::string_view data, Json::Value* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  Json::CharReaderBuilder builder;
  builder["failIfExtra"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value v;
  std::string errors;
  try {
    if (!reader->parse(data.data(), data.data() + data.size(), &v, &errors)) {
      return rocksdb::Status::Corruption("malformed payload", errors);
    }
  } catch (const Json::Exception& e) {
    // The reader throws past its nesting limit.
    return rocksdb::Status::Corruption("malformed payload", e.what());
  }
  *out = std::move(v);
  return rocksdb::Status::OK();
}

}  // namespace hashdiff
