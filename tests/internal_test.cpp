// Unit tests for hashdiff/internal.hpp and hashdiff/status.hpp utilities
// Tests: SHA-256, byte encodings, retry classification, status helpers

#include <gtest/gtest.h>

#include <hashdiff/internal.hpp>
#include <hashdiff/status.hpp>

#include <string>
#include <thread>

namespace hashdiff::internal {
namespace {

// =============================================================================
// SHA-256 Tests
// =============================================================================

class Sha256Test : public ::testing::Test {
 protected:
  std::array<uint8_t, Sha256::kDigestBytes> Digest(std::string_view data) {
    std::array<uint8_t, Sha256::kDigestBytes> out{};
    EXPECT_TRUE(Sha256::Digest(data, &out));
    return out;
  }
};

TEST_F(Sha256Test, EmptyInput) {
  auto digest = Digest("");
  // e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855
  EXPECT_EQ(digest[0], 0xe3);
  EXPECT_EQ(digest[1], 0xb0);
  EXPECT_EQ(digest[31], 0x55);
}

TEST_F(Sha256Test, KnownVector) {
  // SHA-256("hello") = 2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824
  auto digest = Digest("hello");
  EXPECT_EQ(digest[0], 0x2c);
  EXPECT_EQ(digest[1], 0xf2);
  EXPECT_EQ(digest[2], 0x4d);
  EXPECT_EQ(digest[31], 0x24);
}

TEST_F(Sha256Test, DifferentInputsDifferentHashes) {
  EXPECT_NE(Digest("hello"), Digest("world"));
  EXPECT_EQ(Digest("hello"), Digest("hello"));
}

TEST_F(Sha256Test, BinaryData) {
  std::string binary_data;
  for (int i = 0; i < 256; ++i) binary_data.push_back(static_cast<char>(i));
  EXPECT_EQ(Digest(binary_data), Digest(binary_data));
}

// =============================================================================
// Timestamp Utility Tests
// =============================================================================

TEST(TimestampTest, NowMicrosMonotonic) {
  uint64_t t1 = NowMicros();
  std::this_thread::sleep_for(std::chrono::milliseconds(1));
  uint64_t t2 = NowMicros();
  EXPECT_GT(t2, t1);
}

// =============================================================================
// Encoding Tests
// =============================================================================

class EncodingTest : public ::testing::Test {};

TEST_F(EncodingTest, EncodeDecodeU64LE) {
  for (uint64_t v : {0ull, 1ull, 255ull, 256ull, 0xdeadbeefull, ~0ull}) {
    std::string enc = EncodeU64LE(v);
    ASSERT_EQ(enc.size(), 8u);
    uint64_t out = 0;
    ASSERT_TRUE(DecodeU64LE(enc, &out));
    EXPECT_EQ(out, v);
  }
  EXPECT_EQ(static_cast<uint8_t>(EncodeU64LE(1)[0]), 1);
}

TEST_F(EncodingTest, DecodeU64LEInvalidLength) {
  uint64_t out = 0;
  EXPECT_FALSE(DecodeU64LE("", &out));
  EXPECT_FALSE(DecodeU64LE("1234567", &out));
  EXPECT_FALSE(DecodeU64LE("123456789", &out));
}

TEST_F(EncodingTest, BigEndianSortOrder) {
  // Namespace prefixes must sort numerically.
  EXPECT_LT(EncodeU64BE(1), EncodeU64BE(2));
  EXPECT_LT(EncodeU64BE(255), EncodeU64BE(256));
  EXPECT_LT(EncodeU64BE(0xffff), EncodeU64BE(0x10000));

  uint64_t out = 0;
  ASSERT_TRUE(DecodeU64BE(EncodeU64BE(0x0102030405060708ull), &out));
  EXPECT_EQ(out, 0x0102030405060708ull);
  EXPECT_EQ(EncodeU64BE(1).back(), '\x01');
}

TEST_F(EncodingTest, PrintableKeyIsHex) {
  EXPECT_EQ(PrintableKey(std::string("\x01\xab", 2)), "01AB");
}

// =============================================================================
// Status classification
// =============================================================================

TEST(RetryableStatusTest, RetryableStatuses) {
  EXPECT_TRUE(IsRetryableTxnStatus(rocksdb::Status::Busy()));
  EXPECT_TRUE(IsRetryableTxnStatus(rocksdb::Status::TimedOut()));
  EXPECT_TRUE(IsRetryableTxnStatus(rocksdb::Status::TryAgain()));
  EXPECT_TRUE(IsRetryableTxnStatus(rocksdb::Status::Aborted()));
}

TEST(RetryableStatusTest, NonRetryableStatuses) {
  EXPECT_FALSE(IsRetryableTxnStatus(rocksdb::Status::OK()));
  EXPECT_FALSE(IsRetryableTxnStatus(rocksdb::Status::NotFound()));
  EXPECT_FALSE(IsRetryableTxnStatus(rocksdb::Status::Corruption()));
  EXPECT_FALSE(IsRetryableTxnStatus(rocksdb::Status::IOError()));
}

TEST(StatusKindTest, LowCardinalityNames) {
  EXPECT_EQ(StatusKind(rocksdb::Status::OK()), "ok");
  EXPECT_EQ(StatusKind(rocksdb::Status::Incomplete()), "incomplete");
  EXPECT_EQ(StatusKind(rocksdb::Status::NotSupported()), "not_supported");
  EXPECT_EQ(StatusKind(rocksdb::Status::Corruption("x")), "corruption");
}

TEST(HashdiffStatusTest, ConflictingKey) {
  rocksdb::Status s = ConflictingKey("abc");
  EXPECT_TRUE(s.IsInvalidArgument());
  EXPECT_TRUE(IsConflictingKey(s));
  EXPECT_FALSE(IsHashingError(s));
  EXPECT_FALSE(IsConflictingKey(rocksdb::Status::InvalidArgument("other")));
}

TEST(HashdiffStatusTest, HashingError) {
  rocksdb::Status s = HashingError("NaN");
  EXPECT_TRUE(s.IsNotSupported());
  EXPECT_TRUE(IsHashingError(s));
  EXPECT_FALSE(IsCancelled(s));
}

TEST(HashdiffStatusTest, Cancelled) {
  rocksdb::Status s = Cancelled();
  EXPECT_TRUE(s.IsIncomplete());
  EXPECT_TRUE(IsCancelled(s));
  EXPECT_FALSE(IsCancelled(rocksdb::Status::Incomplete("apply incomplete", "1 failed")));
}

}  // namespace
}  // namespace hashdiff::internal
