//===----------------------------------------------------------------------===//
//
//                         HLL
//
// hash_extractor_test.cpp
//
// Identification: test/sketch/hash_extractor_test.cpp
//
//===----------------------------------------------------------------------===//

#include "sketch/hash_extractor.h"

#include <string>

#include "common/util/hash_util.h"
#include "gtest/gtest.h"

namespace hll {

namespace {

auto HashString(const std::string &s, uint64_t seed) -> hash_t {
  return HashUtil::HashBytes(reinterpret_cast<const uint8_t *>(s.data()), s.size(), seed);
}

auto Murmur64A(const std::string &s) -> hash_t {
  return HashUtil::MurmurHash64A(reinterpret_cast<const uint8_t *>(s.data()), s.size(), 0xadc83b19ULL);
}

}  // namespace

TEST(HashUtilTest, HashBytesVectors) {
  EXPECT_EQ(0ULL, HashUtil::Mix64(0));
  EXPECT_EQ(0xaebe53f85cdc3c4cULL, HashString("", 0));
  EXPECT_EQ(0xae7f7e67c46ca181ULL, HashString("hello", 0));
  EXPECT_EQ(0x9339156c924196a6ULL, HashString("hello", 1));
  EXPECT_EQ(0xc0bb6a2e651972e8ULL, HashString("The quick brown fox jumps over the lazy dog", 0));
}

TEST(HashUtilTest, MurmurHash64AVectors) {
  EXPECT_EQ(0x0f656f01eecfe400ULL, Murmur64A("hello"));
  EXPECT_EQ(0xd8dfea6585bc9732ULL, Murmur64A(""));
  // one full block plus a 3 byte tail
  EXPECT_EQ(0x0f85070a21c57729ULL, Murmur64A("abcdefghijk"));
}

TEST(HashExtractorTest, RedisMatchesPfadd) {
  RedisHashExtractor extractor;
  ASSERT_EQ(14, extractor.GetPrecision());

  auto hello = extractor.Extract("hello");
  EXPECT_EQ(9216, hello.index_);
  EXPECT_EQ(1, hello.value_);

  auto okk = extractor.Extract(std::string("okk"));
  EXPECT_EQ(11445, okk.index_);
  EXPECT_EQ(2, okk.value_);

  auto foo = extractor.Extract("foo");
  EXPECT_EQ(7348, foo.index_);
  EXPECT_EQ(5, foo.value_);
}

TEST(HashExtractorTest, RedisFromHash) {
  auto low = RedisHashExtractor::FromHash(5 | (1ULL << 14));
  EXPECT_EQ(5, low.index_);
  EXPECT_EQ(1, low.value_);

  auto high = RedisHashExtractor::FromHash((1ULL << 63) | 7);
  EXPECT_EQ(7, high.index_);
  EXPECT_EQ(50, high.value_);

  // nothing above the index bits, the register saturates
  auto saturated = RedisHashExtractor::FromHash(0x3fff);
  EXPECT_EQ(16383, saturated.index_);
  EXPECT_EQ(51, saturated.value_);
}

TEST(HashExtractorTest, RedisIntegersHashAsDecimalText) {
  RedisHashExtractor extractor;
  auto a = extractor.Extract(42);
  auto b = extractor.Extract("42");
  EXPECT_EQ(a.index_, b.index_);
  EXPECT_EQ(a.value_, b.value_);
}

TEST(HashExtractorTest, GenericRunLength) {
  const uint32_t index_bits = 1234U << 18;
  // first bit after the index is set
  EXPECT_EQ(1, GenericHashExtractor::RunLength(14, index_bits | (1U << 17), 0));
  // last bit of the suffix is set
  EXPECT_EQ(18, GenericHashExtractor::RunLength(14, index_bits | 1U, 0));
  // suffix is empty, the scan continues in the second hash
  EXPECT_EQ(19, GenericHashExtractor::RunLength(14, index_bits, 0x80000000U));
  EXPECT_EQ(50, GenericHashExtractor::RunLength(14, index_bits, 1U));
  EXPECT_EQ(51, GenericHashExtractor::RunLength(14, index_bits, 0));
  EXPECT_EQ(57, GenericHashExtractor::RunLength(8, 0xff000000U, 0));
  EXPECT_EQ(49, GenericHashExtractor::RunLength(16, 0xffff0000U, 0));
}

TEST(HashExtractorTest, GenericExtract) {
  GenericHashExtractor p14(14);
  ASSERT_EQ(14, p14.GetPrecision());
  auto foo = p14.Extract("foo");
  EXPECT_EQ(15907, foo.index_);
  EXPECT_EQ(2, foo.value_);

  GenericHashExtractor p12(12);
  auto foo12 = p12.Extract("foo");
  EXPECT_EQ(3976, foo12.index_);
  EXPECT_EQ(1, foo12.value_);
  // the top 12 bits are a prefix of the top 14 bits
  EXPECT_EQ(foo.index_ >> 2, foo12.index_);
}

TEST(HashExtractorTest, GenericKeepsKindsApart) {
  GenericHashExtractor extractor(16);
  auto integer = extractor.Extract(1);
  auto text = extractor.Extract("1");
  EXPECT_FALSE(integer.index_ == text.index_ && integer.value_ == text.value_);
}

TEST(HashExtractorTest, GenericStaysInRange) {
  for (int16_t p = 8; p <= 16; p++) {
    GenericHashExtractor extractor(p);
    for (int64_t i = 0; i < 2000; i++) {
      auto update = extractor.Extract(i);
      ASSERT_LT(update.index_, 1U << p);
      ASSERT_GE(update.value_, 1);
      ASSERT_LE(update.value_, 65 - p);
      auto again = extractor.Extract(i);
      ASSERT_EQ(update.index_, again.index_);
      ASSERT_EQ(update.value_, again.value_);
    }
  }
}

}  // namespace hll
