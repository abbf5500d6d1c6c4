//===----------------------------------------------------------------------===//
//
//                         HLL
//
// redis_codec_test.cpp
//
// Identification: test/sketch/redis_codec_test.cpp
//
//===----------------------------------------------------------------------===//

#include "sketch/redis_codec.h"

#include <string>
#include <vector>

#include "common/exception.h"
#include "gtest/gtest.h"

namespace hll {

namespace {

const std::vector<uint8_t> SPARSE_HEADER = {'H', 'Y', 'L', 'L', 1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0x80};
const std::vector<uint8_t> DENSE_HEADER = {'H', 'Y', 'L', 'L', 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0x80};

auto WithHeader(const std::vector<uint8_t> &header, const std::vector<uint8_t> &body) -> std::vector<uint8_t> {
  std::vector<uint8_t> out(header);
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

auto DecodeBytes(const std::vector<uint8_t> &data) -> RegisterMap {
  return RedisCodec().Decode(data.data(), data.size()).registers_;
}

}  // namespace

TEST(RedisCodecTest, EmptySketchIsOneXzero) {
  auto encoded = RedisCodec().Encode(14, {});
  EXPECT_EQ(WithHeader(SPARSE_HEADER, {0x7f, 0xff}), encoded);
  EXPECT_TRUE(DecodeBytes(encoded).empty());
}

TEST(RedisCodecTest, SparseOpcodes) {
  RedisCodec codec;
  // PFADD key hello
  EXPECT_EQ(WithHeader(SPARSE_HEADER, {0x63, 0xff, 0x80, 0x5b, 0xfe}), codec.Encode(14, {{9216, 1}}));

  // four equal neighbours share one VAL, the fifth starts another
  EXPECT_EQ(WithHeader(SPARSE_HEADER, {0x83, 0x80, 0x7f, 0xfa}),
            codec.Encode(14, {{0, 1}, {1, 1}, {2, 1}, {3, 1}, {4, 1}}));

  // 64 zeros still fit a ZERO opcode, 65 need an XZERO
  EXPECT_EQ(WithHeader(SPARSE_HEADER, {0x3f, 0x84, 0x7f, 0xbe}), codec.Encode(14, {{64, 2}}));
  EXPECT_EQ(WithHeader(SPARSE_HEADER, {0x40, 0x40, 0x84, 0x7f, 0xbd}), codec.Encode(14, {{65, 2}}));

  // value 32 is the largest a VAL opcode holds, at the last register
  EXPECT_EQ(WithHeader(SPARSE_HEADER, {0x7f, 0xfe, 0xfc}), codec.Encode(14, {{16383, 32}}));
}

TEST(RedisCodecTest, DecodesPfaddOutput) {
  // PFADD key okk; GET key
  auto registers = DecodeBytes({72, 89, 76, 76, 1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 128, 108, 180, 132, 83, 73});
  EXPECT_EQ((RegisterMap{{11445, 2}}), registers);
}

TEST(RedisCodecTest, LargeValueForcesDense) {
  RegisterMap registers{{0, 1}, {1, 2}, {2, 3}, {3, 4}, {16383, 33}};
  auto encoded = RedisCodec().Encode(14, registers);
  ASSERT_EQ(REDIS_HLL_DENSE_SIZE, encoded.size());
  EXPECT_EQ(REDIS_HLL_DENSE, encoded[4]);
  EXPECT_EQ(0x80, encoded[15]);

  // |11000000|22221111|33333322|
  EXPECT_EQ(0x81, encoded[16]);
  EXPECT_EQ(0x30, encoded[17]);
  EXPECT_EQ(0x10, encoded[18]);
  EXPECT_EQ(0x00, encoded[19]);
  // register 16383 sits in the top 6 bits of the last byte
  EXPECT_EQ(33 << 2, encoded.back());

  EXPECT_EQ(registers, DecodeBytes(encoded));
}

TEST(RedisCodecTest, SparseSizeLimit) {
  RedisEncodeOptions options;
  options.sparse_max_bytes_ = 17;
  RedisCodec tight(options);
  EXPECT_EQ(REDIS_HLL_DENSE_SIZE, tight.Encode(14, {}).size());

  options.sparse_max_bytes_ = 18;
  RedisCodec exact(options);
  EXPECT_EQ(WithHeader(SPARSE_HEADER, {0x7f, 0xff}), exact.Encode(14, {}));

  // alternating values never coalesce, one VAL byte per register exceeds the default 3000
  RegisterMap alternating;
  for (uint32_t i = 0; i < 3000; i++) {
    alternating[i] = static_cast<uint8_t>(1 + i % 2);
  }
  auto encoded = RedisCodec().Encode(14, alternating);
  EXPECT_EQ(REDIS_HLL_DENSE, encoded[4]);
  EXPECT_EQ(alternating, DecodeBytes(encoded));
}

TEST(RedisCodecTest, BodyEncoders) {
  EXPECT_FALSE(RedisCodec::EncodeSparseBody({{5, 40}}).has_value());
  auto body = RedisCodec::EncodeSparseBody({{0, 32}});
  ASSERT_TRUE(body.has_value());
  EXPECT_EQ((std::vector<uint8_t>{0xfc, 0x7f, 0xfe}), *body);
  EXPECT_EQ(REDIS_HLL_DENSE_SIZE - REDIS_HLL_HDR_SIZE, RedisCodec::EncodeDenseBody({}).size());
}

TEST(RedisCodecTest, RejectsOtherPrecisions) {
  EXPECT_THROW(RedisCodec().Encode(12, {}), InvalidPrecisionException);
}

TEST(RedisCodecTest, RejectsMalformedInput) {
  EXPECT_THROW(DecodeBytes({}), MalformedInputException);
  EXPECT_THROW(DecodeBytes({'H', 'Y', 'L', 'L', 1}), MalformedInputException);

  auto bad_magic = WithHeader(SPARSE_HEADER, {0x7f, 0xff});
  bad_magic[3] = 'X';
  EXPECT_THROW(DecodeBytes(bad_magic), MalformedInputException);

  // HLL_RAW is an in-memory encoding only
  auto raw = WithHeader(SPARSE_HEADER, {0x7f, 0xff});
  raw[4] = 2;
  EXPECT_THROW(DecodeBytes(raw), MalformedInputException);

  // dense body one byte short
  auto dense = RedisCodec().Encode(14, {{0, 40}});
  dense.pop_back();
  EXPECT_THROW(DecodeBytes(dense), MalformedInputException);

  // opcodes covering too few registers
  EXPECT_THROW(DecodeBytes(WithHeader(SPARSE_HEADER, {0x7f, 0xfe})), MalformedInputException);
  // too many registers
  EXPECT_THROW(DecodeBytes(WithHeader(SPARSE_HEADER, {0x7f, 0xff, 0x80})), MalformedInputException);
  EXPECT_THROW(DecodeBytes(WithHeader(SPARSE_HEADER, {0x7f, 0xfe, 0x81})), MalformedInputException);
  // XZERO missing its second byte
  EXPECT_THROW(DecodeBytes(WithHeader(SPARSE_HEADER, {0x7f})), MalformedInputException);
}

TEST(RedisCodecTest, RejectionsAreLoggedAtWarn) {
  auto bad_magic = WithHeader(SPARSE_HEADER, {0x7f, 0xff});
  bad_magic[0] = 'h';
  auto truncated_dense = RedisCodec().Encode(14, {{0, 40}});
  truncated_dense.pop_back();
  const std::vector<std::vector<uint8_t>> rejected = {
      {},
      {'H', 'Y', 'L', 'L'},
      bad_magic,
      truncated_dense,
      WithHeader(SPARSE_HEADER, {0x7f}),
      WithHeader(SPARSE_HEADER, {0x7f, 0xfe}),
      WithHeader(SPARSE_HEADER, {0x7f, 0xff, 0x80}),
  };
  for (const auto &data : rejected) {
    testing::internal::CaptureStdout();
    EXPECT_THROW(DecodeBytes(data), MalformedInputException);
    auto output = testing::internal::GetCapturedStdout();
    EXPECT_NE(std::string::npos, output.find("WARN")) << output;
    EXPECT_NE(std::string::npos, output.find("rejecting sketch")) << output;
  }
}

TEST(RedisCodecTest, CachedCardinality) {
  auto stale = RedisCodec().Encode(14, {{9216, 1}});
  EXPECT_FALSE(RedisCodec::CachedCardinality(stale.data(), stale.size()).has_value());

  // a header after PFCOUNT cached 4985
  std::vector<uint8_t> cached = {'H', 'Y', 'L', 'L', 0, 0, 0, 0, 0x79, 0x13, 0, 0, 0, 0, 0, 0};
  auto value = RedisCodec::CachedCardinality(cached.data(), cached.size());
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(4985, *value);

  std::vector<uint8_t> truncated = {'H', 'Y', 'L', 'L'};
  EXPECT_THROW(RedisCodec::CachedCardinality(truncated.data(), truncated.size()), MalformedInputException);
}

}  // namespace hll
