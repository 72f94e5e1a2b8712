#include <gtest/gtest.h>

#include <cstring>
#include <stdexcept>

#include "ocean_ros_driver/field_codec.hpp"

using ocean::BitRange;
using ocean::Value;
using ocean::Word16;
namespace codec = ocean::codec;

TEST(Word16, BitsCountFromLsb)
{
  Word16 w(0x0082);  // 1000 0010
  EXPECT_EQ(1u, w.get(BitRange{1, 1}));
  EXPECT_EQ(0u, w.get(BitRange{0, 1}));
  EXPECT_EQ(1u, w.get(BitRange{7, 1}));
  EXPECT_EQ(0x0Cu, (BitRange{2, 2}.mask()));
}

TEST(Word16, WithReplacesOnlyTheRange)
{
  Word16 w(0xFFFF);
  Word16 x = w.with(BitRange{4, 3}, 0);
  EXPECT_EQ(0xFF8F, x.raw());
  EXPECT_EQ(0xFFFF, w.raw());
  EXPECT_EQ(0xFFDF, x.with(BitRange{4, 3}, 5).raw());
}

TEST(Word16, WithRejectsValuesWiderThanRange)
{
  Word16 w(0);
  EXPECT_THROW(w.with(BitRange{0, 1}, 2), std::out_of_range);
  EXPECT_THROW(w.with(BitRange{15, 2}, 1), std::out_of_range);
}

TEST(FieldCodec, UnsignedWords)
{
  const uint8_t raw[] = {0x34, 0x12};
  EXPECT_EQ(0x1234, codec::kU16.decode(raw, 2).asInt());

  uint8_t out[2] = {0, 0};
  codec::kU16.encode(Value::integer(0xBEEF), out, 2);
  EXPECT_EQ(0xEF, out[0]);
  EXPECT_EQ(0xBE, out[1]);
  EXPECT_THROW(codec::kU16.encode(Value::integer(0x10000), out, 2),
               std::out_of_range);
  EXPECT_THROW(codec::kU16.encode(Value::text("1"), out, 2),
               std::invalid_argument);
}

TEST(FieldCodec, SignedWords)
{
  const uint8_t raw[] = {0x22, 0xFF};
  EXPECT_EQ(-222, codec::kI16.decode(raw, 2).asInt());

  uint8_t out[2];
  codec::kI16.encode(Value::integer(-358), out, 2);
  EXPECT_EQ(0x9A, out[0]);
  EXPECT_EQ(0xFE, out[1]);
}

TEST(FieldCodec, WrongWidthThrows)
{
  const uint8_t raw[] = {0, 0, 0};
  EXPECT_THROW(codec::kU16.decode(raw, 3), std::length_error);
}

TEST(FieldCodec, TextIsNullPaddedAndLossy)
{
  const uint8_t raw[] = {'A', 'Q', 'D', 0, 0, 0};
  EXPECT_EQ("AQD", codec::kText.decode(raw, 6).asText());

  uint8_t out[4];
  codec::kText.encode(Value::text("ab"), out, 4);
  EXPECT_EQ('a', out[0]);
  EXPECT_EQ(0, out[2]);
  EXPECT_EQ(0, out[3]);

  codec::kText.encode(Value::text("abcdef"), out, 4);
  EXPECT_EQ("abcd", codec::kText.decode(out, 4).asText());
}

TEST(FieldCodec, BcdClock)
{
  const uint8_t raw[] = {0x09, 0x07, 0x02, 0x11, 0x10, 0x12};
  Value v = codec::kBcdClock.decode(raw, 6);
  std::vector<int64_t> want = {9, 7, 2, 11, 10, 12};
  EXPECT_EQ(want, v.asIntList());

  uint8_t out[6];
  codec::kBcdClock.encode(v, out, 6);
  EXPECT_EQ(0, std::memcmp(raw, out, 6));

  const uint8_t bad[] = {0x0A, 0x07, 0x02, 0x11, 0x10, 0x12};
  EXPECT_THROW(codec::kBcdClock.decode(bad, 6), std::invalid_argument);
  EXPECT_THROW(codec::kBcdClock.encode(Value::intList({1, 2, 3}), out, 6),
               std::invalid_argument);
}

TEST(FieldCodec, ByteBlocksKeepTheirWidth)
{
  std::vector<uint8_t> block = {1, 2, 3, 4};
  uint8_t out[4];
  codec::kBytes.encode(Value::bytes(block), out, 4);
  EXPECT_EQ(block, codec::kBytes.decode(out, 4).asBytes());
  EXPECT_THROW(codec::kBytes.encode(Value::bytes(block), out, 3),
               std::length_error);
}

TEST(FieldCodec, SpareHasNoCodec)
{
  EXPECT_TRUE(codec::kSpare.spare);
  EXPECT_FALSE(codec::kU16.spare);
}
