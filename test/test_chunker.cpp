#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <vector>

#include "ocean_ros_driver/bcd_utils.hpp"
#include "ocean_ros_driver/checksum.hpp"
#include "ocean_ros_driver/chunker.hpp"
#include "ocean_ros_driver/nortek_records.hpp"
#include "test_helpers.hpp"

using ocean::BinaryMatcher;
using ocean::Chunk;
using ocean::MatcherList;
using ocean::PatternMatcher;
using ocean::StreamChunker;
using ocean_test::fromHex;

namespace {

// Any two bytes followed by the acknowledgement: the bare battery reply.
size_t matchTwoBytesAck(const uint8_t* d, size_t n)
{
  if (n < 4 || d[2] != 0x06 || d[3] != 0x06) return 0;
  return 4;
}

std::vector<uint8_t> noise(size_t n)
{
  return std::vector<uint8_t>(n, 0xFF);
}

void append(std::vector<uint8_t>& dst, const std::vector<uint8_t>& src)
{
  dst.insert(dst.end(), src.begin(), src.end());
}

std::vector<std::vector<uint8_t>> drain(StreamChunker& c)
{
  std::vector<std::vector<uint8_t>> out;
  std::vector<uint8_t> f;
  double ts = 0.0;
  while (c.nextChunk(f, ts))
  {
    out.push_back(f);
  }
  return out;
}

}  // namespace

TEST(BinaryMatcher, FindsEveryCompleteFrame)
{
  std::vector<uint8_t> v = fromHex(ocean_test::kVelocityHex);
  std::vector<uint8_t> buf = noise(3);
  append(buf, v);
  append(buf, noise(5));
  append(buf, v);
  append(buf, std::vector<uint8_t>(v.begin(), v.begin() + 10));

  BinaryMatcher m("velocity", {0xA5, 0x01, 0x15, 0x00}, 42);
  std::vector<Chunk> found;
  m.findAll(buf.data(), buf.size(), found);
  ASSERT_EQ(2u, found.size());
  EXPECT_EQ((Chunk{3, 45}), found[0]);
  EXPECT_EQ((Chunk{50, 92}), found[1]);
}

TEST(BinaryMatcher, TrailerMustBePresent)
{
  std::vector<uint8_t> hw = fromHex(ocean_test::kHardwareConfigHex);
  BinaryMatcher m("hw", {0xA5, 0x05, 0x18, 0x00}, 48, {0x06, 0x06});
  EXPECT_EQ(50u, m.frameLength());

  std::vector<Chunk> found;
  m.findAll(hw.data(), hw.size(), found);
  ASSERT_EQ(1u, found.size());

  hw[49] = 0x15;
  found.clear();
  m.findAll(hw.data(), hw.size(), found);
  EXPECT_TRUE(found.empty());
}

TEST(Sieve, OrdersByStartOffset)
{
  std::vector<uint8_t> clock = fromHex(ocean_test::kClockHex);
  std::vector<uint8_t> v = fromHex(ocean_test::kVelocityHex);
  std::vector<uint8_t> buf;
  append(buf, clock);
  append(buf, noise(2));
  append(buf, v);
  append(buf, clock);

  std::vector<Chunk> found =
      ocean::sieve(buf.data(), buf.size(), ocean::nortek::frameMatchers());
  ASSERT_EQ(3u, found.size());
  EXPECT_EQ((Chunk{0, 8}), found[0]);
  EXPECT_EQ((Chunk{10, 52}), found[1]);
  EXPECT_EQ((Chunk{52, 60}), found[2]);
}

TEST(Sieve, EarlierMatchWinsOverlap)
{
  // 00 A5 06 06 ...: a bare acknowledgement pair at 0, a frame at 1
  std::vector<uint8_t> buf = {0x00, 0xA5, 0x06, 0x06, 1, 2, 3, 4, 5};
  MatcherList matchers = {
      std::make_shared<BinaryMatcher>("long", std::vector<uint8_t>{0xA5, 0x06, 0x06}, 8),
      std::make_shared<PatternMatcher>("battery", matchTwoBytesAck)};

  std::vector<Chunk> found = ocean::sieve(buf.data(), buf.size(), matchers);
  ASSERT_EQ(1u, found.size());
  EXPECT_EQ((Chunk{0, 4}), found[0]);
}

TEST(Sieve, LongestWinsAtTheSameStart)
{
  std::vector<uint8_t> id = fromHex(ocean_test::kIdBatteryHex);
  MatcherList matchers = {
      std::make_shared<PatternMatcher>("battery", matchTwoBytesAck),
      ocean::nortek::idBatteryMatcher()};

  std::vector<Chunk> found = ocean::sieve(id.data(), id.size(), matchers);
  ASSERT_EQ(1u, found.size());
  EXPECT_EQ((Chunk{0, 20}), found[0]);

  // without the combined matcher the battery pattern splits the reply
  MatcherList battery_only = {matchers[0]};
  found = ocean::sieve(id.data(), id.size(), battery_only);
  EXPECT_GT(found.size(), 1u);
}

TEST(StreamChunker, CombinedFramesInOneRead)
{
  StreamChunker c(ocean::nortek::frameMatchers());
  std::vector<uint8_t> v = fromHex(ocean_test::kVelocityHex);
  std::vector<uint8_t> buf = v;
  append(buf, noise(7));
  append(buf, v);

  c.addData(buf.data(), buf.size(), 1.0);
  std::vector<std::vector<uint8_t>> frames = drain(c);
  ASSERT_EQ(2u, frames.size());
  EXPECT_EQ(v, frames[0]);
  EXPECT_EQ(v, frames[1]);
  EXPECT_EQ(0u, c.buffered());
}

TEST(StreamChunker, FragmentationInvariance)
{
  // error code 06 06 makes bytes 4..11 of this record look like a clock reply
  std::vector<uint8_t> tricky = fromHex(ocean_test::kVelocityHex);
  tricky[10] = 0x06;
  tricky[11] = 0x06;
  ocean::writeU16Le(&tricky[40], ocean::checksumBytes(ocean::kChecksumSeed,
                                                      tricky.data(), 40));

  std::vector<uint8_t> stream = noise(4);
  append(stream, fromHex(ocean_test::kClockHex));
  append(stream, noise(3));
  append(stream, fromHex(ocean_test::kVelocityHex));
  append(stream, fromHex(ocean_test::kIdBatteryHex));
  append(stream, fromHex(ocean_test::kHardwareConfigHex));
  append(stream, noise(2));
  append(stream, tricky);
  append(stream, noise(1));

  StreamChunker whole(ocean::nortek::frameMatchers());
  whole.addData(stream.data(), stream.size(), 0.0);
  std::vector<std::vector<uint8_t>> expected = drain(whole);
  ASSERT_EQ(5u, expected.size());
  EXPECT_EQ(tricky, expected.back());

  for (size_t step : {1u, 2u, 5u, 13u, 20u, 64u})
  {
    StreamChunker c(ocean::nortek::frameMatchers());
    std::vector<std::vector<uint8_t>> got;
    for (size_t i = 0; i < stream.size(); i += step)
    {
      size_t n = std::min(step, stream.size() - i);
      c.addData(stream.data() + i, n, static_cast<double>(i));
      std::vector<std::vector<uint8_t>> part = drain(c);
      got.insert(got.end(), part.begin(), part.end());
    }
    EXPECT_EQ(expected, got) << "step " << step;
  }
}

TEST(StreamChunker, NoiseIsSkipped)
{
  StreamChunker c(ocean::nortek::frameMatchers());
  std::vector<uint8_t> junk = noise(30);
  c.addData(junk.data(), junk.size(), 1.0);
  EXPECT_EQ(0u, c.pending());
  EXPECT_EQ(30u, c.buffered());

  std::vector<uint8_t> clock = fromHex(ocean_test::kClockHex);
  c.addData(clock.data(), clock.size(), 2.0);
  EXPECT_EQ(1u, c.pending());
  EXPECT_EQ(0u, c.buffered());
}

TEST(StreamChunker, ChunkCarriesTimestampOfItsFirstByte)
{
  StreamChunker c(ocean::nortek::frameMatchers());
  std::vector<uint8_t> v = fromHex(ocean_test::kVelocityHex);
  c.addData(v.data(), 10, 100.0);
  EXPECT_EQ(0u, c.pending());
  c.addData(v.data() + 10, v.size() - 10, 200.0);

  std::vector<uint8_t> f;
  double ts = 0.0;
  ASSERT_TRUE(c.nextChunk(f, ts));
  EXPECT_EQ(v, f);
  EXPECT_DOUBLE_EQ(100.0, ts);
  EXPECT_FALSE(c.nextChunk(f, ts));
}

TEST(StreamChunker, PatternInsidePartialFrameIsHeldBack)
{
  std::vector<uint8_t> v = fromHex(ocean_test::kVelocityHex);
  v[10] = 0x06;
  v[11] = 0x06;

  StreamChunker c(ocean::nortek::frameMatchers());
  c.addData(v.data(), 20, 1.0);
  EXPECT_EQ(0u, c.pending());
  EXPECT_EQ(20u, c.buffered());

  c.addData(v.data() + 20, v.size() - 20, 2.0);
  std::vector<std::vector<uint8_t>> frames = drain(c);
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(v, frames[0]);
}

TEST(StreamChunker, BufferIsBounded)
{
  StreamChunker c(ocean::nortek::frameMatchers(), 16);
  std::vector<uint8_t> junk = noise(10);
  c.addData(junk.data(), junk.size(), 1.0);
  c.addData(junk.data(), junk.size(), 2.0);
  EXPECT_EQ(16u, c.buffered());

  c.clean();
  EXPECT_EQ(0u, c.buffered());
  EXPECT_EQ(0u, c.pending());
}
