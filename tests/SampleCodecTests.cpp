#include <gtest/gtest.h>
#include <cstdint>
#include <vector>
#include "core/Errors.hpp"
#include "core/SampleCodec.hpp"

static std::vector<uint8_t> toBytes(const std::vector<int16_t>& samples) {
  std::vector<uint8_t> out;
  for (int16_t s : samples) {
    const uint16_t u = static_cast<uint16_t>(s);
    out.push_back(static_cast<uint8_t>(u & 0xFF));
    out.push_back(static_cast<uint8_t>(u >> 8));
  }
  return out;
}

TEST(SampleCodec, EveryInt16CodeSurvivesDecodeEncode) {
  std::vector<int16_t> samples;
  samples.reserve(65536 * 2);
  for (int v = -32768; v <= 32767; ++v) {
    samples.push_back(static_cast<int16_t>(v));
    samples.push_back(static_cast<int16_t>(-1 - v)); // mirrored on the right channel
  }
  const std::vector<uint8_t> bytes = toBytes(samples);
  const StereoBlock block = decodeInterleaved(bytes.data(), bytes.size());
  ASSERT_EQ(block.frames(), 65536u);
  EXPECT_EQ(encodeInterleaved(block), samples);
  EXPECT_EQ(encodeInterleavedBytes(block), bytes);
}

TEST(SampleCodec, AsymmetricScaling) {
  EXPECT_FLOAT_EQ(sampleToFloat(-32768), -1.0f);
  EXPECT_FLOAT_EQ(sampleToFloat(32767), 1.0f);
  EXPECT_FLOAT_EQ(sampleToFloat(0), 0.0f);
  EXPECT_FLOAT_EQ(sampleToFloat(-16384), -0.5f);
}

TEST(SampleCodec, EncodeClampsOutOfRange) {
  EXPECT_EQ(floatToSample(1.5f), 32767);
  EXPECT_EQ(floatToSample(-2.0f), -32768);
  EXPECT_EQ(floatToSample(0.0f), 0);
  EXPECT_EQ(floatToSample(-0.0f), 0);
}

TEST(SampleCodec, DecodeSplitsChannels) {
  const std::vector<uint8_t> bytes = toBytes({100, -200, 300, -400});
  const StereoBlock block = decodeInterleaved(bytes.data(), bytes.size());
  ASSERT_EQ(block.frames(), 2u);
  EXPECT_FLOAT_EQ(block.left[0], 100.0f / 32767.0f);
  EXPECT_FLOAT_EQ(block.right[0], -200.0f / 32768.0f);
  EXPECT_FLOAT_EQ(block.left[1], 300.0f / 32767.0f);
  EXPECT_FLOAT_EQ(block.right[1], -400.0f / 32768.0f);
}

TEST(SampleCodec, MonoIsDuplicated) {
  const std::vector<uint8_t> bytes = toBytes({1000, -1000, 5});
  const StereoBlock block = decodeMono(bytes.data(), bytes.size());
  ASSERT_EQ(block.frames(), 3u);
  EXPECT_EQ(block.left, block.right);
  EXPECT_EQ(encodeInterleaved(block), (std::vector<int16_t>{1000, 1000, -1000, -1000, 5, 5}));
}

TEST(SampleCodec, RejectsPartialFrames) {
  const std::vector<uint8_t> six(6, 0);
  EXPECT_THROW(decodeInterleaved(six.data(), six.size()), DecodeError);
  EXPECT_THROW(decodeInterleaved(six.data(), 0), DecodeError);
  const std::vector<uint8_t> three(3, 0);
  EXPECT_THROW(decodeMono(three.data(), three.size()), DecodeError);
  EXPECT_NO_THROW(decodeMono(six.data(), six.size()));
}
