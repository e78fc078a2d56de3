#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// De-interleaved stereo block of normalized samples in [-1, 1].
struct StereoBlock {
  std::vector<float> left;
  std::vector<float> right;

  uint32_t frames() const { return static_cast<uint32_t>(left.size()); }
  void resize(uint32_t numFrames) {
    left.assign(numFrames, 0.0f);
    right.assign(numFrames, 0.0f);
  }
};

constexpr size_t kBytesPerSample = 2;
constexpr size_t kStereoFrameBytes = 2 * kBytesPerSample;

// Asymmetric int16 range: negative codes scale by 32768, non-negative by 32767.
inline float sampleToFloat(int16_t s) {
  return (s < 0) ? static_cast<float>(s / 32768.0) : static_cast<float>(s / 32767.0);
}

// Clamp, scale, truncate toward zero. The guard keeps a decoded code from
// falling to its neighbour through float representation error.
inline int16_t floatToSample(float x) {
  constexpr double kTruncGuard = 0.01;
  double v = static_cast<double>(x);
  if (!(v > -1.0)) v = -1.0; // also maps NaN to -1
  if (v > 1.0) v = 1.0;
  if (v < 0.0) return static_cast<int16_t>(v * 32768.0 - kTruncGuard);
  return static_cast<int16_t>(v * 32767.0 + kTruncGuard);
}

// Decode little-endian interleaved L,R int16. Throws DecodeError unless
// bytes is a positive multiple of kStereoFrameBytes.
StereoBlock decodeInterleaved(const uint8_t* data, size_t bytes);

// Decode a mono int16 stream and duplicate it to both channels.
StereoBlock decodeMono(const uint8_t* data, size_t bytes);

// Re-interleave L,R as int16 samples.
std::vector<int16_t> encodeInterleaved(const StereoBlock& block);

// Re-interleave L,R as little-endian bytes.
std::vector<uint8_t> encodeInterleavedBytes(const StereoBlock& block);
