#include "SampleCodec.hpp"
#include "Errors.hpp"
#include <string>

static inline int16_t readLe16(const uint8_t* p) {
  return static_cast<int16_t>(static_cast<uint16_t>(p[0]) | (static_cast<uint16_t>(p[1]) << 8));
}

StereoBlock decodeInterleaved(const uint8_t* data, size_t bytes) {
  if (bytes == 0 || data == nullptr) throw DecodeError("empty PCM frame");
  if (bytes % kStereoFrameBytes != 0) {
    throw DecodeError("PCM frame length " + std::to_string(bytes) + " is not a multiple of " +
                      std::to_string(kStereoFrameBytes) + " bytes");
  }
  const uint32_t frames = static_cast<uint32_t>(bytes / kStereoFrameBytes);
  StereoBlock block;
  block.left.resize(frames);
  block.right.resize(frames);
  const uint8_t* p = data;
  for (uint32_t i = 0; i < frames; ++i) {
    block.left[i] = sampleToFloat(readLe16(p));
    block.right[i] = sampleToFloat(readLe16(p + kBytesPerSample));
    p += kStereoFrameBytes;
  }
  return block;
}

StereoBlock decodeMono(const uint8_t* data, size_t bytes) {
  if (bytes == 0 || data == nullptr) throw DecodeError("empty PCM frame");
  if (bytes % kBytesPerSample != 0) {
    throw DecodeError("mono PCM frame length " + std::to_string(bytes) + " is odd");
  }
  const uint32_t frames = static_cast<uint32_t>(bytes / kBytesPerSample);
  StereoBlock block;
  block.left.resize(frames);
  for (uint32_t i = 0; i < frames; ++i) block.left[i] = sampleToFloat(readLe16(data + i * kBytesPerSample));
  block.right = block.left;
  return block;
}

std::vector<int16_t> encodeInterleaved(const StereoBlock& block) {
  const uint32_t frames = block.frames();
  std::vector<int16_t> out(static_cast<size_t>(frames) * 2);
  for (uint32_t i = 0; i < frames; ++i) {
    out[2 * static_cast<size_t>(i)] = floatToSample(block.left[i]);
    out[2 * static_cast<size_t>(i) + 1] = floatToSample(block.right[i]);
  }
  return out;
}

std::vector<uint8_t> encodeInterleavedBytes(const StereoBlock& block) {
  const std::vector<int16_t> samples = encodeInterleaved(block);
  std::vector<uint8_t> out;
  out.reserve(samples.size() * kBytesPerSample);
  for (int16_t s : samples) {
    const uint16_t u = static_cast<uint16_t>(s);
    out.push_back(static_cast<uint8_t>(u & 0xFF));
    out.push_back(static_cast<uint8_t>((u >> 8) & 0xFF));
  }
  return out;
}
