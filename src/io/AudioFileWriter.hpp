#pragma once

#include <sndfile.h>
#include <cstdint>
#include <string>
#include "../core/Errors.hpp"

struct AudioFileSpec {
  uint32_t sampleRate = 44100;
  uint32_t channels = 2;
};

// Incremental 16-bit PCM WAV writer. The header is finalized on close().
// Virtual so the recording sink can be handed a different writer.
class AudioFileWriter {
public:
  AudioFileWriter() = default;
  virtual ~AudioFileWriter() {
    if (file_) sf_close(file_);
  }
  AudioFileWriter(const AudioFileWriter&) = delete;
  AudioFileWriter& operator=(const AudioFileWriter&) = delete;

  virtual void open(const std::string& path, const AudioFileSpec& spec) {
    if (file_) throw StorageError("AudioFileWriter already open: " + path_);
    SF_INFO info{};
    info.samplerate = static_cast<int>(spec.sampleRate);
    info.channels = static_cast<int>(spec.channels);
    info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;
    if (!sf_format_check(&info)) throw StorageError("unsupported WAV format for " + path);
    file_ = sf_open(path.c_str(), SFM_WRITE, &info);
    if (!file_) throw StorageError("sf_open failed for " + path + ": " + sf_strerror(nullptr));
    path_ = path;
    spec_ = spec;
    framesWritten_ = 0;
  }

  virtual void writeFrames(const int16_t* interleaved, uint64_t frames) {
    if (!file_) throw StorageError("AudioFileWriter not open");
    const sf_count_t n = static_cast<sf_count_t>(frames);
    const sf_count_t wrote = sf_writef_short(file_, interleaved, n);
    if (wrote > 0) framesWritten_ += static_cast<uint64_t>(wrote);
    if (wrote != n) {
      throw StorageError("short write to " + path_ + ": " + sf_strerror(file_));
    }
  }

  virtual void close() {
    if (!file_) return;
    SNDFILE* f = file_;
    file_ = nullptr;
    const int err = sf_close(f);
    if (err != 0) throw StorageError("sf_close failed for " + path_ + ": " + sf_error_number(err));
  }

  bool isOpen() const { return file_ != nullptr; }
  const std::string& path() const { return path_; }
  uint64_t framesWritten() const { return framesWritten_; }
  const AudioFileSpec& spec() const { return spec_; }

private:
  SNDFILE* file_ = nullptr;
  std::string path_;
  AudioFileSpec spec_{};
  uint64_t framesWritten_ = 0;
};
