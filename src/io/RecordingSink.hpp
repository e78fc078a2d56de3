#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "AudioFileWriter.hpp"
#include "RecordingCatalog.hpp"
#include "../dsp/DspParams.hpp"

struct RecordingRequest {
  std::string sessionId;
  uint32_t sampleRate = 44100;
  uint32_t channels = 2;       // input channel count; the file is always stereo
  DspParameters settings{};
};

struct RecordingOutcome {
  bool ok = false;
  RecordingRecord record{};    // valid when ok
  std::string error;           // set when !ok
};

// Creates the writer for each new recording; empty means a plain AudioFileWriter.
using AudioFileWriterFactory = std::function<std::unique_ptr<AudioFileWriter>()>;

// Pick a free filename "rec_<yyyymmdd_HHMMSS>_<session prefix>[_n].wav" inside dir.
std::string makeRecordingFilename(const std::string& dir, const std::string& sessionId,
                                  std::chrono::system_clock::time_point when);

// Asynchronous WAV writer for one session. The producer (session strand) queues
// interleaved stereo blocks; a writer thread drains them in order. The queue is
// bounded in frames and a full queue blocks the producer.
class RecordingSink {
public:
  RecordingSink(std::string recordingsDir, RecordingCatalog* catalog, double maxQueuedSeconds = 10.0,
                AudioFileWriterFactory writerFactory = {});
  ~RecordingSink();
  RecordingSink(const RecordingSink&) = delete;
  RecordingSink& operator=(const RecordingSink&) = delete;

  // Open a new file and start the writer thread. A recording already in progress
  // is finalized first. Throws StorageError if the file cannot be created.
  void start(const RecordingRequest& req);

  bool active() const { return active_; }
  bool failed() const;

  // Queue interleaved L,R samples. No-op when idle; data is discarded after a write failure.
  void append(const std::vector<int16_t>& interleaved);

  // Drain the queue, finalize the header and persist the record.
  RecordingOutcome stop();

  // Frames accepted by append() since start (written or still queued).
  uint64_t framesQueuedTotal() const { return framesAccepted_; }

private:
  void writerLoop();

  std::string dir_;
  RecordingCatalog* catalog_;
  double maxQueuedSeconds_;
  AudioFileWriterFactory writerFactory_;

  RecordingRequest req_{};
  std::chrono::system_clock::time_point startedAt_{};
  std::string filename_;
  std::unique_ptr<AudioFileWriter> writer_;
  std::thread thread_;
  bool active_ = false;
  uint64_t framesAccepted_ = 0;

  mutable std::mutex m_;
  std::condition_variable cv_;
  std::deque<std::vector<int16_t>> queue_;
  uint64_t queuedFrames_ = 0;
  uint64_t maxQueuedFrames_ = 0;
  bool stopping_ = false;
  bool failed_ = false;
  std::string error_;
};
