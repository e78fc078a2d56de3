#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "MeteringScheduler.hpp"
#include "../dsp/DspEngine.hpp"
#include "../io/RecordingSink.hpp"

// Which signal the recording sink receives.
enum class RecordSource { Processed, Raw };

// Per-session settings taken from the server configuration.
struct SessionOptions {
  std::string recordingsDir = "recordings_data";
  std::chrono::milliseconds meterInterval{50};
  uint32_t spectrumWindow = 1024;
  uint32_t spectrumBins = 64;
  RecordSource recordSource = RecordSource::Processed;
  double maxQueuedRecordingSec = 10.0;
  bool purgeOnDisconnect = false;
  AudioFileWriterFactory writerFactory; // empty: WAV files through libsndfile
};

// One client's processing context. Every call comes from the owning connection's strand.
class Session {
public:
  Session(std::string id, const SessionOptions& options, RecordingCatalog* catalog);
  ~Session();
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  const std::string& id() const { return id_; }

  // Configure rate and input channel count (1 or 2). Parameters and filter state are kept.
  // Throws ProtocolError on an invalid rate or channel count, or on a rate change
  // while recording.
  void init(uint32_t sampleRate, uint32_t channels);
  uint32_t sampleRate() const { return sampleRate_; }
  uint32_t channels() const { return channels_; }

  // Returns the names of clamped parameters.
  std::vector<std::string> applyParameters(const DspParameterUpdate& update);
  const DspParameters& parameters() const { return engine_.parameters(); }

  // Decode, process and (when recording) queue one PCM frame.
  // Throws SessionNotFound after close(), DecodeError on a malformed frame.
  void ingest(const uint8_t* data, size_t bytes);

  // Start a new recording; a rate or channel count different from the session's
  // re-initializes the session first. Throws StorageError.
  void startRecording(std::optional<uint32_t> sampleRate, std::optional<uint32_t> channels);
  RecordingOutcome stopRecording();
  bool recording() const { return sink_.active(); }

  MeteringSample meterTick() { return scheduler_.tick(engine_); }
  std::chrono::milliseconds meterInterval() const { return scheduler_.interval(); }

  // Terminal: finalizes an active recording and rejects further frames.
  std::optional<RecordingOutcome> close();
  bool closed() const { return closed_; }

  const DspEngine& engine() const { return engine_; }

private:
  std::string id_;
  SessionOptions options_;
  uint32_t sampleRate_ = 44100;
  uint32_t channels_ = 2;
  DspEngine engine_;
  MeteringScheduler scheduler_;
  RecordingSink sink_;
  bool closed_ = false;
  uint64_t decodeErrors_ = 0;
};
