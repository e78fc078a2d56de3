#include "Session.hpp"
#include <cstdio>
#include "../core/Diagnostics.hpp"
#include "../core/Errors.hpp"

static constexpr uint32_t kMaxSampleRate = 384000;

Session::Session(std::string id, const SessionOptions& options, RecordingCatalog* catalog)
  : id_(std::move(id)), options_(options),
    engine_(44100.0, options.spectrumWindow),
    scheduler_(options.meterInterval, options.spectrumWindow, options.spectrumBins),
    sink_(options.recordingsDir, catalog, options.maxQueuedRecordingSec, options.writerFactory) {}

Session::~Session() {
  if (!closed_) close();
}

void Session::init(uint32_t sampleRate, uint32_t channels) {
  if (sampleRate == 0 || sampleRate > kMaxSampleRate) {
    throw ProtocolError("invalid sample_rate " + std::to_string(sampleRate));
  }
  if (channels != 1 && channels != 2) {
    throw ProtocolError("invalid channels " + std::to_string(channels));
  }
  if (sampleRate != sampleRate_ && sink_.active()) {
    throw ProtocolError("cannot change sample_rate to " + std::to_string(sampleRate) + " while recording");
  }
  if (sampleRate != sampleRate_) engine_.setSampleRate(static_cast<double>(sampleRate));
  sampleRate_ = sampleRate;
  channels_ = channels;
  std::fprintf(stderr, "[session] %s init %u Hz, %u ch\n", id_.c_str(), sampleRate_, channels_);
}

std::vector<std::string> Session::applyParameters(const DspParameterUpdate& update) {
  const std::vector<std::string> clamped = engine_.setParameters(update.applyTo(engine_.parameters()));
  for (const auto& name : clamped) {
    std::fprintf(stderr, "[session] %s: %s out of range, clamped\n", id_.c_str(), name.c_str());
  }
  if (gVerbose) {
    const DspParameters& p = engine_.parameters();
    std::fprintf(stderr, "[session] %s params gain=%.2f dB filter=%d cutoff=%.1f Hz tau=%.3f s\n",
                 id_.c_str(), p.gainDb, p.filterEnabled ? 1 : 0, p.cutoffHz, p.integrationTimeSec);
  }
  return clamped;
}

void Session::ingest(const uint8_t* data, size_t bytes) {
  if (closed_) throw SessionNotFound(id_);
  StereoBlock block;
  try {
    block = (channels_ == 1) ? decodeMono(data, bytes) : decodeInterleaved(data, bytes);
  } catch (const DecodeError&) {
    ++decodeErrors_;
    throw;
  }
  if (sink_.active() && options_.recordSource == RecordSource::Raw) {
    sink_.append(encodeInterleaved(block));
  }
  engine_.process(block);
  if (sink_.active() && options_.recordSource == RecordSource::Processed) {
    sink_.append(encodeInterleaved(block));
  }
}

void Session::startRecording(std::optional<uint32_t> sampleRate, std::optional<uint32_t> channels) {
  if (closed_) throw SessionNotFound(id_);
  const uint32_t sr = sampleRate.value_or(sampleRate_);
  const uint32_t ch = channels.value_or(channels_);
  if (sr != sampleRate_ || ch != channels_) {
    // The open file is bound to the old rate; finish it before retuning
    if (sink_.active()) {
      const RecordingOutcome prev = sink_.stop();
      if (!prev.ok) std::fprintf(stderr, "[record] %s: previous recording failed: %s\n", id_.c_str(), prev.error.c_str());
    }
    init(sr, ch);
  }
  RecordingRequest req;
  req.sessionId = id_;
  req.sampleRate = sampleRate_;
  req.channels = channels_;
  req.settings = engine_.parameters();
  sink_.start(req);
}

RecordingOutcome Session::stopRecording() {
  if (closed_) throw SessionNotFound(id_);
  return sink_.stop();
}

std::optional<RecordingOutcome> Session::close() {
  if (closed_) return std::nullopt;
  closed_ = true;
  std::optional<RecordingOutcome> out;
  if (sink_.active()) out = sink_.stop();
  std::fprintf(stderr, "[session] %s closed (%llu frames, %llu rejected)\n", id_.c_str(),
               static_cast<unsigned long long>(engine_.framesProcessed()),
               static_cast<unsigned long long>(decodeErrors_));
  return out;
}
