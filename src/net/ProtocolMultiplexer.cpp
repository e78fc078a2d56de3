#include "ProtocolMultiplexer.hpp"
#include <cstdio>
#include <nlohmann/json.hpp>
#include "ControlMessage.hpp"
#include "../core/Diagnostics.hpp"
#include "../core/Errors.hpp"

using nlohmann::json;

static constexpr uint32_t kDefaultSampleRate = 44100;
static constexpr uint32_t kDefaultChannels = 2;

std::string ProtocolMultiplexer::serializeMeter(const MeteringSample& m) {
  json j;
  j["type"] = "meter";
  j["rms"] = m.rmsDb;
  j["spectrum"] = m.spectrum;
  j["panning"] = m.panning;
  return j.dump();
}

std::string ProtocolMultiplexer::serializeRecordingSaved(const RecordingRecord& rec) {
  json j;
  j["type"] = "recording_saved";
  j["id"] = rec.id;
  j["filename"] = rec.filename;
  return j.dump();
}

void ProtocolMultiplexer::sessionLost(const SessionNotFound& e) {
  std::fprintf(stderr, "[protocol] %s\n", e.what());
  closing_ = true;
  sink_.closeConnection(kCloseSessionNotFound, "session not found");
}

void ProtocolMultiplexer::onText(const std::string& text) {
  if (closing_) return;
  ControlMessage msg;
  try {
    msg = parseControlMessage(text);
  } catch (const ProtocolError& e) {
    std::fprintf(stderr, "[protocol] %s: ignoring message: %s\n", sessionId_.c_str(), e.what());
    return;
  }
  if (gVerbose) std::fprintf(stderr, "[protocol] %s: %s\n", sessionId_.c_str(), controlActionName(msg.action));

  try {
    switch (msg.action) {
      case ControlAction::Init:
        registry_.initialize(sessionId_, msg.sampleRate.value_or(kDefaultSampleRate),
                             msg.channels.value_or(kDefaultChannels));
        break;
      case ControlAction::StartRecord: {
        auto s = registry_.require(sessionId_);
        try {
          s->startRecording(msg.sampleRate, msg.channels);
        } catch (const StorageError& e) {
          std::fprintf(stderr, "[record] %s: cannot start: %s\n", sessionId_.c_str(), e.what());
        }
        break;
      }
      case ControlAction::StopRecord: {
        auto s = registry_.require(sessionId_);
        if (!s->recording()) {
          std::fprintf(stderr, "[protocol] %s: stop_record without active recording\n", sessionId_.c_str());
          break;
        }
        const RecordingOutcome out = s->stopRecording();
        if (out.ok) sink_.sendNotice(serializeRecordingSaved(out.record));
        break;
      }
      case ControlAction::SetParams:
        registry_.require(sessionId_)->applyParameters(msg.params);
        break;
    }
  } catch (const SessionNotFound& e) {
    sessionLost(e);
  } catch (const ProtocolError& e) {
    std::fprintf(stderr, "[protocol] %s: %s failed: %s\n", sessionId_.c_str(), controlActionName(msg.action), e.what());
  }
}

void ProtocolMultiplexer::onBinary(const uint8_t* data, size_t bytes) {
  if (closing_) return;
  try {
    registry_.require(sessionId_)->ingest(data, bytes);
  } catch (const SessionNotFound& e) {
    sessionLost(e);
  } catch (const DecodeError& e) {
    std::fprintf(stderr, "[protocol] %s: frame dropped: %s\n", sessionId_.c_str(), e.what());
  }
}

void ProtocolMultiplexer::onMeterTick() {
  if (closing_) return;
  auto s = registry_.find(sessionId_);
  if (!s || s->closed()) return;
  sink_.sendMeter(serializeMeter(s->meterTick()));
}

void ProtocolMultiplexer::onClose() {
  closing_ = true;
  if (released_) return;
  released_ = true;
  registry_.release(sessionId_);
}
