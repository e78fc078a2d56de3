#pragma once

#include <cstdint>
#include <string>
#include "../core/Errors.hpp"
#include "../io/RecordingCatalog.hpp"
#include "../session/MeteringScheduler.hpp"
#include "../session/SessionRegistry.hpp"

// WebSocket close codes used by the audio endpoint
constexpr uint16_t kCloseMissingSessionId = 4000;
constexpr uint16_t kCloseSessionInUse = 4001;
constexpr uint16_t kCloseSessionNotFound = 4004;

// Outgoing side of one connection.
class MessageSink {
public:
  virtual ~MessageSink() = default;
  // Delivered in order, never dropped.
  virtual void sendNotice(std::string text) = 0;
  // Replaces any meter message not yet written.
  virtual void sendMeter(std::string text) = 0;
  virtual void closeConnection(uint16_t code, const std::string& reason) = 0;
};

// Routes one connection's text and binary messages to its session.
// All calls come from the connection's strand.
class ProtocolMultiplexer {
public:
  ProtocolMultiplexer(std::string sessionId, SessionRegistry& registry, MessageSink& sink)
    : sessionId_(std::move(sessionId)), registry_(registry), sink_(sink) {}

  void onText(const std::string& text);
  void onBinary(const uint8_t* data, size_t bytes);
  void onMeterTick();
  // Transport closed: tear down the session and release the id.
  void onClose();

  bool closing() const { return closing_; }
  const std::string& sessionId() const { return sessionId_; }

  static std::string serializeMeter(const MeteringSample& m);
  static std::string serializeRecordingSaved(const RecordingRecord& rec);

private:
  void sessionLost(const SessionNotFound& e);

  std::string sessionId_;
  SessionRegistry& registry_;
  MessageSink& sink_;
  bool closing_ = false;
  bool released_ = false;
};
