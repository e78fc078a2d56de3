#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "../dsp/DspParams.hpp"

enum class ControlAction { Init, StartRecord, StopRecord, SetParams };

const char* controlActionName(ControlAction a);

// Typed form of one text control message.
struct ControlMessage {
  ControlAction action = ControlAction::Init;
  std::optional<uint32_t> sampleRate;  // init, start_record
  std::optional<uint32_t> channels;    // init, start_record
  DspParameterUpdate params;           // set_params
};

// Parse a JSON control document. Throws ProtocolError for malformed JSON, a
// missing or unknown action, or a field of the wrong type.
ControlMessage parseControlMessage(const std::string& text);
