#include "ControlMessage.hpp"
#include <cmath>
#include <nlohmann/json.hpp>
#include "../core/Errors.hpp"

using nlohmann::json;

const char* controlActionName(ControlAction a) {
  switch (a) {
    case ControlAction::Init: return "init";
    case ControlAction::StartRecord: return "start_record";
    case ControlAction::StopRecord: return "stop_record";
    case ControlAction::SetParams: return "set_params";
  }
  return "?";
}

static std::optional<uint32_t> optUInt(const json& j, const char* key) {
  if (!j.contains(key) || j[key].is_null()) return std::nullopt;
  const json& v = j[key];
  if (!v.is_number()) throw ProtocolError(std::string("field '") + key + "' must be a number");
  const double d = v.get<double>();
  if (!std::isfinite(d) || d < 0.0 || d > 4294967295.0) {
    throw ProtocolError(std::string("field '") + key + "' out of range");
  }
  return static_cast<uint32_t>(d);
}

static std::optional<float> optFloat(const json& j, const char* key) {
  if (!j.contains(key) || j[key].is_null()) return std::nullopt;
  const json& v = j[key];
  if (!v.is_number()) throw ProtocolError(std::string("field '") + key + "' must be a number");
  return v.get<float>();
}

static std::optional<bool> optBool(const json& j, const char* key) {
  if (!j.contains(key) || j[key].is_null()) return std::nullopt;
  const json& v = j[key];
  if (v.is_boolean()) return v.get<bool>();
  if (v.is_number()) return v.get<double>() != 0.0;
  throw ProtocolError(std::string("field '") + key + "' must be a boolean");
}

ControlMessage parseControlMessage(const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ProtocolError(std::string("malformed JSON: ") + e.what());
  }
  if (!j.is_object()) throw ProtocolError("control message must be a JSON object");
  if (!j.contains("action") || !j["action"].is_string()) throw ProtocolError("missing 'action'");

  const std::string action = j["action"].get<std::string>();
  ControlMessage msg;
  if (action == "init") {
    msg.action = ControlAction::Init;
    msg.sampleRate = optUInt(j, "sample_rate");
    msg.channels = optUInt(j, "channels");
  } else if (action == "start_record") {
    msg.action = ControlAction::StartRecord;
    msg.sampleRate = optUInt(j, "sample_rate");
    msg.channels = optUInt(j, "channels");
  } else if (action == "stop_record") {
    msg.action = ControlAction::StopRecord;
  } else if (action == "set_params") {
    msg.action = ControlAction::SetParams;
    msg.params.gainDb = optFloat(j, "gain");
    msg.params.filterEnabled = optBool(j, "filter_enabled");
    msg.params.cutoffHz = optFloat(j, "cutoff_freq");
    msg.params.integrationTimeSec = optFloat(j, "integration_time");
  } else {
    throw ProtocolError("unknown action '" + action + "'");
  }
  return msg;
}
