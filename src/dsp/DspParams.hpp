#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

struct ParamDef {
  uint16_t id;
  const char* name;
  const char* unit;
  float minValue;
  float maxValue;
  float defaultValue;
};

struct ParamMap {
  const char* nodeType;
  const ParamDef* defs;
  size_t count;
};

enum DspParamId : uint16_t {
  kParamGainDb = 1,
  kParamFilterEnabled = 2,
  kParamCutoffHz = 3,
  kParamIntegrationTime = 4,
};

// Cutoff is further limited to this fraction of the sample rate (below Nyquist).
constexpr double kMaxCutoffRatio = 0.45;

static constexpr ParamDef kDspParams[] = {
  {kParamGainDb,          "gain",             "dB",   0.f,    60.f,     0.f},
  {kParamFilterEnabled,   "filter_enabled",   "bool", 0.f,     1.f,     0.f},
  {kParamCutoffHz,        "cutoff_freq",      "Hz",  20.f, 20000.f,  1000.f},
  {kParamIntegrationTime, "integration_time", "s",    0.001f, 10.f,     0.5f},
};

static constexpr ParamMap kDspParamMap{ "dsp", kDspParams, sizeof(kDspParams)/sizeof(kDspParams[0]) };

inline const ParamDef* findParamById(const ParamMap& map, uint16_t id) {
  for (size_t i = 0; i < map.count; ++i) {
    if (map.defs[i].id == id) return &map.defs[i];
  }
  return nullptr;
}

inline float paramDefault(uint16_t id) {
  const ParamDef* d = findParamById(kDspParamMap, id);
  return d ? d->defaultValue : 0.0f;
}

struct DspParameters {
  float gainDb = paramDefault(kParamGainDb);
  bool filterEnabled = paramDefault(kParamFilterEnabled) != 0.0f;
  float cutoffHz = paramDefault(kParamCutoffHz);
  float integrationTimeSec = paramDefault(kParamIntegrationTime);
};

// Clamp one value into its declared range; non-finite values fall back to the default.
// Returns true when the value had to be changed.
inline bool clampParam(uint16_t id, float& value, float upperLimit) {
  const ParamDef* d = findParamById(kDspParamMap, id);
  if (!d) return false;
  if (!std::isfinite(value)) { value = d->defaultValue; return true; }
  const float hi = std::min(d->maxValue, upperLimit);
  if (value < d->minValue) { value = d->minValue; return true; }
  if (value > hi) { value = hi; return true; }
  return false;
}

// ParameterError handling: out-of-range values are clamped, never rejected.
// Names of clamped parameters are appended to clamped (if given).
inline DspParameters clampParameters(DspParameters p, double sampleRate, std::vector<std::string>* clamped = nullptr) {
  const float noLimit = std::numeric_limits<float>::max();
  const float cutoffLimit = static_cast<float>(kMaxCutoffRatio * sampleRate);
  auto note = [&](bool changed, uint16_t id) {
    if (changed && clamped) clamped->push_back(findParamById(kDspParamMap, id)->name);
  };
  note(clampParam(kParamGainDb, p.gainDb, noLimit), kParamGainDb);
  note(clampParam(kParamCutoffHz, p.cutoffHz, cutoffLimit), kParamCutoffHz);
  note(clampParam(kParamIntegrationTime, p.integrationTimeSec, noLimit), kParamIntegrationTime);
  return p;
}

// Partial update from a set_params message; absent fields keep their current value.
struct DspParameterUpdate {
  std::optional<float> gainDb;
  std::optional<bool> filterEnabled;
  std::optional<float> cutoffHz;
  std::optional<float> integrationTimeSec;

  DspParameters applyTo(DspParameters p) const {
    if (gainDb) p.gainDb = *gainDb;
    if (filterEnabled) p.filterEnabled = *filterEnabled;
    if (cutoffHz) p.cutoffHz = *cutoffHz;
    if (integrationTimeSec) p.integrationTimeSec = *integrationTimeSec;
    return p;
  }
};
