#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "Butterworth.hpp"
#include "DspParams.hpp"
#include "../core/SampleCodec.hpp"

constexpr double kMeterFloorDb = -100.0;
// Linear RMS at the floor level (10^(-100/20))
constexpr double kMeterFloorLinear = 1e-5;

// Current smoothed estimators, read by the metering scheduler.
struct MeterReadout {
  double rmsDb = kMeterFloorDb;
  double panning = 0.0;
  double rmsLeft = 0.0;
  double rmsRight = 0.0;
};

// Per-session processor: gain -> clip -> 4th-order low-pass -> metering accumulation.
// Not thread-safe; one session's strand owns it.
class DspEngine {
public:
  explicit DspEngine(double sampleRate = 44100.0, uint32_t analysisWindow = 1024);

  // Retune for a new sample rate. Filter state is kept.
  void setSampleRate(double sampleRate);
  double sampleRate() const { return sampleRate_; }

  // Clamp and apply parameters; takes effect on the next process() call.
  // Returns the names of parameters that had to be clamped.
  std::vector<std::string> setParameters(const DspParameters& params);
  const DspParameters& parameters() const { return params_; }

  // Process one frame in place.
  void process(StereoBlock& block);

  MeterReadout readMeters() const;
  // Most recent analysisWindow mono samples, oldest first (zeros before any audio).
  void copyAnalysisWindow(std::vector<float>& out) const;
  uint32_t analysisWindowSize() const { return static_cast<uint32_t>(window_.size()); }
  uint64_t framesProcessed() const { return framesProcessed_; }

  // Filter state, exposed for continuity checks
  const ButterworthState& filterState(int channel) const { return filterState_[channel]; }

private:
  void updateFilter();
  void updateSmoothing();

  double sampleRate_;
  DspParameters params_{};
  double linearGain_ = 1.0;
  ButterworthCoeffs filter_{};
  std::array<ButterworthState, 2> filterState_{};
  double designedCutoff_ = 0.0;
  double designedRate_ = 0.0;

  double smoothCoef_ = 0.0;
  double msLeft_ = 0.0;
  double msRight_ = 0.0;
  uint64_t silentRun_ = 0;   // consecutive frames below the floor on both channels
  uint64_t silenceHold_ = 1; // integration time in frames

  std::vector<float> window_;
  size_t writeIndex_ = 0;
  uint64_t framesProcessed_ = 0;
};
