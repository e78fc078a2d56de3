#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <vector>
#include "../dsp/DspEngine.hpp"
#include "../dsp/SpectrumAnalyzer.hpp"

struct MeteringSample {
  double rmsDb = kMeterFloorDb;
  std::vector<float> spectrum;
  double panning = 0.0;
};

// Produces one MeteringSample per wall-clock tick from the engine's current
// estimators. The owner drives tick() from a timer on the session's strand, so
// the engine read never races with ingestion.
class MeteringScheduler {
public:
  MeteringScheduler(std::chrono::milliseconds interval, uint32_t windowSize, uint32_t binCount)
    : interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(50)),
      analyzer_(windowSize, binCount) {}

  std::chrono::milliseconds interval() const { return interval_; }

  MeteringSample tick(const DspEngine& engine) {
    MeteringSample out;
    out.spectrum.assign(analyzer_.binCount(), 0.0f);
    if (engine.framesProcessed() == 0) {
      // Nothing received yet: report floor values instead of stalling
      return out;
    }
    const MeterReadout m = engine.readMeters();
    out.rmsDb = m.rmsDb;
    out.panning = m.panning;

    engine.copyAnalysisWindow(scratch_);
    if (scratch_.size() != analyzer_.windowSize()) scratch_.resize(analyzer_.windowSize(), 0.0f);
    analyzer_.analyze(scratch_, bins_);

    // Spectrum smoothing over ticks, time constant = integration time
    const double tau = engine.parameters().integrationTimeSec;
    const double dt = static_cast<double>(interval_.count()) / 1000.0;
    const double alpha = (tau > 0.0) ? std::exp(-dt / tau) : 0.0;
    if (smoothed_.size() != bins_.size()) {
      smoothed_ = bins_;
    } else {
      for (size_t i = 0; i < bins_.size(); ++i) {
        smoothed_[i] = static_cast<float>(alpha * smoothed_[i] + (1.0 - alpha) * bins_[i]);
      }
    }
    out.spectrum = smoothed_;
    ++ticks_;
    return out;
  }

  uint64_t ticks() const { return ticks_; }

private:
  std::chrono::milliseconds interval_;
  SpectrumAnalyzer analyzer_;
  std::vector<float> scratch_{};
  std::vector<float> bins_{};
  std::vector<float> smoothed_{};
  uint64_t ticks_ = 0;
};
