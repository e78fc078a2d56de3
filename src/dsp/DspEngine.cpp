#include "DspEngine.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

DspEngine::DspEngine(double sampleRate, uint32_t analysisWindow)
  : sampleRate_(sampleRate > 0.0 ? sampleRate : 44100.0),
    window_(analysisWindow > 0 ? analysisWindow : 1024, 0.0f) {
  params_ = clampParameters(params_, sampleRate_);
  linearGain_ = std::pow(10.0, params_.gainDb / 20.0);
  updateFilter();
  updateSmoothing();
}

void DspEngine::setSampleRate(double sampleRate) {
  if (!(sampleRate > 0.0)) throw std::invalid_argument("sample rate must be > 0");
  sampleRate_ = sampleRate;
  // cutoff limit depends on the rate
  params_ = clampParameters(params_, sampleRate_);
  updateFilter();
  updateSmoothing();
}

std::vector<std::string> DspEngine::setParameters(const DspParameters& params) {
  std::vector<std::string> clamped;
  params_ = clampParameters(params, sampleRate_, &clamped);
  linearGain_ = std::pow(10.0, params_.gainDb / 20.0);
  updateFilter();
  updateSmoothing();
  return clamped;
}

void DspEngine::updateFilter() {
  if (designedCutoff_ == params_.cutoffHz && designedRate_ == sampleRate_) return;
  filter_ = designButterworthLowpass(sampleRate_, params_.cutoffHz);
  designedCutoff_ = params_.cutoffHz;
  designedRate_ = sampleRate_;
}

void DspEngine::updateSmoothing() {
  const double tau = std::max(1e-6, static_cast<double>(params_.integrationTimeSec));
  smoothCoef_ = std::exp(-1.0 / (tau * sampleRate_));
  silenceHold_ = std::max<uint64_t>(1, static_cast<uint64_t>(std::ceil(tau * sampleRate_)));
}

void DspEngine::process(StereoBlock& block) {
  const uint32_t frames = block.frames();
  if (block.right.size() != frames) throw std::invalid_argument("stereo block channel length mismatch");
  const double g = linearGain_;
  const double a = smoothCoef_;
  const double b = 1.0 - a;
  const bool filterOn = params_.filterEnabled;
  const size_t wlen = window_.size();
  for (uint32_t i = 0; i < frames; ++i) {
    double l = std::clamp(block.left[i] * g, -1.0, 1.0);
    double r = std::clamp(block.right[i] * g, -1.0, 1.0);
    // The filter always runs so its state tracks the signal while bypassed
    const double fl = butterworthStep(filter_, filterState_[0], l);
    const double fr = butterworthStep(filter_, filterState_[1], r);
    if (filterOn) { l = fl; r = fr; }
    block.left[i] = static_cast<float>(l);
    block.right[i] = static_cast<float>(r);

    msLeft_ = a * msLeft_ + b * (l * l);
    msRight_ = a * msRight_ + b * (r * r);
    // One integration time of silence drops the estimators to the floor
    if (std::fabs(l) < kMeterFloorLinear && std::fabs(r) < kMeterFloorLinear) {
      if (++silentRun_ >= silenceHold_) { msLeft_ = 0.0; msRight_ = 0.0; }
    } else {
      silentRun_ = 0;
    }
    window_[writeIndex_] = static_cast<float>(0.5 * (l + r));
    writeIndex_ = (writeIndex_ + 1) % wlen;
  }
  framesProcessed_ += frames;
}

MeterReadout DspEngine::readMeters() const {
  MeterReadout m;
  const double ms = 0.5 * (msLeft_ + msRight_);
  m.rmsDb = (ms > 0.0) ? std::max(kMeterFloorDb, 10.0 * std::log10(ms)) : kMeterFloorDb;
  m.rmsLeft = std::sqrt(msLeft_);
  m.rmsRight = std::sqrt(msRight_);
  if (m.rmsLeft < kMeterFloorLinear && m.rmsRight < kMeterFloorLinear) {
    m.panning = 0.0;
  } else {
    m.panning = std::clamp((m.rmsRight - m.rmsLeft) / (m.rmsRight + m.rmsLeft), -1.0, 1.0);
  }
  return m;
}

void DspEngine::copyAnalysisWindow(std::vector<float>& out) const {
  const size_t wlen = window_.size();
  out.resize(wlen);
  // writeIndex_ points at the oldest sample
  std::copy(window_.begin() + static_cast<std::ptrdiff_t>(writeIndex_), window_.end(), out.begin());
  std::copy(window_.begin(), window_.begin() + static_cast<std::ptrdiff_t>(writeIndex_),
            out.begin() + static_cast<std::ptrdiff_t>(wlen - writeIndex_));
}
