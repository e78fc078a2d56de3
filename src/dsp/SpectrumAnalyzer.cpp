#include "SpectrumAnalyzer.hpp"
#include "DspEngine.hpp"
#include <fftw3.h>
#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>

// FFTW's planner is not thread-safe; execution of an existing plan is.
static std::mutex& fftwPlannerMutex() {
  static std::mutex m;
  return m;
}

SpectrumAnalyzer::SpectrumAnalyzer(uint32_t windowSize, uint32_t binCount)
  : windowSize_(windowSize), binCount_(binCount) {
  if (windowSize_ < 64 || (windowSize_ & (windowSize_ - 1)) != 0) {
    throw std::invalid_argument("spectrum window must be a power of two >= 64");
  }
  const uint32_t half = windowSize_ / 2;
  if (binCount_ == 0 || binCount_ > half) throw std::invalid_argument("spectrum bin count out of range");

  hann_.resize(windowSize_);
  double sum = 0.0;
  for (uint32_t n = 0; n < windowSize_; ++n) {
    hann_[n] = static_cast<float>(0.5 - 0.5 * std::cos(2.0 * M_PI * n / static_cast<double>(windowSize_ - 1)));
    sum += hann_[n];
  }
  // Amplitude of a full-scale sine maps to 1.0
  magnitudeScale_ = 2.0 / sum;

  // Log-spaced band edges from bin 1 to Nyquist; every band covers at least one bin
  bands_.reserve(binCount_);
  uint32_t lo = 1;
  for (uint32_t b = 0; b < binCount_; ++b) {
    const double edge = std::pow(static_cast<double>(half), static_cast<double>(b + 1) / binCount_);
    uint32_t hi = static_cast<uint32_t>(std::lround(edge)) + 1;
    const uint32_t remaining = binCount_ - b - 1;
    hi = std::max(hi, lo + 1);
    hi = std::min(hi, half + 1 - remaining);
    bands_.push_back(Band{lo, hi});
    lo = hi;
  }

  std::lock_guard<std::mutex> lock(fftwPlannerMutex());
  in_ = static_cast<float*>(fftwf_malloc(sizeof(float) * windowSize_));
  out_ = fftwf_malloc(sizeof(fftwf_complex) * (half + 1));
  if (!in_ || !out_) {
    fftwf_free(in_); fftwf_free(out_);
    throw std::runtime_error("fftwf_malloc failed");
  }
  plan_ = fftwf_plan_dft_r2c_1d(static_cast<int>(windowSize_), in_, static_cast<fftwf_complex*>(out_), FFTW_ESTIMATE);
  if (!plan_) {
    fftwf_free(in_); fftwf_free(out_);
    throw std::runtime_error("fftwf_plan_dft_r2c_1d failed");
  }
}

SpectrumAnalyzer::~SpectrumAnalyzer() {
  std::lock_guard<std::mutex> lock(fftwPlannerMutex());
  if (plan_) fftwf_destroy_plan(static_cast<fftwf_plan>(plan_));
  fftwf_free(in_);
  fftwf_free(out_);
}

void SpectrumAnalyzer::analyze(const std::vector<float>& samples, std::vector<float>& outBins) {
  if (samples.size() != windowSize_) throw std::invalid_argument("spectrum input size mismatch");
  outBins.assign(binCount_, 0.0f);
  for (uint32_t n = 0; n < windowSize_; ++n) in_[n] = samples[n] * hann_[n];
  fftwf_execute(static_cast<fftwf_plan>(plan_));

  const fftwf_complex* spec = static_cast<const fftwf_complex*>(out_);
  double loudest = 0.0;
  for (uint32_t b = 0; b < binCount_; ++b) {
    double peak = 0.0;
    for (uint32_t k = bands_[b].lo; k < bands_[b].hi; ++k) {
      const double re = spec[k][0], im = spec[k][1];
      peak = std::max(peak, std::sqrt(re * re + im * im) * magnitudeScale_);
    }
    outBins[b] = static_cast<float>(peak);
    loudest = std::max(loudest, peak);
  }
  if (loudest < kMeterFloorLinear) {
    std::fill(outBins.begin(), outBins.end(), 0.0f);
    return;
  }
  for (auto& v : outBins) v = static_cast<float>(std::min(1.0, v / loudest));
}
