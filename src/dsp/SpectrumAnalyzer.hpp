#pragma once

#include <cstdint>
#include <vector>

// Hann-windowed real FFT grouped into a fixed number of log-spaced bands,
// normalized so the loudest band is 1.0 (all zeros below the meter floor).
class SpectrumAnalyzer {
public:
  SpectrumAnalyzer(uint32_t windowSize, uint32_t binCount);
  ~SpectrumAnalyzer();
  SpectrumAnalyzer(const SpectrumAnalyzer&) = delete;
  SpectrumAnalyzer& operator=(const SpectrumAnalyzer&) = delete;

  uint32_t windowSize() const { return windowSize_; }
  uint32_t binCount() const { return binCount_; }

  // samples.size() must equal windowSize(). outBins is resized to binCount().
  void analyze(const std::vector<float>& samples, std::vector<float>& outBins);

private:
  struct Band { uint32_t lo; uint32_t hi; }; // FFT bin range [lo, hi)

  uint32_t windowSize_;
  uint32_t binCount_;
  std::vector<float> hann_;
  std::vector<Band> bands_;
  double magnitudeScale_ = 1.0;
  float* in_ = nullptr;
  void* out_ = nullptr;  // fftwf_complex*
  void* plan_ = nullptr; // fftwf_plan
};
