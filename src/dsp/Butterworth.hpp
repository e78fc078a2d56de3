#pragma once

#include <array>
#include <cmath>

// Second-order section, transposed direct form II.
struct BiquadCoeffs { double b0 = 1, b1 = 0, b2 = 0, a1 = 0, a2 = 0; };
struct BiquadState { double s1 = 0, s2 = 0; };

// Pure step: (state, coeffs, x) -> (state', y). The state carries over unchanged
// when the coefficients are replaced, so retuning never clears the delay line.
inline double biquadStep(const BiquadCoeffs& c, BiquadState& s, double x) {
  const double y = c.b0 * x + s.s1;
  s.s1 = c.b1 * x - c.a1 * y + s.s2;
  s.s2 = c.b2 * x - c.a2 * y;
  return y;
}

// RBJ low-pass section (bilinear transform, prewarped at cutoffHz).
inline BiquadCoeffs designLowpass(double sampleRate, double cutoffHz, double q) {
  const double w0 = 2.0 * M_PI * (cutoffHz / sampleRate);
  const double cosw = std::cos(w0), sinw = std::sin(w0);
  const double alpha = sinw / (2.0 * q);
  const double a0 = 1.0 + alpha;
  BiquadCoeffs c{};
  c.b0 = ((1.0 - cosw) * 0.5) / a0;
  c.b1 = (1.0 - cosw) / a0;
  c.b2 = ((1.0 - cosw) * 0.5) / a0;
  c.a1 = (-2.0 * cosw) / a0;
  c.a2 = (1.0 - alpha) / a0;
  return c;
}

// 4th-order Butterworth low-pass as two cascaded sections.
constexpr int kButterworthSections = 2;

struct ButterworthCoeffs { std::array<BiquadCoeffs, kButterworthSections> sections{}; };
struct ButterworthState { std::array<BiquadState, kButterworthSections> sections{}; };

inline ButterworthCoeffs designButterworthLowpass(double sampleRate, double cutoffHz) {
  // Section Qs are 1 / (2 cos(pi (2k+1) / 2N)) for N = 4
  static const double kQ[kButterworthSections] = {
    1.0 / (2.0 * std::cos(M_PI / 8.0)),
    1.0 / (2.0 * std::cos(3.0 * M_PI / 8.0)),
  };
  ButterworthCoeffs bw;
  for (int i = 0; i < kButterworthSections; ++i) bw.sections[i] = designLowpass(sampleRate, cutoffHz, kQ[i]);
  return bw;
}

inline double butterworthStep(const ButterworthCoeffs& c, ButterworthState& s, double x) {
  double y = x;
  for (int i = 0; i < kButterworthSections; ++i) y = biquadStep(c.sections[i], s.sections[i], y);
  return y;
}
