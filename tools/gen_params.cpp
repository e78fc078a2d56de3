#include <cstdio>
#include "../src/dsp/DspParams.hpp"

static void emitTable(const ParamMap& map) {
  std::printf("### %s\n\n", map.nodeType);
  std::printf("| id | set_params field | unit | min | max | default |\n");
  std::printf("|---:|------------------|------|----:|----:|--------:|\n");
  for (size_t i = 0; i < map.count; ++i) {
    const auto& d = map.defs[i];
    std::printf("| %u | %s | %s | %.3f | %.3f | %.3f |\n",
                d.id, d.name, d.unit, d.minValue, d.maxValue, d.defaultValue);
  }
  std::printf("\ncutoff_freq is additionally limited to %.2f x sample rate.\n\n", kMaxCutoffRatio);
}

int main() {
  std::printf("# DSP Parameters\n\n");
  std::printf("Auto-generated from DspParams.hpp. Do not edit by hand.\n\n");
  emitTable(kDspParamMap);
  return 0;
}
