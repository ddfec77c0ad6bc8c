#include "core/audio/ClickSynth.h"

#include <stdexcept>

namespace click {

std::vector<float> synthesize(int sampleRate, int durationMs, RandomSource& random) {
  if (sampleRate <= 0 || durationMs <= 0) {
    throw std::invalid_argument("click synthesis requires a positive sample rate and duration");
  }
  const long long total = static_cast<long long>(sampleRate) * durationMs / 1000;
  const auto count = static_cast<std::size_t>(total);

  std::vector<float> samples;
  samples.reserve(count);
  double last = 0.0;
  for (std::size_t i = 0; i < count; ++i) {
    const double raw = random.uniformReal(-1.0, 1.0);
    const double filtered = last * kLowPassFeedback + raw * kLowPassInput;
    last = filtered;
    const double decay = 1.0 - static_cast<double>(i) / static_cast<double>(count);
    samples.push_back(static_cast<float>(filtered * decay * decay) * kGain);
  }
  return samples;
}

} // namespace click
