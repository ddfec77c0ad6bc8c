// UTF-8
#include "app/services/ApplicationInitializer.h"

#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "app/audio/ClickPlayer.h"
#include "core/audio/ClickSynth.h"
#include "core/random/RandomSource.h"

std::unique_ptr<ClickPlayer> ApplicationInitializer::createClickPlayer(const Settings& settings, RandomSource& random) {
  if (!settings.audioEnabled) {
    spdlog::info("Click audio disabled by settings");
    return nullptr;
  }
  std::vector<float> samples;
  try {
    samples = click::synthesize(settings.clickSampleRate, settings.clickDurationMs, random);
  } catch (const std::invalid_argument& ex) {
    spdlog::error("Click synthesis failed: {}", ex.what());
    return nullptr;
  }
  return std::make_unique<ClickPlayer>(samples, settings.clickSampleRate);
}
