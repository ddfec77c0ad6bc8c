#include "core/config/Settings.h"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

/**
 * @file Settings.cpp
 * @brief Load application settings from an optional read-only JSON file.
 */

namespace {

constexpr const char* kSettingsFileName = "squad_roulette.json";

int clampPlayers(int value) {
  return std::clamp(value, 0, 100);
}

} // namespace

std::optional<std::filesystem::path> Settings::locateConfigFile() {
  // 在 setting_config/ 子目录和目录本身中搜索，最多向上搜索 3 层。
  std::error_code ec;
  auto cursor = std::filesystem::current_path(ec);
  if (ec) {
    return std::nullopt;
  }
  for (int depth = 0; depth < 3 && !cursor.empty(); ++depth) {
    const auto inSettings = cursor / "setting_config" / kSettingsFileName;
    if (std::filesystem::is_regular_file(inSettings, ec)) {
      return inSettings;
    }
    const auto direct = cursor / kSettingsFileName;
    if (std::filesystem::is_regular_file(direct, ec)) {
      return direct;
    }
    if (cursor == cursor.parent_path()) {
      break;
    }
    cursor = cursor.parent_path();
  }
  return std::nullopt;
}

void Settings::applyJson(const nlohmann::json& j) {
  apiBaseUrl = j.value("apiBaseUrl", apiBaseUrl);
  gameId = j.value("gameId", gameId);
  requestTimeoutMs = j.value("requestTimeoutMs", requestTimeoutMs);
  defaultMinPlayers = clampPlayers(j.value("defaultMinPlayers", defaultMinPlayers));
  defaultMaxPlayers = clampPlayers(j.value("defaultMaxPlayers", defaultMaxPlayers));
  clickSampleRate = j.value("clickSampleRate", clickSampleRate);
  clickDurationMs = j.value("clickDurationMs", clickDurationMs);
  audioEnabled = j.value("audioEnabled", audioEnabled);
  logLevel = j.value("logLevel", logLevel);

  // 非法的音频参数回退到默认值，避免启动时合成失败
  const Settings defaults;
  if (clickSampleRate <= 0) {
    spdlog::warn("Invalid clickSampleRate {}, using {}", clickSampleRate, defaults.clickSampleRate);
    clickSampleRate = defaults.clickSampleRate;
  }
  if (clickDurationMs <= 0) {
    spdlog::warn("Invalid clickDurationMs {}, using {}", clickDurationMs, defaults.clickDurationMs);
    clickDurationMs = defaults.clickDurationMs;
  }
  if (requestTimeoutMs <= 0) {
    requestTimeoutMs = defaults.requestTimeoutMs;
  }
}

Settings Settings::loadFrom(const std::filesystem::path& path) {
  Settings settings;
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    spdlog::warn("Settings file {} could not be opened, using defaults.", path.string());
    return settings;
  }
  try {
    nlohmann::json j;
    ifs >> j;
    settings.applyJson(j);
    spdlog::info("Loaded settings from {}", path.string());
  } catch (const nlohmann::json::exception& e) {
    spdlog::error("Failed to parse settings file {}: {}", path.string(), e.what());
    settings = Settings{};
  }
  return settings;
}

Settings Settings::load() {
  if (const auto path = locateConfigFile()) {
    return loadFrom(*path);
  }
  spdlog::info("Settings file {} not found, using defaults.", kSettingsFileName);
  return Settings{};
}
