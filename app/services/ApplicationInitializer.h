// UTF-8
#pragma once

#include <memory>

#include "core/config/Settings.h"

class ClickPlayer;
class RandomSource;

/**
 * 应用初始化与依赖装配服务。
 * 职责：根据当前配置合成点击音并创建播放器。
 * 注意：仅做应用层装配，不承载任何 UI 逻辑。
 */
class ApplicationInitializer {
public:
  /**
   * 合成点击波形（启动时只做一次）并创建播放器。
   * - 配置关闭音频或合成失败时返回 nullptr，调用方应跳过播放。
   */
  static std::unique_ptr<ClickPlayer> createClickPlayer(const Settings& settings, RandomSource& random);
};
