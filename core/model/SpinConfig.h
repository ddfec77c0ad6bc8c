#pragma once

#include <cstddef>

/**
 * @file SpinConfig.h
 * @brief 转盘动画的固定参数。
 */

struct SpinConfig {
  double row_height{80.0};            ///< 每个虚拟行的高度（距离单位）。
  std::size_t target_scroll_rows{100};///< 每次滚动至少经过的虚拟行数。
  std::size_t min_loops{3};           ///< 至少完整循环列表的次数。
  double min_duration_s{10.0};        ///< 动画时长下限（含）。
  double max_duration_s{15.0};        ///< 动画时长上限（不含）。
  double jitter{30.0};                ///< 停止位置的随机偏移幅度，取值 [-jitter, jitter)。
  int braking_power{7};               ///< 缓动曲线的指数。
  double settle_threshold{0.5};       ///< 距目标小于该值时提前结束。
  std::size_t extra_rows{10};         ///< 渲染时在目标行之外额外准备的行数。
};
