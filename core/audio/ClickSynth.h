#pragma once

#include <vector>

#include "core/random/RandomSource.h"

/**
 * @file ClickSynth.h
 * @brief 合成转盘滚动时的“咔哒”声。
 */

namespace click {

inline constexpr double kLowPassFeedback = 0.85; ///< 上一采样的权重。
inline constexpr double kLowPassInput = 0.15;    ///< 新噪声采样的权重。
inline constexpr float kGain = 3.0f;             ///< 输出增益，不做限幅。

/**
 * @brief 生成单声道点击波形：白噪声经一阶低通后乘以平方衰减包络。
 * @param sampleRate 采样率（Hz），必须大于 0。
 * @param durationMs 时长（毫秒），必须大于 0。
 * @param random 噪声来源。
 * @return 长度为 sampleRate * durationMs / 1000 的采样。
 * @throws std::invalid_argument 参数非法时。
 */
std::vector<float> synthesize(int sampleRate, int durationMs, RandomSource& random);

} // namespace click
