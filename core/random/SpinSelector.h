#pragma once

#include <cstddef>
#include <optional>

#include "core/model/ServerRecord.h"
#include "core/model/SpinConfig.h"
#include "core/random/RandomSource.h"

/**
 * @file SpinSelector.h
 * @brief 抽取获胜服务器并计算滚动目标。
 */

/// 一次抽取的完整计划，抽取后在整个动画期间保持不变。
struct SpinPlan {
  ServerRecord winner;
  std::size_t winner_index{0};
  std::size_t loops{0};        ///< 完整循环列表的次数。
  std::size_t target_row{0};   ///< 获胜条目在重复序列中的虚拟行号。
  double duration_seconds{0.0};
  double start_offset{0.0};
  double target_offset{0.0};
};

/**
 * @brief 计算至少需要循环列表的次数：max(min_loops, ceil(target_scroll_rows / size))。
 * @param listingSize 列表长度，必须大于 0。
 */
std::size_t loopCountFor(std::size_t listingSize, const SpinConfig& config = SpinConfig());

class SpinSelector {
public:
  explicit SpinSelector(RandomSource& random, SpinConfig config = SpinConfig());

  /**
   * 从列表中均匀抽取获胜者并生成滚动计划。
   * 随机数的抽取顺序依次为：获胜下标、时长、偏移。
   * @return 列表为空时返回 std::nullopt。
   */
  std::optional<SpinPlan> selectWinner(const Listing& listing) const;

  const SpinConfig& config() const { return config_; }

private:
  RandomSource& random_;
  SpinConfig config_;
};
