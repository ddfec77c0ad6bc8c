#pragma once

#include <optional>

#include "core/anim/SpinAnimator.h"
#include "core/model/ServerRecord.h"
#include "core/model/SpinConfig.h"
#include "core/random/RandomSource.h"
#include "core/random/SpinSelector.h"

/**
 * @file RouletteEngine.h
 * @brief 转盘状态机：列表快照、玩家数范围、抽取与逐帧推进。
 */

/// 转盘所处阶段。
enum class RoulettePhase {
  Idle,     ///< 可抽取（或尚未拉取）。
  Loading,  ///< 正在拉取列表。
  Spinning, ///< 正在滚动。
  Settled   ///< 滚动结束；拉取结果为空时也进入该阶段。
};

const char* phaseName(RoulettePhase phase);

/// 玩家数过滤范围（闭区间）。
struct PlayerRange {
  int min_players{60};
  int max_players{100};
};

/**
 * @brief 转盘核心，只在界面线程中使用。
 *
 * 列表只会被 completeFetch() 整体替换，不做原地修改。
 */
class RouletteEngine {
public:
  static constexpr int kPlayerLimit = 100;

  explicit RouletteEngine(RandomSource& random,
                          SpinConfig config = SpinConfig(),
                          PlayerRange initialRange = PlayerRange());

  RoulettePhase phase() const { return phase_; }
  const Listing& listing() const { return listing_; }
  const PlayerRange& playerRange() const { return range_; }
  const SpinConfig& config() const { return config_; }

  /// 列表是否与当前玩家数范围不一致，需要重新拉取。
  bool isStale() const { return stale_; }

  /// 设置最少玩家数，限制在 [0, kPlayerLimit]；数值变化时标记列表过期。
  void setMinPlayers(int value);
  /// 设置最多玩家数，限制在 [0, kPlayerLimit]；数值变化时标记列表过期。
  void setMaxPlayers(int value);

  /**
   * @brief 开始一次拉取。
   * @return 需要拉取的范围；已有拉取进行中时返回 std::nullopt。
   */
  std::optional<PlayerRange> beginFetch();

  /**
   * @brief 应用拉取结果，整体替换列表。
   * 若仍处于 Loading：非空列表进入 Idle，空列表进入 Settled。
   */
  void completeFetch(Listing listing);

  bool canSpin() const;

  /**
   * @brief 开始一次抽取。
   * @return 列表为空、已过期、正在拉取或正在滚动时返回 false 且不改变状态。
   */
  bool requestSpin();

  /**
   * @brief 逐帧推进滚动。
   * @param elapsedSeconds 自开始滚动以来经过的秒数。
   */
  TickResult tick(double elapsedSeconds);

  double currentOffset() const { return animator_.currentOffset(); }
  const SpinAnimator& animator() const { return animator_; }
  const std::optional<SpinPlan>& currentPlan() const { return plan_; }

  /// 滚动结束后的获胜者；其余情况返回 nullptr。
  const ServerRecord* winner() const;

private:
  SpinConfig config_;
  SpinSelector selector_;
  SpinAnimator animator_;
  RoulettePhase phase_{RoulettePhase::Idle};
  Listing listing_;
  PlayerRange range_;
  bool stale_{true};
  std::optional<SpinPlan> plan_;
};
