#pragma once

#include "core/model/SpinConfig.h"
#include "core/random/SpinSelector.h"

/**
 * @file SpinAnimator.h
 * @brief 逐帧推进滚动位置，检测虚拟行越过并判定结束。
 */

/// 单帧推进的结果。
struct TickResult {
  int crossed_rows{0}; ///< 本帧越过的虚拟行数，大于 0 时应播放一次点击音。
  bool settled{false}; ///< 本帧是否到达终点。
};

/**
 * @brief 滚动动画调度器。
 *
 * 不持有时钟：调用方每帧传入自开始以来的秒数。
 * tick() 不做 I/O、不分配内存。
 */
class SpinAnimator {
public:
  explicit SpinAnimator(SpinConfig config = SpinConfig());

  /// 按计划重置动画状态并开始滚动。
  void start(const SpinPlan& plan);

  /**
   * @brief 推进一帧。
   * @param elapsedSeconds 自开始滚动以来经过的秒数。
   * @return 本帧越过的行数与是否结束；未在滚动时返回空结果。
   */
  TickResult tick(double elapsedSeconds);

  bool isRunning() const { return running_; }
  double elapsed() const { return elapsed_; }
  double currentOffset() const { return currentOffset_; }
  double startOffset() const { return startOffset_; }
  double targetOffset() const { return targetOffset_; }
  double durationSeconds() const { return durationSeconds_; }
  /// 已越过的最大虚拟行号，-1 表示尚未越过任何行。
  int lastCrossedRow() const { return lastCrossedRow_; }

  /// 给定滚动位置所对应的（位于标记线下的）虚拟行号。
  int virtualRowAt(double offset) const;

private:
  int registerCrossing(double offset);
  TickResult settle();

  SpinConfig config_;
  bool running_{false};
  double elapsed_{0.0};
  double durationSeconds_{0.0};
  double startOffset_{0.0};
  double targetOffset_{0.0};
  double currentOffset_{0.0};
  int lastCrossedRow_{-1};
};
