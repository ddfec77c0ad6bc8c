#include "core/anim/SpinAnimator.h"

#include <cmath>

#include "core/anim/Easing.h"

SpinAnimator::SpinAnimator(SpinConfig config) : config_(config) {}

void SpinAnimator::start(const SpinPlan& plan) {
  running_ = true;
  elapsed_ = 0.0;
  durationSeconds_ = plan.duration_seconds;
  startOffset_ = plan.start_offset;
  targetOffset_ = plan.target_offset;
  currentOffset_ = plan.start_offset;
  lastCrossedRow_ = -1;
}

TickResult SpinAnimator::tick(double elapsedSeconds) {
  if (!running_) {
    return {};
  }
  elapsed_ = elapsedSeconds;
  if (durationSeconds_ <= 0.0) {
    return settle();
  }

  const double t = elapsed_ / durationSeconds_;
  if (t >= 1.0) {
    return settle();
  }

  const double eased = easing::brakeOut(t, config_.braking_power);
  const double offset = startOffset_ + (targetOffset_ - startOffset_) * eased;
  // 曲线尾部无限逼近终点，距离足够小时直接收敛
  if (std::abs(targetOffset_ - offset) < config_.settle_threshold) {
    return settle();
  }

  currentOffset_ = offset;
  TickResult result;
  result.crossed_rows = registerCrossing(offset);
  return result;
}

int SpinAnimator::virtualRowAt(double offset) const {
  return static_cast<int>(std::floor((offset + config_.row_height * 0.5) / config_.row_height));
}

int SpinAnimator::registerCrossing(double offset) {
  const int row = virtualRowAt(offset);
  if (row <= lastCrossedRow_) {
    return 0;
  }
  const int crossed = row - lastCrossedRow_;
  lastCrossedRow_ = row;
  return crossed;
}

TickResult SpinAnimator::settle() {
  currentOffset_ = targetOffset_;
  TickResult result;
  result.crossed_rows = registerCrossing(targetOffset_);
  result.settled = true;
  running_ = false;
  return result;
}
