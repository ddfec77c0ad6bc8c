#include <gtest/gtest.h>

#include <cmath>

#include "core/anim/Easing.h"
#include "core/anim/SpinAnimator.h"

namespace {

SpinPlan makePlan(double targetOffset, double durationSeconds) {
  SpinPlan plan;
  plan.duration_seconds = durationSeconds;
  plan.start_offset = 0.0;
  plan.target_offset = targetOffset;
  return plan;
}

struct RunTotals {
  int clicks{0};    ///< 报告越过行的帧数。
  int crossed{0};   ///< 越过的行数总和。
  int ticks{0};
  bool settled{false};
};

/// 以固定步长推进直到结束，并检查滚动位置单调不减。
RunTotals runToCompletion(SpinAnimator& animator, double step) {
  RunTotals totals;
  double previous = animator.currentOffset();
  for (double elapsed = 0.0; totals.ticks < 100000; elapsed += step) {
    const TickResult result = animator.tick(elapsed);
    ++totals.ticks;
    EXPECT_GE(animator.currentOffset(), previous);
    previous = animator.currentOffset();
    totals.crossed += result.crossed_rows;
    if (result.crossed_rows > 0) {
      ++totals.clicks;
    }
    if (result.settled) {
      totals.settled = true;
      break;
    }
  }
  return totals;
}

} // namespace

TEST(EasingTest, BrakeCurveIsMonotonicFromZeroToOne) {
  EXPECT_DOUBLE_EQ(easing::brakeOut(0.0), 0.0);
  EXPECT_DOUBLE_EQ(easing::brakeOut(1.0), 1.0);
  EXPECT_DOUBLE_EQ(easing::brakeOut(1.5), 1.0);
  EXPECT_NEAR(easing::brakeOut(0.5), 1.0 - std::pow(0.5, 7), 1e-12);

  double previous = 0.0;
  for (int i = 1; i <= 1000; ++i) {
    const double value = easing::brakeOut(i / 1000.0);
    EXPECT_GE(value, previous);
    previous = value;
  }
  EXPECT_GT(easing::brakeOut(0.1), 0.5);
}

TEST(EasingTest, TailEndsWithinSettleThresholdForLargestTarget) {
  // 5 页 × 100 条时目标行最大约为 2000 行
  const double largestTarget = 2000.0 * 80.0 + 30.0;
  const double remaining = largestTarget * (1.0 - easing::brakeOut(0.99));
  EXPECT_LT(remaining, 0.5);
}

TEST(SpinAnimatorTest, FirstTickCrossesTheStartingRow) {
  SpinAnimator animator;
  animator.start(makePlan(8010.0, 10.0));
  EXPECT_TRUE(animator.isRunning());
  EXPECT_EQ(animator.lastCrossedRow(), -1);

  const TickResult result = animator.tick(0.0);
  EXPECT_EQ(result.crossed_rows, 1);
  EXPECT_FALSE(result.settled);
  EXPECT_EQ(animator.lastCrossedRow(), 0);
  EXPECT_DOUBLE_EQ(animator.currentOffset(), 0.0);
}

TEST(SpinAnimatorTest, OffsetFollowsTheBrakeCurve) {
  SpinAnimator animator;
  animator.start(makePlan(8010.0, 10.0));
  animator.tick(2.5);
  EXPECT_NEAR(animator.currentOffset(), 8010.0 * easing::brakeOut(0.25), 1e-9);
  EXPECT_EQ(animator.lastCrossedRow(), animator.virtualRowAt(animator.currentOffset()));
}

TEST(SpinAnimatorTest, CoarseAndFineTicksProduceTheSameCrossings) {
  const double target = 100.0 * 80.0 + 10.0;
  const int expectedRows = static_cast<int>(std::floor((target + 40.0) / 80.0)) + 1;

  SpinAnimator fine;
  fine.start(makePlan(target, 10.0));
  const RunTotals fineTotals = runToCompletion(fine, 1.0 / 240.0);

  SpinAnimator coarse;
  coarse.start(makePlan(target, 10.0));
  const RunTotals coarseTotals = runToCompletion(coarse, 0.5);

  ASSERT_TRUE(fineTotals.settled);
  ASSERT_TRUE(coarseTotals.settled);
  EXPECT_EQ(fineTotals.crossed, expectedRows);
  EXPECT_EQ(coarseTotals.crossed, expectedRows);
  EXPECT_EQ(fine.lastCrossedRow(), 100);
  EXPECT_EQ(coarse.lastCrossedRow(), 100);
  EXPECT_LE(coarseTotals.clicks, coarseTotals.ticks);
  EXPECT_GT(fineTotals.clicks, coarseTotals.clicks);
}

TEST(SpinAnimatorTest, ConvergesEarlyInsideTheThreshold) {
  SpinAnimator animator;
  animator.start(makePlan(8010.0, 10.0));

  // (1 - 0.7)^7 * 8010 ≈ 1.75，仍在滚动
  EXPECT_FALSE(animator.tick(7.0).settled);
  EXPECT_TRUE(animator.isRunning());

  // (1 - 0.8)^7 * 8010 ≈ 0.10，小于 0.5 直接收敛
  const TickResult result = animator.tick(8.0);
  EXPECT_TRUE(result.settled);
  EXPECT_FALSE(animator.isRunning());
  EXPECT_DOUBLE_EQ(animator.currentOffset(), 8010.0);
}

TEST(SpinAnimatorTest, ElapsedBeyondDurationSnapsToTarget) {
  SpinAnimator animator;
  animator.start(makePlan(4030.0, 12.0));
  const TickResult result = animator.tick(12.0);
  EXPECT_TRUE(result.settled);
  EXPECT_DOUBLE_EQ(animator.currentOffset(), 4030.0);
  EXPECT_EQ(result.crossed_rows, animator.virtualRowAt(4030.0) + 1);
}

TEST(SpinAnimatorTest, TickAfterSettleIsNoOp) {
  SpinAnimator animator;
  animator.start(makePlan(2000.0, 10.0));
  ASSERT_TRUE(animator.tick(20.0).settled);
  const double offset = animator.currentOffset();
  const int lastRow = animator.lastCrossedRow();

  for (double elapsed : {20.0, 25.0, 0.0}) {
    const TickResult again = animator.tick(elapsed);
    EXPECT_FALSE(again.settled);
    EXPECT_EQ(again.crossed_rows, 0);
    EXPECT_DOUBLE_EQ(animator.currentOffset(), offset);
    EXPECT_EQ(animator.lastCrossedRow(), lastRow);
  }
}

TEST(SpinAnimatorTest, RestartResetsState) {
  SpinAnimator animator;
  animator.start(makePlan(2000.0, 10.0));
  animator.tick(20.0);
  ASSERT_FALSE(animator.isRunning());

  animator.start(makePlan(3000.0, 11.0));
  EXPECT_TRUE(animator.isRunning());
  EXPECT_EQ(animator.lastCrossedRow(), -1);
  EXPECT_DOUBLE_EQ(animator.currentOffset(), 0.0);
  EXPECT_DOUBLE_EQ(animator.elapsed(), 0.0);
  EXPECT_DOUBLE_EQ(animator.targetOffset(), 3000.0);
}

TEST(SpinAnimatorTest, VirtualRowSwitchesAtHalfRow) {
  SpinAnimator animator;
  EXPECT_EQ(animator.virtualRowAt(0.0), 0);
  EXPECT_EQ(animator.virtualRowAt(39.9), 0);
  EXPECT_EQ(animator.virtualRowAt(40.0), 1);
  EXPECT_EQ(animator.virtualRowAt(119.9), 1);
  EXPECT_EQ(animator.virtualRowAt(120.0), 2);
}
