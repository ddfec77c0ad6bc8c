#pragma once

/**
 * @file Easing.h
 * @brief 减速缓动曲线。
 */

namespace easing {

/**
 * @brief 刹车曲线 1 - (1 - t)^power，t >= 1 时返回 1，t <= 0 时返回 0。
 */
inline double brakeOut(double t, int power = 7) {
  if (t >= 1.0) return 1.0;
  if (t <= 0.0) return 0.0;
  const double remaining = 1.0 - t;
  double tail = 1.0;
  for (int i = 0; i < power; ++i) {
    tail *= remaining;
  }
  return 1.0 - tail;
}

} // namespace easing
