#pragma once

#include <cstddef>
#include <random>

/**
 * @file RandomSource.h
 * @brief 可注入的随机数来源，便于用固定种子复现抽取结果。
 */

/**
 * @brief 随机数来源接口。
 */
class RandomSource {
public:
  virtual ~RandomSource() = default;

  /// 返回 [lo, hi) 区间内均匀分布的实数。
  virtual double uniformReal(double lo, double hi) = 0;

  /// 返回 [0, count) 区间内均匀分布的下标，count 必须大于 0。
  virtual std::size_t uniformIndex(std::size_t count) = 0;
};

/**
 * @brief 基于 std::mt19937 的默认实现。
 */
class MersenneRandomSource : public RandomSource {
public:
  /// 使用非确定性种子构造。
  MersenneRandomSource();
  explicit MersenneRandomSource(unsigned int seed);

  double uniformReal(double lo, double hi) override;
  std::size_t uniformIndex(std::size_t count) override;

private:
  std::mt19937 engine_;
};
