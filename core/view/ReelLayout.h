#pragma once

#include <cstddef>
#include <vector>

#include "core/model/ServerRecord.h"
#include "core/model/SpinConfig.h"

/**
 * @file ReelLayout.h
 * @brief 将列表与滚动位置映射为转盘窗口中可见的行。
 */

/// 窗口中的一行。
struct ReelRow {
  int virtual_row{0};                 ///< 在重复序列中的虚拟行号。
  const ServerRecord* record{nullptr};///< 指向列表中的条目，生命周期随列表。
  double top{0.0};                    ///< 相对窗口顶部的纵坐标。
};

class ReelLayout {
public:
  explicit ReelLayout(SpinConfig config = SpinConfig());

  /// 列表需要重复的次数：max(ceil((target_scroll_rows + extra_rows) / size), 循环次数) + 2；空列表为 0。
  std::size_t repetitionsFor(std::size_t listingSize) const;

  /// 重复后的总行数。
  std::size_t totalRows(std::size_t listingSize) const;

  /// 窗口顶部对应的滚动距离，使 offset 所在的行位于窗口中线。
  double scrollTopFor(double offset, double viewportHeight) const;

  /**
   * @brief 计算窗口内可见的行，结果写入 out（先清空）。
   * 复用 out 的容量，逐帧调用时不产生额外分配。
   */
  void visibleRows(const Listing& listing, double offset, double viewportHeight, std::vector<ReelRow>& out) const;

  double rowHeight() const { return config_.row_height; }

private:
  SpinConfig config_;
};
