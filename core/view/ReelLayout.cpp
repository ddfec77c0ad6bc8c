#include "core/view/ReelLayout.h"

#include <algorithm>
#include <cmath>

#include "core/random/SpinSelector.h"

ReelLayout::ReelLayout(SpinConfig config) : config_(config) {}

std::size_t ReelLayout::repetitionsFor(std::size_t listingSize) const {
  if (listingSize == 0) {
    return 0;
  }
  const std::size_t needed = config_.target_scroll_rows + config_.extra_rows;
  const std::size_t covering = (needed + listingSize - 1) / listingSize;
  // 长列表只循环 min_loops 次，目标行可能超出 needed，需保证其下方仍有整轮可绘制
  return std::max(covering, loopCountFor(listingSize, config_)) + 2;
}

std::size_t ReelLayout::totalRows(std::size_t listingSize) const {
  return repetitionsFor(listingSize) * listingSize;
}

double ReelLayout::scrollTopFor(double offset, double viewportHeight) const {
  return offset - (viewportHeight / 2.0 - config_.row_height / 2.0);
}

void ReelLayout::visibleRows(const Listing& listing,
                             double offset,
                             double viewportHeight,
                             std::vector<ReelRow>& out) const {
  out.clear();
  const std::size_t total = totalRows(listing.size());
  if (total == 0 || viewportHeight <= 0.0) {
    return;
  }

  const double scrollTop = scrollTopFor(offset, viewportHeight);
  const auto first = static_cast<long long>(std::floor(scrollTop / config_.row_height));
  const auto last = static_cast<long long>(std::ceil((scrollTop + viewportHeight) / config_.row_height));
  const long long begin = std::max(0LL, first);
  const long long end = std::min(static_cast<long long>(total), last);

  for (long long row = begin; row < end; ++row) {
    ReelRow entry;
    entry.virtual_row = static_cast<int>(row);
    entry.record = &listing[static_cast<std::size_t>(row) % listing.size()];
    entry.top = static_cast<double>(row) * config_.row_height - scrollTop;
    out.push_back(entry);
  }
}
