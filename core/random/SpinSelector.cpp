#include "core/random/SpinSelector.h"

#include <algorithm>
#include <stdexcept>

std::size_t loopCountFor(std::size_t listingSize, const SpinConfig& config) {
  if (listingSize == 0) {
    throw std::invalid_argument("loopCountFor requires a non-empty listing");
  }
  // 向上取整，保证至少滚过 target_scroll_rows 行
  const std::size_t loops = (config.target_scroll_rows + listingSize - 1) / listingSize;
  return std::max(config.min_loops, loops);
}

SpinSelector::SpinSelector(RandomSource& random, SpinConfig config)
    : random_(random), config_(config) {}

std::optional<SpinPlan> SpinSelector::selectWinner(const Listing& listing) const {
  if (listing.empty()) {
    return std::nullopt;
  }

  SpinPlan plan;
  const std::size_t count = listing.size();
  plan.winner_index = std::min(random_.uniformIndex(count), count - 1);
  plan.winner = listing[plan.winner_index];
  plan.duration_seconds = random_.uniformReal(config_.min_duration_s, config_.max_duration_s);

  plan.loops = loopCountFor(count, config_);
  plan.target_row = plan.loops * count + plan.winner_index;

  const double jitter = random_.uniformReal(-config_.jitter, config_.jitter);
  plan.start_offset = 0.0;
  plan.target_offset = static_cast<double>(plan.target_row) * config_.row_height + jitter;
  return plan;
}
