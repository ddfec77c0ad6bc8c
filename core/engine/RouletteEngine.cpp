#include "core/engine/RouletteEngine.h"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

int clampPlayers(int value) {
  return std::clamp(value, 0, RouletteEngine::kPlayerLimit);
}

} // namespace

const char* phaseName(RoulettePhase phase) {
  switch (phase) {
    case RoulettePhase::Idle: return "Idle";
    case RoulettePhase::Loading: return "Loading";
    case RoulettePhase::Spinning: return "Spinning";
    case RoulettePhase::Settled: return "Settled";
  }
  return "Idle";
}

RouletteEngine::RouletteEngine(RandomSource& random, SpinConfig config, PlayerRange initialRange)
    : config_(config), selector_(random, config), animator_(config) {
  range_.min_players = clampPlayers(initialRange.min_players);
  range_.max_players = clampPlayers(initialRange.max_players);
}

void RouletteEngine::setMinPlayers(int value) {
  value = clampPlayers(value);
  if (value != range_.min_players) {
    range_.min_players = value;
    stale_ = true;
  }
}

void RouletteEngine::setMaxPlayers(int value) {
  value = clampPlayers(value);
  if (value != range_.max_players) {
    range_.max_players = value;
    stale_ = true;
  }
}

std::optional<PlayerRange> RouletteEngine::beginFetch() {
  if (phase_ == RoulettePhase::Loading) {
    return std::nullopt;
  }
  listing_.clear();
  plan_.reset();
  phase_ = RoulettePhase::Loading;
  stale_ = false;
  spdlog::info("Fetch started for {}-{} players", range_.min_players, range_.max_players);
  return range_;
}

void RouletteEngine::completeFetch(Listing listing) {
  listing_ = std::move(listing);
  if (phase_ == RoulettePhase::Loading) {
    // 空结果进入 Settled，界面据此提示“列表为空”
    phase_ = listing_.empty() ? RoulettePhase::Settled : RoulettePhase::Idle;
  }
  spdlog::info("Listing replaced with {} server(s), phase {}", listing_.size(), phaseName(phase_));
}

bool RouletteEngine::canSpin() const {
  return !stale_ && !listing_.empty() && phase_ != RoulettePhase::Loading && phase_ != RoulettePhase::Spinning;
}

bool RouletteEngine::requestSpin() {
  if (!canSpin()) {
    return false;
  }
  auto plan = selector_.selectWinner(listing_);
  if (!plan) {
    return false;
  }
  plan_ = std::move(plan);
  animator_.start(*plan_);
  phase_ = RoulettePhase::Spinning;
  spdlog::info("Spin started: {} rows over {:.2f}s, winner index {}", plan_->target_row, plan_->duration_seconds,
               plan_->winner_index);
  return true;
}

TickResult RouletteEngine::tick(double elapsedSeconds) {
  if (phase_ != RoulettePhase::Spinning) {
    return {};
  }
  const TickResult result = animator_.tick(elapsedSeconds);
  if (result.settled) {
    phase_ = RoulettePhase::Settled;
  }
  return result;
}

const ServerRecord* RouletteEngine::winner() const {
  if (phase_ != RoulettePhase::Settled || !plan_) {
    return nullptr;
  }
  return &plan_->winner;
}
