#include "app/ui/presenters/RoulettePresenter.h"

#include <utility>

#include <QClipboard>
#include <QGuiApplication>
#include <QPushButton>
#include <spdlog/spdlog.h>

#include "app/audio/ClickPlayer.h"
#include "app/services/ListingFetchService.h"
#include "app/ui/components/PlayerRangePanel.h"
#include "app/ui/components/ReelWidget.h"
#include "app/ui/components/WinnerCard.h"
#include "app/ui/pages/RoulettePage.h"
#include "core/engine/RouletteEngine.h"

namespace {

constexpr int kFrameIntervalMs = 16;

} // namespace

RoulettePresenter::RoulettePresenter(RoulettePage* page,
                                     RouletteEngine& engine,
                                     ListingFetchService& fetchService,
                                     ClickPlayer* clickPlayer,
                                     QObject* parent)
    : QObject(parent), page_(page), engine_(engine), fetchService_(fetchService), clickPlayer_(clickPlayer) {
  frameTimer_.setTimerType(Qt::PreciseTimer);
  frameTimer_.setInterval(kFrameIntervalMs);
  connect(&frameTimer_, &QTimer::timeout, this, &RoulettePresenter::onFrame);

  if (page_) {
    const PlayerRange& range = engine_.playerRange();
    page_->rangePanel()->setRange(range.min_players, range.max_players);
    page_->reel()->setListing(&engine_.listing());

    connect(page_, &RoulettePage::minPlayersChanged, this, &RoulettePresenter::onMinPlayersChanged);
    connect(page_, &RoulettePage::maxPlayersChanged, this, &RoulettePresenter::onMaxPlayersChanged);
    connect(page_, &RoulettePage::refreshRequested, this, &RoulettePresenter::onRefreshRequested);
    connect(page_, &RoulettePage::spinRequested, this, &RoulettePresenter::onSpinRequested);
    connect(page_, &RoulettePage::copyWinnerRequested, this, &RoulettePresenter::onCopyWinnerRequested);
  }
  refreshView();
}

void RoulettePresenter::refreshView() {
  if (!page_) {
    return;
  }
  auto* panel = page_->rangePanel();
  if (engine_.isStale()) {
    panel->showStale();
  } else {
    panel->showServerCount(static_cast<int>(engine_.listing().size()));
  }
  panel->setRefreshEnabled(engine_.phase() != RoulettePhase::Loading);

  updateSpinButton();
  page_->reel()->setOffset(engine_.currentOffset());
  page_->reel()->update();
  page_->winnerCard()->showWinner(engine_.winner());
}

void RoulettePresenter::updateSpinButton() {
  QString text;
  switch (engine_.phase()) {
    case RoulettePhase::Idle: text = tr("🎰 开始抽取!"); break;
    case RoulettePhase::Loading: text = tr("⏳ ..."); break;
    case RoulettePhase::Spinning: text = tr("🌀 ..."); break;
    case RoulettePhase::Settled: text = tr("🎰 再来一次!"); break;
  }
  auto* button = page_->spinButton();
  button->setText(text);
  button->setEnabled(engine_.canSpin());
}

void RoulettePresenter::onMinPlayersChanged(int value) {
  engine_.setMinPlayers(value);
  refreshView();
}

void RoulettePresenter::onMaxPlayersChanged(int value) {
  engine_.setMaxPlayers(value);
  refreshView();
}

void RoulettePresenter::onRefreshRequested() {
  if (fetchService_.isRunning()) {
    return;
  }
  const auto range = engine_.beginFetch();
  if (!range) {
    return;
  }
  fetchService_.start(*range);
  ensureFrameTimer();
  refreshView();
}

void RoulettePresenter::onSpinRequested() {
  if (!engine_.requestSpin()) {
    return;
  }
  spinClock_.start();
  ensureFrameTimer();
  refreshView();
}

void RoulettePresenter::onCopyWinnerRequested() {
  const ServerRecord* winner = engine_.winner();
  if (!winner) {
    return;
  }
  if (auto* clipboard = QGuiApplication::clipboard()) {
    clipboard->setText(QString::fromStdString(winner->name));
    spdlog::info("Copied winner name to clipboard: {}", winner->name);
  }
}

void RoulettePresenter::onFrame() {
  bool stateChanged = false;
  // 工作线程的结果在界面线程中一次性替换列表
  if (auto result = fetchService_.takeResult()) {
    engine_.completeFetch(std::move(*result));
    stateChanged = true;
  }

  if (engine_.phase() == RoulettePhase::Spinning) {
    const TickResult tick = engine_.tick(static_cast<double>(spinClock_.nsecsElapsed()) / 1e9);
    if (tick.crossed_rows > 0 && clickPlayer_) {
      clickPlayer_->play();
    }
    if (tick.settled) {
      if (const ServerRecord* winner = engine_.winner()) {
        spdlog::info("Spin settled on {} ({}, {}/{})", winner->name, winner->map, winner->players,
                     winner->max_players);
      }
      stateChanged = true;
    }
    if (page_) {
      page_->reel()->setOffset(engine_.currentOffset());
    }
  }

  if (stateChanged) {
    refreshView();
  }
  if (!fetchService_.isRunning() && engine_.phase() != RoulettePhase::Spinning) {
    frameTimer_.stop();
  }
}

void RoulettePresenter::ensureFrameTimer() {
  if (!frameTimer_.isActive()) {
    frameTimer_.start();
  }
}
