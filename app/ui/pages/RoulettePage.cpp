#include "app/ui/pages/RoulettePage.h"

#include <QLabel>
#include <QPushButton>
#include <QVBoxLayout>

#include "app/ui/components/PlayerRangePanel.h"
#include "app/ui/components/ReelWidget.h"
#include "app/ui/components/WinnerCard.h"

RoulettePage::RoulettePage(QWidget* parent) : QWidget(parent) {
  buildUi();
  wireSignals();
}

void RoulettePage::buildUi() {
  auto* layout = new QVBoxLayout(this);
  layout->setSpacing(15);

  auto* heading = new QLabel(QStringLiteral("🎰 SQUAD EU ROULETTE"), this);
  heading->setAlignment(Qt::AlignCenter);
  heading->setStyleSheet(QStringLiteral("color: #ffd700; font-size: 24pt; font-weight: bold;"));
  layout->addWidget(heading);

  rangePanel_ = new PlayerRangePanel(this);
  layout->addWidget(rangePanel_);
  layout->addSpacing(10);

  spinBtn_ = new QPushButton(this);
  spinBtn_->setMinimumSize(250, 60);
  QFont spinFont = spinBtn_->font();
  spinFont.setPointSize(18);
  spinFont.setBold(true);
  spinBtn_->setFont(spinFont);
  layout->addWidget(spinBtn_, 0, Qt::AlignHCenter);
  layout->addSpacing(10);

  // 转盘窗口
  reel_ = new ReelWidget(this);
  layout->addWidget(reel_);

  winnerCard_ = new WinnerCard(this);
  layout->addWidget(winnerCard_);
  layout->addStretch(1);
}

void RoulettePage::wireSignals() {
  connect(rangePanel_, &PlayerRangePanel::minPlayersChanged, this, &RoulettePage::minPlayersChanged);
  connect(rangePanel_, &PlayerRangePanel::maxPlayersChanged, this, &RoulettePage::maxPlayersChanged);
  connect(rangePanel_, &PlayerRangePanel::refreshRequested, this, &RoulettePage::refreshRequested);
  connect(spinBtn_, &QPushButton::clicked, this, &RoulettePage::spinRequested);
  connect(winnerCard_, &WinnerCard::copyNameRequested, this, &RoulettePage::copyWinnerRequested);
}
