#include "app/ui/components/PlayerRangePanel.h"

#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSlider>
#include <QVBoxLayout>

#include "core/engine/RouletteEngine.h"

namespace {

QSlider* createPlayerSlider(QWidget* parent) {
  auto* slider = new QSlider(Qt::Horizontal, parent);
  slider->setRange(0, RouletteEngine::kPlayerLimit);
  slider->setMinimumWidth(250);
  return slider;
}

} // namespace

PlayerRangePanel::PlayerRangePanel(QWidget* parent) : QWidget(parent) {
  setupUi();
  bindSignals();
}

void PlayerRangePanel::setRange(int minPlayers, int maxPlayers) {
  const QSignalBlocker minBlocker(minSlider_);
  const QSignalBlocker maxBlocker(maxSlider_);
  minSlider_->setValue(minPlayers);
  maxSlider_->setValue(maxPlayers);
  minValueLabel_->setText(tr("最少 %1").arg(minPlayers));
  maxValueLabel_->setText(tr("最多 %1").arg(maxPlayers));
}

void PlayerRangePanel::showStale() {
  statusLabel_->setStyleSheet(QStringLiteral("color: #e6c229;"));
  statusLabel_->setText(tr("数据已过期！"));
}

void PlayerRangePanel::showServerCount(int count) {
  statusLabel_->setStyleSheet(QStringLiteral("color: #3bb54a;"));
  statusLabel_->setText(tr("服务器数: %1").arg(count));
}

void PlayerRangePanel::setRefreshEnabled(bool enabled) {
  refreshButton_->setEnabled(enabled);
}

void PlayerRangePanel::setupUi() {
  auto* outer = new QVBoxLayout(this);
  outer->setContentsMargins(0, 0, 0, 0);

  auto* group = new QGroupBox(this);
  auto* layout = new QVBoxLayout(group);
  layout->setSpacing(8);

  auto* sliderRow = new QHBoxLayout();
  sliderRow->setSpacing(10);
  auto* title = new QLabel(tr("玩家数:"), group);
  QFont titleFont = title->font();
  titleFont.setPointSize(14);
  title->setFont(titleFont);

  minSlider_ = createPlayerSlider(group);
  maxSlider_ = createPlayerSlider(group);
  minValueLabel_ = new QLabel(group);
  maxValueLabel_ = new QLabel(group);

  sliderRow->addWidget(title);
  sliderRow->addWidget(minSlider_, 1);
  sliderRow->addWidget(minValueLabel_);
  sliderRow->addWidget(maxSlider_, 1);
  sliderRow->addWidget(maxValueLabel_);
  layout->addLayout(sliderRow);

  auto* actionRow = new QHBoxLayout();
  actionRow->setSpacing(10);
  refreshButton_ = new QPushButton(tr("🔄 刷新"), group);
  statusLabel_ = new QLabel(group);
  actionRow->addWidget(refreshButton_);
  actionRow->addWidget(statusLabel_, 1);
  layout->addLayout(actionRow);

  outer->addWidget(group);
}

void PlayerRangePanel::bindSignals() {
  connect(minSlider_, &QSlider::valueChanged, this, [this](int value) {
    minValueLabel_->setText(tr("最少 %1").arg(value));
    emit minPlayersChanged(value);
  });
  connect(maxSlider_, &QSlider::valueChanged, this, [this](int value) {
    maxValueLabel_->setText(tr("最多 %1").arg(value));
    emit maxPlayersChanged(value);
  });
  connect(refreshButton_, &QPushButton::clicked, this, &PlayerRangePanel::refreshRequested);
}
