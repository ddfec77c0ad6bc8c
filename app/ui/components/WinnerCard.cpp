#include "app/ui/components/WinnerCard.h"

#include <QGroupBox>
#include <QLabel>
#include <QPushButton>
#include <QVBoxLayout>

#include "core/model/ServerRecord.h"

WinnerCard::WinnerCard(QWidget* parent) : QWidget(parent) {
  auto* outer = new QVBoxLayout(this);
  outer->setContentsMargins(0, 0, 0, 0);

  auto* group = new QGroupBox(this);
  group->setMinimumWidth(300);
  auto* layout = new QVBoxLayout(group);
  layout->setAlignment(Qt::AlignHCenter);
  layout->setSpacing(6);

  auto* caption = new QLabel(tr("🎉 获胜者:"), group);
  caption->setAlignment(Qt::AlignCenter);
  nameLabel_ = new QLabel(group);
  nameLabel_->setAlignment(Qt::AlignCenter);
  nameLabel_->setStyleSheet(QStringLiteral("color: #3bd16f; font-size: 20pt; font-weight: bold;"));
  nameLabel_->setTextInteractionFlags(Qt::TextSelectableByMouse);
  mapLabel_ = new QLabel(group);
  mapLabel_->setAlignment(Qt::AlignCenter);
  mapLabel_->setStyleSheet(QStringLiteral("font-size: 14pt; font-style: italic;"));
  copyButton_ = new QPushButton(tr("📋 复制名称"), group);

  layout->addWidget(caption);
  layout->addWidget(nameLabel_);
  layout->addWidget(mapLabel_);
  layout->addWidget(copyButton_, 0, Qt::AlignHCenter);
  outer->addWidget(group, 0, Qt::AlignHCenter);

  connect(copyButton_, &QPushButton::clicked, this, &WinnerCard::copyNameRequested);
  setVisible(false);
}

void WinnerCard::showWinner(const ServerRecord* winner) {
  if (!winner) {
    setVisible(false);
    return;
  }
  nameLabel_->setText(QString::fromStdString(winner->name));
  mapLabel_->setText(tr("地图: %1").arg(QString::fromStdString(winner->map)));
  setVisible(true);
}
