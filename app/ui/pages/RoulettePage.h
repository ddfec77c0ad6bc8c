#pragma once

#include <QWidget>

class QPushButton;

class PlayerRangePanel;
class ReelWidget;
class WinnerCard;

/**
 * @brief 转盘页的 UI 容器，仅负责搭建界面并透出必要控件信号。
 */
class RoulettePage : public QWidget {
  Q_OBJECT
public:
  explicit RoulettePage(QWidget* parent = nullptr);

  PlayerRangePanel* rangePanel() const { return rangePanel_; }
  ReelWidget* reel() const { return reel_; }
  WinnerCard* winnerCard() const { return winnerCard_; }
  QPushButton* spinButton() const { return spinBtn_; }

signals:
  void minPlayersChanged(int value);
  void maxPlayersChanged(int value);
  void refreshRequested();
  void spinRequested();
  void copyWinnerRequested();

private:
  void buildUi();
  void wireSignals();

  PlayerRangePanel* rangePanel_{};
  ReelWidget* reel_{};
  WinnerCard* winnerCard_{};
  QPushButton* spinBtn_{};
};
