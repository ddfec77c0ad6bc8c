#pragma once

#include <QWidget>

class QLabel;
class QPushButton;
class QSlider;

/**
 * @brief 玩家数范围筛选面板：最少/最多两个滑块、刷新按钮与列表状态提示。
 */
class PlayerRangePanel : public QWidget {
  Q_OBJECT
public:
  explicit PlayerRangePanel(QWidget* parent = nullptr);

  QSlider* minSlider() const { return minSlider_; }
  QSlider* maxSlider() const { return maxSlider_; }
  QPushButton* refreshButton() const { return refreshButton_; }

  /// 设置滑块数值，不触发信号。
  void setRange(int minPlayers, int maxPlayers);
  /// 显示“数据已过期”提示。
  void showStale();
  /// 显示当前列表中的服务器数量。
  void showServerCount(int count);
  /// 拉取期间禁用刷新按钮。
  void setRefreshEnabled(bool enabled);

signals:
  void minPlayersChanged(int value);
  void maxPlayersChanged(int value);
  void refreshRequested();

private:
  void setupUi();
  void bindSignals();

  QSlider* minSlider_{};
  QSlider* maxSlider_{};
  QLabel* minValueLabel_{};
  QLabel* maxValueLabel_{};
  QPushButton* refreshButton_{};
  QLabel* statusLabel_{};
};
