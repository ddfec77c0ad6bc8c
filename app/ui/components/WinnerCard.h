#pragma once

#include <QWidget>

class QLabel;
class QPushButton;
struct ServerRecord;

/**
 * @brief 滚动结束后展示获胜服务器，并提供复制名称按钮。
 */
class WinnerCard : public QWidget {
  Q_OBJECT
public:
  explicit WinnerCard(QWidget* parent = nullptr);

  /// 显示获胜者；传入 nullptr 时隐藏卡片。
  void showWinner(const ServerRecord* winner);

signals:
  void copyNameRequested();

private:
  QLabel* nameLabel_{};
  QLabel* mapLabel_{};
  QPushButton* copyButton_{};
};
