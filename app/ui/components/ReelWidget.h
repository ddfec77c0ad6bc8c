#pragma once

#include <vector>

#include <QWidget>

#include "core/model/ServerRecord.h"
#include "core/view/ReelLayout.h"

class QPainter;

/**
 * @brief 转盘窗口：按滚动位置绘制重复的服务器行，并在中线绘制红色标记。
 */
class ReelWidget : public QWidget {
  Q_OBJECT
public:
  static constexpr int kViewportHeight = 320;

  explicit ReelWidget(QWidget* parent = nullptr);

  /// 设置要绘制的列表；指针由调用方保证在绘制期间有效。
  void setListing(const Listing* listing);
  void setOffset(double offset);

protected:
  void paintEvent(QPaintEvent* event) override;

private:
  void paintRow(QPainter& painter, const ReelRow& row) const;
  void paintMarker(QPainter& painter) const;

  ReelLayout layout_;
  const Listing* listing_{nullptr};
  double offset_{0.0};
  std::vector<ReelRow> rows_;
};
