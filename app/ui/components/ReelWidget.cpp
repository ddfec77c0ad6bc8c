#include "app/ui/components/ReelWidget.h"

#include <QPainter>
#include <QPainterPath>

namespace {

const QColor kBackground(0, 0, 0, 230);
const QColor kRowFill(38, 38, 44);
const QColor kRowBorder(70, 70, 80);
const QColor kNameColor(173, 216, 230);
const QColor kPlayersColor(255, 255, 0);
const QColor kMarkerColor(255, 0, 0);

} // namespace

ReelWidget::ReelWidget(QWidget* parent) : QWidget(parent) {
  setFixedHeight(kViewportHeight);
  setMinimumWidth(400);
}

void ReelWidget::setListing(const Listing* listing) {
  listing_ = listing;
  update();
}

void ReelWidget::setOffset(double offset) {
  if (offset == offset_) {
    return;
  }
  offset_ = offset;
  update();
}

void ReelWidget::paintEvent(QPaintEvent* /*event*/) {
  QPainter painter(this);
  painter.setRenderHint(QPainter::Antialiasing);
  painter.fillRect(rect(), kBackground);
  painter.setPen(QPen(Qt::darkGray, 1));
  painter.drawRect(rect().adjusted(0, 0, -1, -1));

  if (!listing_ || listing_->empty()) {
    painter.setPen(Qt::lightGray);
    painter.drawText(rect(), Qt::AlignCenter, tr("列表为空，请刷新服务器！"));
    paintMarker(painter);
    return;
  }

  layout_.visibleRows(*listing_, offset_, static_cast<double>(height()), rows_);
  for (const auto& row : rows_) {
    paintRow(painter, row);
  }
  paintMarker(painter);
}

void ReelWidget::paintRow(QPainter& painter, const ReelRow& row) const {
  const int rowHeight = static_cast<int>(layout_.rowHeight());
  const QRectF box(5.0, row.top + 4.0, width() - 10.0, rowHeight - 8.0);

  QPainterPath path;
  path.addRoundedRect(box, 6.0, 6.0);
  painter.fillPath(path, kRowFill);
  painter.setPen(QPen(kRowBorder, 1));
  painter.drawPath(path);

  const ServerRecord& record = *row.record;
  QFont nameFont = font();
  nameFont.setPointSize(15);
  nameFont.setBold(true);
  painter.setFont(nameFont);
  painter.setPen(kNameColor);
  const QRectF nameRect(box.left(), box.top() + 4.0, box.width(), box.height() / 2.0);
  painter.drawText(nameRect, Qt::AlignCenter,
                   painter.fontMetrics().elidedText(QString::fromStdString(record.name), Qt::ElideRight,
                                                    static_cast<int>(box.width()) - 20));

  QFont detailFont = font();
  detailFont.setPointSize(11);
  painter.setFont(detailFont);
  const QRectF detailRect(box.left(), box.center().y(), box.width(), box.height() / 2.0 - 4.0);
  const QString mapText = QStringLiteral("🗺️ %1").arg(QString::fromStdString(record.map));
  const QString playersText = QStringLiteral("👥 %1/%2").arg(record.players).arg(record.max_players);
  const QRectF mapRect = detailRect.adjusted(0, 0, -detailRect.width() / 2.0 - 5.0, 0);
  const QRectF playersRect = detailRect.adjusted(detailRect.width() / 2.0 + 5.0, 0, 0, 0);
  painter.setPen(Qt::lightGray);
  painter.drawText(mapRect, Qt::AlignRight | Qt::AlignVCenter, mapText);
  painter.setPen(kPlayersColor);
  painter.drawText(playersRect, Qt::AlignLeft | Qt::AlignVCenter, playersText);
}

void ReelWidget::paintMarker(QPainter& painter) const {
  const qreal lineY = height() / 2.0;
  painter.setPen(QPen(kMarkerColor, 3));
  painter.drawLine(QPointF(0, lineY), QPointF(width(), lineY));

  QFont arrowFont = font();
  arrowFont.setPointSize(22);
  painter.setFont(arrowFont);
  painter.drawText(QRectF(0, lineY - 20, width() - 10, 40), Qt::AlignRight | Qt::AlignVCenter, QStringLiteral("◄"));
}
