#pragma once

#include <QElapsedTimer>
#include <QObject>
#include <QTimer>

class ClickPlayer;
class ListingFetchService;
class RouletteEngine;
class RoulettePage;

/**
 * @brief 转盘页业务协调器。
 *
 * - 把界面意图（调整范围、刷新、抽取、复制）转交给 RouletteEngine；
 * - 拉取期间与滚动期间以约 60 Hz 驱动帧定时器，
 *   每帧非阻塞地检查拉取结果并推进动画；
 * - 每帧越过虚拟行时播放一次点击音。
 */
class RoulettePresenter : public QObject {
  Q_OBJECT
public:
  RoulettePresenter(RoulettePage* page,
                    RouletteEngine& engine,
                    ListingFetchService& fetchService,
                    ClickPlayer* clickPlayer,
                    QObject* parent = nullptr);

  /// 按引擎当前状态刷新全部控件。
  void refreshView();

private slots:
  void onMinPlayersChanged(int value);
  void onMaxPlayersChanged(int value);
  void onRefreshRequested();
  void onSpinRequested();
  void onCopyWinnerRequested();
  void onFrame();

private:
  void ensureFrameTimer();
  void updateSpinButton();

  RoulettePage* page_{};
  RouletteEngine& engine_;
  ListingFetchService& fetchService_;
  ClickPlayer* clickPlayer_{};
  QTimer frameTimer_;
  QElapsedTimer spinClock_;
};
