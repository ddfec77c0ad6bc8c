#pragma once

#include <QMainWindow>
#include <memory>

#include "core/config/Settings.h"
#include "core/engine/RouletteEngine.h"
#include "core/random/RandomSource.h"
// 界面瘦身：引入应用服务头文件
#include "app/audio/ClickPlayer.h"
#include "app/services/ListingFetchService.h"

class RoulettePage;
class RoulettePresenter;

/**
 * @brief Application main window hosting the roulette page.
 */
class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow();

private:
  void setupUi();

  Settings settings_{};
  MersenneRandomSource random_;
  std::unique_ptr<RouletteEngine> engine_;
  // UI 层应用服务（减少 MainWindow 职责）
  std::unique_ptr<ListingFetchService> fetchService_;
  std::unique_ptr<ClickPlayer> clickPlayer_;

  RoulettePage* roulettePage_{};
  std::unique_ptr<RoulettePresenter> roulettePresenter_;
};
