#include "app/ui/MainWindow.h"

#include <QVBoxLayout>
#include <QWidget>

#include "app/services/ApplicationInitializer.h" // 应用初始化与装配
#include "app/ui/pages/RoulettePage.h"
#include "app/ui/presenters/RoulettePresenter.h"
#include "core/log/Log.h"

MainWindow::~MainWindow() = default;

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
  logging::init();
  settings_ = Settings::load();
  logging::applyLevel(settings_.logLevel);
  spdlog::info("Server list endpoint: {} (game {})", settings_.apiBaseUrl, settings_.gameId);

  PlayerRange initialRange;
  initialRange.min_players = settings_.defaultMinPlayers;
  initialRange.max_players = settings_.defaultMaxPlayers;
  engine_ = std::make_unique<RouletteEngine>(random_, SpinConfig(), initialRange);
  fetchService_ = std::make_unique<ListingFetchService>(settings_);
  // 点击音只在启动时合成一次
  clickPlayer_ = ApplicationInitializer::createClickPlayer(settings_, random_);

  setupUi();
}

void MainWindow::setupUi() {
  setWindowTitle(QStringLiteral("Squad EU Roulette"));
  resize(800, 950);
  setMinimumSize(600, 700);

  auto* central = new QWidget(this);
  auto* rootLayout = new QVBoxLayout(central);
  rootLayout->setContentsMargins(12, 12, 12, 12);
  rootLayout->setSpacing(12);

  // 转盘页装配，界面与业务逻辑转交给 RoulettePage/RoulettePresenter
  roulettePage_ = new RoulettePage(central);
  rootLayout->addWidget(roulettePage_);
  roulettePresenter_ =
      std::make_unique<RoulettePresenter>(roulettePage_, *engine_, *fetchService_, clickPlayer_.get());

  setCentralWidget(central);
}
