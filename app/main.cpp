#include <QApplication>
#include <QLibraryInfo>
#include <QLocale>
#include <QPalette>
#include <QStyleFactory>
#include <QTranslator>

#include "app/ui/MainWindow.h"

/**
 * @file main.cpp
 * @brief Qt 应用程序入口，创建并显示主窗口。
 */

namespace {

void applyDarkPalette(QApplication& app) {
  app.setStyle(QStyleFactory::create(QStringLiteral("Fusion")));
  QPalette palette;
  palette.setColor(QPalette::Window, QColor(27, 27, 27));
  palette.setColor(QPalette::WindowText, QColor(210, 210, 210));
  palette.setColor(QPalette::Base, QColor(18, 18, 18));
  palette.setColor(QPalette::AlternateBase, QColor(40, 40, 40));
  palette.setColor(QPalette::Text, QColor(210, 210, 210));
  palette.setColor(QPalette::Button, QColor(48, 48, 48));
  palette.setColor(QPalette::ButtonText, QColor(230, 230, 230));
  palette.setColor(QPalette::Highlight, QColor(90, 170, 255));
  palette.setColor(QPalette::Disabled, QPalette::ButtonText, QColor(120, 120, 120));
  app.setPalette(palette);
}

} // namespace

int main(int argc, char *argv[]) {
  QLocale::setDefault(QLocale(QLocale::Chinese, QLocale::China));
  QApplication app(argc, argv);

  QTranslator qtTranslator;
  const QString qtTranslations = QLibraryInfo::path(QLibraryInfo::TranslationsPath);
  if (qtTranslator.load(QLocale(), QStringLiteral("qtbase"), QStringLiteral("_"), qtTranslations)) {
    app.installTranslator(&qtTranslator);
  }
  applyDarkPalette(app);

  MainWindow w;
  w.show();
  return app.exec();
}
