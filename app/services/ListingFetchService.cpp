// UTF-8
#include "app/services/ListingFetchService.h"

#include <exception>

#include <QtConcurrent/QtConcurrentRun>
#include <spdlog/spdlog.h>

#include "app/net/QtHttpClient.h"
#include "core/net/ListingFetcher.h"

ListingFetchService::ListingFetchService(const Settings& settings, QObject* parent)
    : QObject(parent), settings_(settings) {}

ListingFetchService::~ListingFetchService() {
  // 工作线程持有的是配置副本，这里只需等待其结束
  if (pending_) {
    future_.waitForFinished();
  }
}

bool ListingFetchService::start(const PlayerRange& range) {
  if (pending_) {
    return false;
  }
  const Settings settings = settings_;
  future_ = QtConcurrent::run([settings, range]() -> Listing {
    try {
      // QNetworkAccessManager 必须在使用它的线程中创建
      QtHttpClient http(settings.requestTimeoutMs);
      ListingFetcher fetcher(http, settings.apiBaseUrl, settings.gameId);
      return fetcher.fetch(range.min_players, range.max_players);
    } catch (const std::exception& ex) {
      spdlog::error("Server fetch failed: {}", ex.what());
      return Listing{};
    }
  });
  pending_ = true;
  return true;
}

std::optional<Listing> ListingFetchService::takeResult() {
  if (!pending_ || !future_.isFinished()) {
    return std::nullopt;
  }
  pending_ = false;
  return future_.result();
}
