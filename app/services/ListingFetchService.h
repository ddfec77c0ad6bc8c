// UTF-8
#pragma once

#include <optional>

#include <QFuture>
#include <QObject>

#include "core/config/Settings.h"
#include "core/engine/RouletteEngine.h"
#include "core/model/ServerRecord.h"

/**
 * 服务器列表拉取服务：在线程池中执行阻塞的分页拉取，
 * 通过 QFuture 把一次拉取的完整结果交回界面线程。
 * 同一时间最多只有一次拉取在进行。
 */
class ListingFetchService : public QObject {
  Q_OBJECT
public:
  explicit ListingFetchService(const Settings& settings, QObject* parent = nullptr);
  ~ListingFetchService() override;

  /**
   * 在工作线程中开始拉取。
   * @return 已有拉取进行中时返回 false，不做任何事。
   */
  bool start(const PlayerRange& range);

  bool isRunning() const { return pending_; }

  /**
   * 非阻塞地取走已完成的结果；尚未完成或没有拉取时返回 std::nullopt。
   * 每次拉取的结果只会被取走一次。
   */
  std::optional<Listing> takeResult();

private:
  Settings settings_;
  QFuture<Listing> future_;
  bool pending_{false};
};
