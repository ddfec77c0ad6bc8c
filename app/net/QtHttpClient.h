// UTF-8
#pragma once

#include <QNetworkAccessManager>

#include "core/net/HttpClient.h"

/**
 * 基于 QNetworkAccessManager 的同步 HTTP 客户端。
 * 每次 get() 在局部 QEventLoop 中等待应答，只能在创建它的线程（拉取工作线程）中使用。
 */
class QtHttpClient : public HttpClient {
public:
  explicit QtHttpClient(int timeoutMs);

  HttpResponse get(const std::string& url) override;

private:
  int timeoutMs_;
  QNetworkAccessManager manager_;
};
