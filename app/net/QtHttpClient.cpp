// UTF-8
#include "app/net/QtHttpClient.h"

#include <memory>

#include <QEventLoop>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

QtHttpClient::QtHttpClient(int timeoutMs) : timeoutMs_(timeoutMs) {}

HttpResponse QtHttpClient::get(const std::string& url) {
  HttpResponse response;

  QNetworkRequest request(QUrl(QString::fromStdString(url)));
  request.setRawHeader("Accept", "application/json");
  request.setHeader(QNetworkRequest::UserAgentHeader, QStringLiteral("SquadRoulette"));
  request.setTransferTimeout(timeoutMs_);

  std::unique_ptr<QNetworkReply> reply(manager_.get(request));
  QEventLoop loop;
  QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
  if (!reply->isFinished()) {
    loop.exec();
  }

  // 收到 HTTP 状态码即视为传输成功，由调用方判断状态码
  const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
  if (!statusAttr.isValid()) {
    response.transport_ok = false;
    response.error = reply->errorString().toStdString();
    return response;
  }

  response.transport_ok = true;
  response.status = statusAttr.toInt();
  response.body = reply->readAll().toStdString();
  if (reply->error() != QNetworkReply::NoError) {
    response.error = reply->errorString().toStdString();
  }
  return response;
}
