#pragma once

#include <string>

/**
 * @file HttpClient.h
 * @brief 拉取服务器列表所需的最小 HTTP 接口。
 */

/// 一次 GET 请求的结果；传输失败通过 transport_ok 表达，不抛异常。
struct HttpResponse {
  bool transport_ok{false}; ///< 是否收到了响应。
  int status{0};            ///< HTTP 状态码。
  std::string body;
  std::string error;        ///< 传输失败时的描述。

  bool isSuccess() const { return transport_ok && status >= 200 && status < 300; }
};

/**
 * @brief 同步 HTTP 客户端接口，在工作线程中调用，允许阻塞。
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  virtual HttpResponse get(const std::string& url) = 0;
};
