#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

#include "core/model/ServerRecord.h"
#include "core/net/HttpClient.h"

/**
 * @file ListingFetcher.h
 * @brief 分页拉取在线服务器并按国家白名单过滤。
 */

/**
 * @brief 页面内容无法解析时抛出。
 */
class ListingParseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// 单页解析结果。
struct ListingPage {
  Listing records;                 ///< 通过白名单过滤后的条目。
  std::size_t dropped{0};          ///< 因国家不在白名单而丢弃的条目数。
  std::optional<std::string> next; ///< 下一页地址，缺失表示最后一页。
};

class ListingFetcher {
public:
  static constexpr int kMaxPages = 5;
  static constexpr int kPageSize = 100;

  ListingFetcher(HttpClient& http, std::string baseUrl, std::string gameId = "squad");

  /**
   * 拉取玩家数位于 [minPlayers, maxPlayers] 的在线服务器。
   * - 最多请求 kMaxPages 页，沿服务端返回的 next 地址翻页；
   * - 任一页传输失败、状态码非 2xx 或内容无法解析时立即停止，返回已累积的结果；
   * - 不做重试。
   * 该方法会阻塞，应在工作线程中调用。
   */
  Listing fetch(int minPlayers, int maxPlayers) const;

  /// 构造带过滤参数的首页地址。
  std::string firstPageUrl(int minPlayers, int maxPlayers) const;

  /**
   * @brief 解析一页 JSON 响应。
   * @throws ListingParseError 内容不是合法 JSON、缺少必需字段或类型不符时。
   */
  static ListingPage parsePage(const std::string& body);

private:
  HttpClient& http_;
  std::string baseUrl_;
  std::string gameId_;
};
