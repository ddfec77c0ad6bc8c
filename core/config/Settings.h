#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

/**
 * @file Settings.h
 * @brief 应用运行参数：内置默认值，可由只读 JSON 配置覆盖。
 */

/**
 * @brief 存储应用程序的所有配置项。
 */
struct Settings {
  std::string apiBaseUrl{"https://api.battlemetrics.com/servers"}; ///< 服务器列表接口地址。
  std::string gameId{"squad"};   ///< filter[game] 参数值。
  int requestTimeoutMs{10000};   ///< 单次 HTTP 请求的传输超时（毫秒）。

  int defaultMinPlayers{60};  ///< 启动时的最少玩家数。
  int defaultMaxPlayers{100}; ///< 启动时的最多玩家数。

  int clickSampleRate{44100}; ///< 点击音采样率（Hz）。
  int clickDurationMs{20};    ///< 点击音时长（毫秒）。
  bool audioEnabled{true};    ///< 是否启用点击音。

  std::string logLevel{"info"}; ///< 读取配置后使用的日志级别。

  /**
   * @brief 查找配置文件并加载；找不到或解析失败时返回默认配置。
   * @note 配置文件只读，程序不会写回。
   */
  static Settings load();

  /**
   * @brief 从指定文件加载配置。
   * @param path 配置文件路径。
   * @return 合并后的配置；文件无法打开或解析失败时返回默认配置。
   */
  static Settings loadFrom(const std::filesystem::path& path);

  /**
   * @brief 将 JSON 中出现的键覆盖到当前配置上，未出现的键保持原值。
   * @throws nlohmann::json::exception 当键的类型不匹配。
   */
  void applyJson(const nlohmann::json& j);

  /**
   * @brief 通过从当前目录向上搜索来定位配置文件。
   * @return 如果找到文件，则返回完整路径；否则返回 std::nullopt。
   */
  static std::optional<std::filesystem::path> locateConfigFile();
};
