#pragma once

#include <memory>
#include <string>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

/**
 * @file Log.h
 * @brief 日志初始化与运行时级别调整。
 */

namespace logging {

inline constexpr const char* kLoggerName = "roulette";
inline constexpr const char* kDefaultLogFile = "squad-roulette.log";

/**
 * @brief 初始化全局日志器（幂等，重复调用不会替换已有 sink）。
 *
 * 控制台只显示时间与级别；文件额外记录毫秒和线程号，
 * 拉取在工作线程中进行，需要据此区分日志来源。
 * 启动阶段以 trace 记录全部输出，读取配置后再由 applyLevel() 调整。
 *
 * @param logFile 日志文件路径，每次启动截断重写。
 */
inline void init(const std::string& logFile = kDefaultLogFile) {
  if (spdlog::get(kLoggerName)) {
    return;
  }
  auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console->set_pattern("[%H:%M:%S] [%^%l%$] %v");

  auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
  file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, spdlog::sinks_init_list{console, file});
  logger->set_level(spdlog::level::trace);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
}

/**
 * @brief 按名称（trace/debug/info/warn/err/critical/off）设置默认日志器级别。
 * @return 名称无法识别时返回 false，级别保持不变。
 */
inline bool applyLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    spdlog::warn("Unknown log level '{}', keeping {}", name,
                 spdlog::level::to_string_view(spdlog::default_logger()->level()));
    return false;
  }
  spdlog::default_logger()->set_level(level);
  return true;
}

} // namespace logging
