#pragma once

#include <string>
#include <vector>

/**
 * @file ServerRecord.h
 * @brief 服务器列表条目与列表快照定义。
 */

/// 单个游戏服务器的展示信息，构造后不再修改。
struct ServerRecord {
  std::string name;
  int players{0};
  int max_players{0};
  std::string map{"Unknown"};
  std::string mode{"Unknown"};
  std::string country{"??"};
};

inline bool operator==(const ServerRecord& lhs, const ServerRecord& rhs) {
  return lhs.name == rhs.name && lhs.players == rhs.players && lhs.max_players == rhs.max_players &&
         lhs.map == rhs.map && lhs.mode == rhs.mode && lhs.country == rhs.country;
}

inline bool operator!=(const ServerRecord& lhs, const ServerRecord& rhs) {
  return !(lhs == rhs);
}

/// 一次拉取得到的完整列表，只允许整体替换。
using Listing = std::vector<ServerRecord>;
