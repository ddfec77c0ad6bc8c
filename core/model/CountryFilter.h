#pragma once

#include <array>
#include <string>

/**
 * @file CountryFilter.h
 * @brief 固定的欧洲国家白名单。
 */

namespace country {

/// 允许出现在列表中的两字母国家代码（共 18 个）。
inline constexpr std::array<const char*, 18> kEuAllowList = {
    "DE", "FR", "PL", "GB", "UA", "NL", "CZ", "SK", "IT",
    "ES", "AT", "BE", "DK", "SE", "NO", "FI", "IE", "TR"};

/**
 * @brief 判断国家代码是否在白名单中（区分大小写）。
 */
bool isAllowed(const std::string& code);

} // namespace country
