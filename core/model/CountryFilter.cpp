#include "core/model/CountryFilter.h"

#include <unordered_set>

namespace country {

bool isAllowed(const std::string& code) {
  static const std::unordered_set<std::string> kAllowed(kEuAllowList.begin(), kEuAllowList.end());
  return kAllowed.count(code) != 0;
}

} // namespace country
