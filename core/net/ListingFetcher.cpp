#include "core/net/ListingFetcher.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <iterator>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/model/CountryFilter.h"

namespace {

using json = nlohmann::json;

std::string percentEncode(const std::string& text) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size() * 3);
  for (const unsigned char c : text) {
    const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                            c == '-' || c == '_' || c == '.' || c == '~';
    if (unreserved) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

/// 可选字符串字段：缺失或为 null 时返回默认值。
std::string optionalString(const json& node, const char* key, const std::string& fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  const auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return fallback;
  }
  return it->get<std::string>();
}

/// 玩家数按 64 位读取，再限制到 [0, INT_MAX]，避免超大值回绕。
int playerCount(const json& attributes, const char* key) {
  const auto value = attributes.at(key).get<std::int64_t>();
  const std::int64_t limit = std::numeric_limits<int>::max();
  return static_cast<int>(std::clamp<std::int64_t>(value, 0, limit));
}

ServerRecord parseRecord(const json& item) {
  const json& attributes = item.at("attributes");
  ServerRecord record;
  record.name = attributes.at("name").get<std::string>();
  record.players = playerCount(attributes, "players");
  record.max_players = playerCount(attributes, "maxPlayers");
  record.country = optionalString(attributes, "country", record.country);

  const auto details = attributes.find("details");
  if (details != attributes.end()) {
    record.map = optionalString(*details, "map", record.map);
    record.mode = optionalString(*details, "gameMode", record.mode);
  }
  return record;
}

} // namespace

ListingFetcher::ListingFetcher(HttpClient& http, std::string baseUrl, std::string gameId)
    : http_(http), baseUrl_(std::move(baseUrl)), gameId_(std::move(gameId)) {}

std::string ListingFetcher::firstPageUrl(int minPlayers, int maxPlayers) const {
  const std::vector<std::pair<std::string, std::string>> params = {
      {"filter[game]", gameId_},
      {"filter[status]", "online"},
      {"page[size]", std::to_string(kPageSize)},
      {"sort", "-players"},
      {"filter[players][min]", std::to_string(minPlayers)},
      {"filter[players][max]", std::to_string(maxPlayers)},
  };
  std::string url = baseUrl_;
  char separator = url.find('?') == std::string::npos ? '?' : '&';
  for (const auto& [key, value] : params) {
    url.push_back(separator);
    url += percentEncode(key);
    url.push_back('=');
    url += percentEncode(value);
    separator = '&';
  }
  return url;
}

ListingPage ListingFetcher::parsePage(const std::string& body) {
  ListingPage page;
  try {
    const json root = json::parse(body);
    const json& data = root.at("data");
    if (!data.is_array()) {
      throw ListingParseError("\"data\" is not an array");
    }
    for (const auto& item : data) {
      ServerRecord record = parseRecord(item);
      if (!country::isAllowed(record.country)) {
        ++page.dropped;
        continue;
      }
      page.records.push_back(std::move(record));
    }

    const auto links = root.find("links");
    if (links != root.end() && links->is_object()) {
      const std::string next = optionalString(*links, "next", std::string());
      if (!next.empty()) {
        page.next = next;
      }
    }
  } catch (const json::exception& e) {
    throw ListingParseError(e.what());
  }
  return page;
}

Listing ListingFetcher::fetch(int minPlayers, int maxPlayers) const {
  Listing all;
  std::string nextUrl = firstPageUrl(minPlayers, maxPlayers);
  spdlog::info("Fetching servers with {}-{} players", minPlayers, maxPlayers);

  int pagesFetched = 0;
  bool aborted = false;
  while (!nextUrl.empty() && pagesFetched < kMaxPages) {
    ++pagesFetched;
    const HttpResponse response = http_.get(nextUrl);
    if (!response.transport_ok) {
      spdlog::warn("Page {} request failed: {}", pagesFetched, response.error);
      aborted = true;
      break;
    }
    if (!response.isSuccess()) {
      spdlog::warn("Page {} returned HTTP {}", pagesFetched, response.status);
      aborted = true;
      break;
    }

    ListingPage page;
    try {
      page = parsePage(response.body);
    } catch (const ListingParseError& e) {
      spdlog::warn("Page {} payload is malformed: {}", pagesFetched, e.what());
      aborted = true;
      break;
    }

    spdlog::debug("Page {}: {} eligible, {} outside allow-list", pagesFetched, page.records.size(), page.dropped);
    all.insert(all.end(), std::make_move_iterator(page.records.begin()), std::make_move_iterator(page.records.end()));
    nextUrl = page.next.value_or(std::string());
  }

  if (!aborted && !nextUrl.empty()) {
    spdlog::info("Page limit {} reached, remaining pages skipped", kMaxPages);
  }
  spdlog::info("Fetched {} eligible servers from {} page(s)", all.size(), pagesFetched);
  return all;
}
