#include <gtest/gtest.h>

#include <climits>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/model/CountryFilter.h"
#include "core/net/ListingFetcher.h"
#include "TestSupport.h"

using testsupport::FakeHttpClient;
using testsupport::pageJson;
using testsupport::serverJson;

namespace {

const std::string kBaseUrl = "https://api.battlemetrics.com/servers";

std::string pageUrl(int index) {
  return kBaseUrl + "?page%5Bkey%5D=" + std::to_string(index);
}

} // namespace

TEST(ListingFetcherTest, FirstPageUrlCarriesEncodedFilters) {
  FakeHttpClient http;
  ListingFetcher fetcher(http, kBaseUrl);
  EXPECT_EQ(fetcher.firstPageUrl(60, 100),
            kBaseUrl +
                "?filter%5Bgame%5D=squad&filter%5Bstatus%5D=online&page%5Bsize%5D=100&sort=-players"
                "&filter%5Bplayers%5D%5Bmin%5D=60&filter%5Bplayers%5D%5Bmax%5D=100");

  ListingFetcher custom(http, kBaseUrl + "?key=1", "arma3");
  const std::string url = custom.firstPageUrl(0, 5);
  EXPECT_EQ(url.rfind(kBaseUrl + "?key=1&filter%5Bgame%5D=arma3&", 0), 0u);
}

TEST(ListingFetcherTest, ParsePageAppliesDefaultsAndAllowList) {
  nlohmann::json noDetails = serverJson("No Details", "NL");
  noDetails["attributes"].erase("details");
  nlohmann::json nullMap = serverJson("Null Map", "SE");
  nullMap["attributes"]["details"]["map"] = nullptr;
  nlohmann::json noCountry = serverJson("No Country", "DE");
  noCountry["attributes"].erase("country");
  nlohmann::json negative = serverJson("Negative", "FI", -4, 100);

  const nlohmann::json page = pageJson({serverJson("Berlin", "DE", 98, 100, "Yehorivka", "AAS"),
                                        serverJson("Texas", "US"), noDetails, nullMap, noCountry, negative});
  const ListingPage parsed = ListingFetcher::parsePage(page.dump());

  ASSERT_EQ(parsed.records.size(), 4u);
  EXPECT_EQ(parsed.dropped, 2u);
  EXPECT_FALSE(parsed.next.has_value());

  EXPECT_EQ(parsed.records[0].name, "Berlin");
  EXPECT_EQ(parsed.records[0].players, 98);
  EXPECT_EQ(parsed.records[0].max_players, 100);
  EXPECT_EQ(parsed.records[0].map, "Yehorivka");
  EXPECT_EQ(parsed.records[0].mode, "AAS");
  EXPECT_EQ(parsed.records[0].country, "DE");

  EXPECT_EQ(parsed.records[1].name, "No Details");
  EXPECT_EQ(parsed.records[1].map, "Unknown");
  EXPECT_EQ(parsed.records[1].mode, "Unknown");

  EXPECT_EQ(parsed.records[2].name, "Null Map");
  EXPECT_EQ(parsed.records[2].map, "Unknown");
  EXPECT_EQ(parsed.records[2].mode, "RAAS");

  EXPECT_EQ(parsed.records[3].name, "Negative");
  EXPECT_EQ(parsed.records[3].players, 0);
}

TEST(ListingFetcherTest, ParsePageClampsHugePlayerCounts) {
  nlohmann::json huge = serverJson("Huge", "CZ");
  huge["attributes"]["players"] = 3000000000u;
  huge["attributes"]["maxPlayers"] = 4294967295u;
  const ListingPage parsed = ListingFetcher::parsePage(pageJson({huge}).dump());

  ASSERT_EQ(parsed.records.size(), 1u);
  EXPECT_EQ(parsed.records[0].players, INT_MAX);
  EXPECT_EQ(parsed.records[0].max_players, INT_MAX);
}

TEST(ListingFetcherTest, ParsePageReadsNextLink) {
  const ListingPage withNext = ListingFetcher::parsePage(pageJson({}, pageUrl(2)).dump());
  ASSERT_TRUE(withNext.next.has_value());
  EXPECT_EQ(*withNext.next, pageUrl(2));

  nlohmann::json nullNext = pageJson({});
  nullNext["links"]["next"] = nullptr;
  EXPECT_FALSE(ListingFetcher::parsePage(nullNext.dump()).next.has_value());

  nlohmann::json noLinks = {{"data", nlohmann::json::array()}};
  EXPECT_FALSE(ListingFetcher::parsePage(noLinks.dump()).next.has_value());
}

TEST(ListingFetcherTest, ParsePageRejectsMalformedPayloads) {
  EXPECT_THROW(ListingFetcher::parsePage("not json"), ListingParseError);
  EXPECT_THROW(ListingFetcher::parsePage("{}"), ListingParseError);
  EXPECT_THROW(ListingFetcher::parsePage(R"({"data": {"id": 1}})"), ListingParseError);

  nlohmann::json missingPlayers = serverJson("Broken", "DE");
  missingPlayers["attributes"].erase("players");
  EXPECT_THROW(ListingFetcher::parsePage(pageJson({missingPlayers}).dump()), ListingParseError);

  nlohmann::json textPlayers = serverJson("Broken", "DE");
  textPlayers["attributes"]["players"] = "many";
  EXPECT_THROW(ListingFetcher::parsePage(pageJson({textPlayers}).dump()), ListingParseError);
}

TEST(ListingFetcherTest, FollowsNextLinksVerbatimAndStopsOnLastPage) {
  FakeHttpClient http;
  http.enqueueJson(pageJson({serverJson("A", "DE"), serverJson("B", "US")}, pageUrl(2)));
  http.enqueueJson(pageJson({serverJson("C", "FR")}));

  ListingFetcher fetcher(http, kBaseUrl);
  const Listing listing = fetcher.fetch(60, 100);

  ASSERT_EQ(listing.size(), 2u);
  EXPECT_EQ(listing[0].name, "A");
  EXPECT_EQ(listing[1].name, "C");
  ASSERT_EQ(http.requestedUrls.size(), 2u);
  EXPECT_EQ(http.requestedUrls[0], fetcher.firstPageUrl(60, 100));
  EXPECT_EQ(http.requestedUrls[1], pageUrl(2));
}

TEST(ListingFetcherTest, StopsAfterFivePages) {
  FakeHttpClient http;
  for (int i = 1; i <= 7; ++i) {
    http.enqueueJson(pageJson({serverJson("Server " + std::to_string(i), "PL")}, pageUrl(i + 1)));
  }

  ListingFetcher fetcher(http, kBaseUrl);
  const Listing listing = fetcher.fetch(0, 100);

  EXPECT_EQ(listing.size(), 5u);
  EXPECT_EQ(http.requestedUrls.size(), 5u);
  EXPECT_EQ(listing.back().name, "Server 5");
}

TEST(ListingFetcherTest, TransportFailureKeepsEarlierPages) {
  FakeHttpClient http;
  http.enqueueJson(pageJson({serverJson("A", "DE")}, pageUrl(2)));
  http.enqueueJson(pageJson({serverJson("B", "GB")}, pageUrl(3)));
  http.enqueueJson(pageJson({serverJson("C", "IT")}, pageUrl(4)));
  http.enqueueTransportError();
  http.enqueueJson(pageJson({serverJson("E", "ES")}));

  ListingFetcher fetcher(http, kBaseUrl);
  const Listing listing = fetcher.fetch(60, 100);

  ASSERT_EQ(listing.size(), 3u);
  EXPECT_EQ(listing[2].name, "C");
  EXPECT_EQ(http.requestedUrls.size(), 4u);
}

TEST(ListingFetcherTest, HttpErrorStatusAbortsPaging) {
  FakeHttpClient http;
  http.enqueueJson(pageJson({serverJson("A", "DE"), serverJson("B", "AT")}, pageUrl(2)));
  http.enqueueJson(nlohmann::json{{"errors", nlohmann::json::array()}}, 500);
  http.enqueueJson(pageJson({serverJson("C", "BE")}));

  ListingFetcher fetcher(http, kBaseUrl);
  const Listing listing = fetcher.fetch(60, 100);

  EXPECT_EQ(listing.size(), 2u);
  EXPECT_EQ(http.requestedUrls.size(), 2u);
}

TEST(ListingFetcherTest, MalformedPageAbortsPaging) {
  FakeHttpClient http;
  http.enqueueJson(pageJson({serverJson("A", "DK")}, pageUrl(2)));
  HttpResponse garbage;
  garbage.transport_ok = true;
  garbage.status = 200;
  garbage.body = "<html>rate limited</html>";
  http.enqueue(garbage);

  ListingFetcher fetcher(http, kBaseUrl);
  const Listing listing = fetcher.fetch(60, 100);

  ASSERT_EQ(listing.size(), 1u);
  EXPECT_EQ(listing[0].name, "A");
}

TEST(ListingFetcherTest, FirstPageFailureYieldsEmptyListing) {
  FakeHttpClient http;
  http.enqueueTransportError("timeout");
  ListingFetcher fetcher(http, kBaseUrl);
  EXPECT_TRUE(fetcher.fetch(60, 100).empty());
  EXPECT_EQ(http.requestedUrls.size(), 1u);
}

TEST(CountryFilterTest, OnlyListedCodesPass) {
  for (const char* code : country::kEuAllowList) {
    EXPECT_TRUE(country::isAllowed(code)) << code;
  }
  EXPECT_FALSE(country::isAllowed("US"));
  EXPECT_FALSE(country::isAllowed("RU"));
  EXPECT_FALSE(country::isAllowed("de"));
  EXPECT_FALSE(country::isAllowed(""));
  EXPECT_FALSE(country::isAllowed("??"));
}
