#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/random/SpinSelector.h"
#include "core/view/ReelLayout.h"

namespace {

Listing namedListing(std::size_t count) {
  Listing listing(count);
  for (std::size_t i = 0; i < count; ++i) {
    listing[i].name = "S" + std::to_string(i);
  }
  return listing;
}

} // namespace

TEST(ReelLayoutTest, RepetitionsCoverTargetRows) {
  const ReelLayout layout;
  EXPECT_EQ(layout.repetitionsFor(0), 0u);
  EXPECT_EQ(layout.totalRows(0), 0u);
  EXPECT_EQ(layout.repetitionsFor(1), 112u);
  EXPECT_EQ(layout.repetitionsFor(2), 57u);
  EXPECT_EQ(layout.repetitionsFor(7), 18u);
  EXPECT_EQ(layout.repetitionsFor(200), 5u);
  EXPECT_EQ(layout.totalRows(7), 18u * 7u);
}

TEST(ReelLayoutTest, FarthestTargetKeepsRowsBelowTheMarker) {
  const ReelLayout layout;
  for (std::size_t size = 1; size <= 600; ++size) {
    const std::size_t farthestTarget = loopCountFor(size) * size + size - 1;
    EXPECT_GE(layout.totalRows(size), farthestTarget + 3) << "size " << size;
    EXPECT_GE(layout.totalRows(size), 110u) << "size " << size;
  }
}

TEST(ReelLayoutTest, OffsetRowSitsOnTheCenterLine) {
  const ReelLayout layout;
  EXPECT_DOUBLE_EQ(layout.scrollTopFor(0.0, 320.0), -120.0);
  EXPECT_DOUBLE_EQ(layout.scrollTopFor(400.0, 320.0), 280.0);
}

TEST(ReelLayoutTest, VisibleRowsWrapAroundTheListing) {
  const ReelLayout layout;
  const Listing listing = namedListing(3);
  std::vector<ReelRow> rows;

  layout.visibleRows(listing, 400.0, 320.0, rows);
  ASSERT_EQ(rows.size(), 5u);
  EXPECT_EQ(rows.front().virtual_row, 3);
  EXPECT_EQ(rows.back().virtual_row, 7);

  const ReelRow& centre = rows[2];
  EXPECT_EQ(centre.virtual_row, 5);
  EXPECT_DOUBLE_EQ(centre.top, 120.0);
  EXPECT_EQ(centre.record, &listing[2]);
  EXPECT_EQ(rows[0].record, &listing[0]);
}

TEST(ReelLayoutTest, VisibleRowsClipAtTheTop) {
  const ReelLayout layout;
  const Listing listing = namedListing(3);
  std::vector<ReelRow> rows;

  layout.visibleRows(listing, 0.0, 320.0, rows);
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0].virtual_row, 0);
  EXPECT_DOUBLE_EQ(rows[0].top, 120.0);
  EXPECT_EQ(rows[0].record, &listing[0]);
  EXPECT_EQ(rows[2].virtual_row, 2);
}

TEST(ReelLayoutTest, VisibleRowsClipAtTheBottom) {
  const ReelLayout layout;
  const Listing listing = namedListing(200);
  std::vector<ReelRow> rows;

  const double lastRowOffset = static_cast<double>(layout.totalRows(listing.size()) - 1) * 80.0;
  layout.visibleRows(listing, lastRowOffset, 320.0, rows);
  ASSERT_FALSE(rows.empty());
  EXPECT_EQ(static_cast<std::size_t>(rows.back().virtual_row), layout.totalRows(listing.size()) - 1);
  EXPECT_EQ(rows.size(), 3u);
}

TEST(ReelLayoutTest, EmptyListingHasNoRows) {
  const ReelLayout layout;
  std::vector<ReelRow> rows(4);
  layout.visibleRows(Listing{}, 400.0, 320.0, rows);
  EXPECT_TRUE(rows.empty());
}
