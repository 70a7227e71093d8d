#include <gtest/gtest.h>

#include <set>
#include <string>

#include "EventKind.h"

TEST(EventKind, MappingIsTotalOverKnownCodes)
{
  std::set<std::string> paths;
  for (int code = 0; code < kEventKindCount; code++) {
    auto kind = eventKindFromCode(code);
    ASSERT_TRUE(kind.has_value()) << code;
    EXPECT_EQ(static_cast<int>(*kind), code);
    paths.insert(eventPath(*kind));
  }
  EXPECT_EQ(paths.size(), static_cast<size_t>(kEventKindCount));
}

TEST(EventKind, CodesOutsideRangeAreUnknown)
{
  EXPECT_FALSE(eventKindFromCode(-1));
  EXPECT_FALSE(eventKindFromCode(8));
  EXPECT_FALSE(eventKindFromCode(99));
}

TEST(EventKind, EndpointPaths)
{
  EXPECT_STREQ(eventPath(EventKind::WEIGHING_MISMATCH), "weighting-scale-not-matched");
  EXPECT_STREQ(eventPath(EventKind::STATE_CHANGE), "states");
  EXPECT_STREQ(eventPath(EventKind::ITEM_REMOVED), "item-removed");
  EXPECT_STREQ(eventPath(EventKind::ITEM_ADDED), "item-added");
  EXPECT_STREQ(eventPath(EventKind::TRANSACTION_COMPLETED), "transaction-completed");
  EXPECT_STREQ(eventPath(EventKind::TRANSACTION_STARTED), "transaction-started");
  EXPECT_STREQ(eventPath(EventKind::SCAN_STARTED), "scan-started");
  EXPECT_STREQ(eventPath(EventKind::SCAN_COMPLETED), "scan-completed");
}

TEST(EventKind, SplitMarkerNeedsExactlyFourFields)
{
  auto marker = splitMarker("1700000000000|42|41|5");
  ASSERT_TRUE(marker);
  EXPECT_EQ(marker->timestamp, "1700000000000");
  EXPECT_EQ(marker->global_frame_index, "42");
  EXPECT_EQ(marker->scan_frame_index, "41");
  EXPECT_EQ(marker->kind_code, "5");

  EXPECT_FALSE(splitMarker("abc|def"));
  EXPECT_FALSE(splitMarker("1|2|3"));
  EXPECT_FALSE(splitMarker("1|2|3|4|5"));
  EXPECT_FALSE(splitMarker(""));

  auto empties = splitMarker("|||");
  ASSERT_TRUE(empties);
  EXPECT_EQ(empties->kind_code, "");
}

TEST(EventKind, ParseIntegerRequiresWholeString)
{
  long long value = 0;
  EXPECT_TRUE(parseInteger("5", value));
  EXPECT_EQ(value, 5);
  EXPECT_TRUE(parseInteger(" 1700000000000 ", value));
  EXPECT_EQ(value, 1700000000000LL);
  EXPECT_TRUE(parseInteger("-3", value));
  EXPECT_EQ(value, -3);

  EXPECT_FALSE(parseInteger("", value));
  EXPECT_FALSE(parseInteger("abc", value));
  EXPECT_FALSE(parseInteger("5x", value));
  EXPECT_FALSE(parseInteger("1.5", value));
}
