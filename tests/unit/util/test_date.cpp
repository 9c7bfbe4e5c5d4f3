#include <gtest/gtest.h>

#include "taskr/util/date.hpp"

using namespace taskr::util;
using namespace std::chrono;

namespace {

std::optional<std::string> iso(std::string_view text) {
  auto date = Date::parse(text, year{2024});
  if (!date) {
    return std::nullopt;
  }
  return Date::toIso(*date);
}

}  // namespace

TEST(DateTest, ParsesIsoDates) {
  EXPECT_EQ(iso("2024-03-01"), "2024-03-01");
  EXPECT_EQ(iso("2025/12/31"), "2025-12-31");
}

TEST(DateTest, ParsesDayMonthYear) {
  EXPECT_EQ(iso("1-3-2025"), "2025-03-01");
  EXPECT_EQ(iso("15.6.25"), "2025-06-15");
}

TEST(DateTest, MissingYearUsesCurrentYear) {
  EXPECT_EQ(iso("5/11"), "2024-11-05");
}

TEST(DateTest, FindsDateInsideText) {
  EXPECT_EQ(iso("due 2024-07-04 at noon"), "2024-07-04");
}

TEST(DateTest, RejectsInvalidDates) {
  EXPECT_FALSE(iso("notadate"));
  EXPECT_FALSE(iso("2024-02-30"));
  EXPECT_FALSE(iso("2024-13-01"));
  EXPECT_FALSE(iso("2024-05"));
  EXPECT_FALSE(iso(""));
}

TEST(DateTest, RangeOfDayPage) {
  auto range = Date::rangeFromDocumentName("Journal:2024:03:01");
  ASSERT_TRUE(range);
  EXPECT_EQ(Date::toIso(range->start), "2024-03-01");
  EXPECT_EQ(Date::toIso(range->end), "2024-03-01");
}

TEST(DateTest, RangeOfMonthPage) {
  auto range = Date::rangeFromDocumentName("Journal:2024:02");
  ASSERT_TRUE(range);
  EXPECT_EQ(Date::toIso(range->start), "2024-02-01");
  EXPECT_EQ(Date::toIso(range->end), "2024-02-29");
}

TEST(DateTest, RangeOfYearPage) {
  auto range = Date::rangeFromDocumentName("Journal:2023");
  ASSERT_TRUE(range);
  EXPECT_EQ(Date::toIso(range->end), "2023-12-31");
}

TEST(DateTest, RangeOfWeekPage) {
  // ISO week 10 of 2024 runs Monday 4 March to Sunday 10 March
  auto range = Date::rangeFromDocumentName("Journal:2024:Week 10");
  ASSERT_TRUE(range);
  EXPECT_EQ(Date::toIso(range->start), "2024-03-04");
  EXPECT_EQ(Date::toIso(range->end), "2024-03-10");
}

TEST(DateTest, NoRangeForOrdinaryPages) {
  EXPECT_FALSE(Date::rangeFromDocumentName("Projects:Garden"));
  EXPECT_FALSE(Date::rangeFromDocumentName("Journal:2024:13"));
}

TEST(DateTest, UrgencyWithoutWorkweek) {
  year_month_day monday{year{2024}, March, day{4}};
  EXPECT_EQ(Date::urgency("2024-03-01", monday, false), Urgency::kHigh);
  EXPECT_EQ(Date::urgency("2024-03-04", monday, false), Urgency::kHigh);
  EXPECT_EQ(Date::urgency("2024-03-05", monday, false), Urgency::kMedium);
  EXPECT_EQ(Date::urgency("2024-03-06", monday, false), Urgency::kAlert);
  EXPECT_EQ(Date::urgency("2024-03-07", monday, false), Urgency::kNone);
  EXPECT_EQ(Date::urgency(kNoDate, monday, false), Urgency::kNone);
}

TEST(DateTest, UrgencySkipsWeekendOnFriday) {
  year_month_day friday{year{2024}, March, day{8}};
  EXPECT_EQ(Date::urgency("2024-03-11", friday, true), Urgency::kMedium);
  EXPECT_EQ(Date::urgency("2024-03-12", friday, true), Urgency::kAlert);
  EXPECT_EQ(Date::urgency("2024-03-11", friday, false), Urgency::kNone);
}

TEST(DateTest, UrgencyOnThursday) {
  year_month_day thursday{year{2024}, March, day{7}};
  EXPECT_EQ(Date::urgency("2024-03-08", thursday, true), Urgency::kMedium);
  EXPECT_EQ(Date::urgency("2024-03-10", thursday, true), Urgency::kAlert);
}
