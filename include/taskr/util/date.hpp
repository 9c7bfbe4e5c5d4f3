#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace taskr::util {

// Due date value that sorts after every ISO date
inline constexpr std::string_view kNoDate = "9999";

// Inclusive range of days, e.g. a calendar page covering a week
struct DateRange {
  std::chrono::year_month_day start;
  std::chrono::year_month_day end;
};

// How close a due date is, used to highlight tasks
enum class Urgency {
  kNone,
  kAlert,   // day after tomorrow (or after the weekend)
  kMedium,  // tomorrow
  kHigh     // today or overdue
};

// Calendar date helpers
class Date {
 public:
  // Parse the first "A-B[-C]" digit group in str. Any single non-digit
  // separates the numbers. A four digit first number means year-month-day,
  // otherwise day-month-year; a missing year is taken from current_year.
  static std::optional<std::chrono::year_month_day> parse(std::string_view str,
                                                          std::chrono::year current_year);

  // Same as above with the current local year
  static std::optional<std::chrono::year_month_day> parse(std::string_view str);

  // Format as YYYY-MM-DD
  static std::string toIso(std::chrono::year_month_day date);

  // Today in local time
  static std::chrono::year_month_day today();

  // Date range of a calendar page name such as "Journal:2024:03:01",
  // "Journal:2024:03", "Journal:2024" or "Journal:2024:Week 10"
  static std::optional<DateRange> rangeFromDocumentName(std::string_view name);

  // Classify an ISO due date (or kNoDate) relative to today. With
  // use_workweek the thresholds skip the weekend on Thursday and Friday.
  static Urgency urgency(std::string_view due, std::chrono::year_month_day today,
                         bool use_workweek);
};

}  // namespace taskr::util
