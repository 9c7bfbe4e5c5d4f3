#include "taskr/util/date.hpp"

#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>
#include <vector>

namespace taskr::util {

namespace {

std::vector<std::string> splitName(std::string_view name) {
  std::vector<std::string> parts;
  std::string current;
  for (char c : name) {
    if (c == ':') {
      parts.push_back(current);
      current.clear();
    } else {
      current += c;
    }
  }
  parts.push_back(current);
  return parts;
}

bool isDigits(const std::string& str, size_t min_len, size_t max_len) {
  if (str.size() < min_len || str.size() > max_len) {
    return false;
  }
  for (char c : str) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

std::chrono::year_month_day lastDayOf(std::chrono::year y, std::chrono::month m) {
  std::chrono::year_month_day_last last{y, std::chrono::month_day_last{m}};
  return std::chrono::year_month_day{last};
}

}  // namespace

std::optional<std::chrono::year_month_day> Date::parse(std::string_view str,
                                                       std::chrono::year current_year) {
  static const std::regex date_regex(R"((\d{1,4})\D(\d{1,2})(?:\D(\d{1,4}))?)");

  std::string input(str);
  std::smatch match;
  if (!std::regex_search(input, match, date_regex)) {
    return std::nullopt;
  }

  std::string first = match[1];
  std::string second = match[2];
  std::string third = match[3].matched ? match[3].str() : std::string();

  int y = 0;
  unsigned m = 0;
  unsigned d = 0;
  if (first.size() == 4) {
    if (third.empty()) {
      return std::nullopt;  // "yyyy-mm" is not a day
    }
    y = std::stoi(first);
    m = static_cast<unsigned>(std::stoi(second));
    d = static_cast<unsigned>(std::stoi(third));
  } else {
    d = static_cast<unsigned>(std::stoi(first));
    m = static_cast<unsigned>(std::stoi(second));
    if (third.empty()) {
      y = static_cast<int>(current_year);
    } else if (third.size() == 2) {
      y = 2000 + std::stoi(third);
    } else {
      y = std::stoi(third);
    }
  }

  std::chrono::year_month_day date{std::chrono::year{y}, std::chrono::month{m},
                                   std::chrono::day{d}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

std::optional<std::chrono::year_month_day> Date::parse(std::string_view str) {
  return parse(str, today().year());
}

std::string Date::toIso(std::chrono::year_month_day date) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(date.year()) << '-'
      << std::setw(2) << static_cast<unsigned>(date.month()) << '-'
      << std::setw(2) << static_cast<unsigned>(date.day());
  return oss.str();
}

std::chrono::year_month_day Date::today() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  return std::chrono::year_month_day{std::chrono::year{local.tm_year + 1900},
                                     std::chrono::month{static_cast<unsigned>(local.tm_mon + 1)},
                                     std::chrono::day{static_cast<unsigned>(local.tm_mday)}};
}

std::optional<DateRange> Date::rangeFromDocumentName(std::string_view name) {
  auto parts = splitName(name);

  // Find the year component, it must be followed only by month/day or a week
  for (size_t i = 0; i < parts.size(); ++i) {
    if (!isDigits(parts[i], 4, 4)) {
      continue;
    }
    std::chrono::year y{std::stoi(parts[i])};
    size_t rest = parts.size() - i - 1;

    if (rest == 0) {
      return DateRange{y / std::chrono::January / 1, y / std::chrono::December / 31};
    }

    static const std::regex week_regex(R"(Week\s*(\d{1,2}))", std::regex::icase);
    std::smatch week_match;
    if (rest == 1 && std::regex_match(parts[i + 1], week_match, week_regex)) {
      int week = std::stoi(week_match[1]);
      if (week < 1 || week > 53) {
        return std::nullopt;
      }
      // ISO week 1 is the week containing January 4th
      std::chrono::sys_days jan4{y / std::chrono::January / 4};
      std::chrono::weekday wd{jan4};
      auto monday = jan4 - std::chrono::days{wd.iso_encoding() - 1};
      auto start = monday + std::chrono::days{7 * (week - 1)};
      auto end = start + std::chrono::days{6};
      return DateRange{std::chrono::year_month_day{start}, std::chrono::year_month_day{end}};
    }

    if (!isDigits(parts[i + 1], 1, 2)) {
      continue;
    }
    std::chrono::month m{static_cast<unsigned>(std::stoi(parts[i + 1]))};
    if (!m.ok()) {
      return std::nullopt;
    }

    if (rest == 1) {
      return DateRange{y / m / 1, lastDayOf(y, m)};
    }

    if (rest == 2 && isDigits(parts[i + 2], 1, 2)) {
      std::chrono::year_month_day day{y, m, std::chrono::day{static_cast<unsigned>(std::stoi(parts[i + 2]))}};
      if (!day.ok()) {
        return std::nullopt;
      }
      return DateRange{day, day};
    }
  }

  return std::nullopt;
}

Urgency Date::urgency(std::string_view due, std::chrono::year_month_day today,
                      bool use_workweek) {
  if (due.empty() || due == kNoDate) {
    return Urgency::kNone;
  }

  int delta1 = 1;
  int delta2 = 2;
  if (use_workweek) {
    std::chrono::weekday wd{std::chrono::sys_days{today}};
    if (wd == std::chrono::Thursday) {
      delta1 = 1;
      delta2 = 3;
    } else if (wd == std::chrono::Friday) {
      delta1 = 3;
      delta2 = 4;
    }
  }

  std::chrono::sys_days base{today};
  std::string today_str = toIso(today);
  std::string first = toIso(std::chrono::year_month_day{base + std::chrono::days{delta1}});
  std::string second = toIso(std::chrono::year_month_day{base + std::chrono::days{delta2}});

  // ISO dates compare correctly as strings
  if (due <= today_str) {
    return Urgency::kHigh;
  }
  if (due <= first) {
    return Urgency::kMedium;
  }
  if (due <= second) {
    return Urgency::kAlert;
  }
  return Urgency::kNone;
}

}  // namespace taskr::util
