#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace strata {
namespace utils {

using Date = std::chrono::year_month_day;
using DateTime = std::chrono::sys_time<std::chrono::microseconds>;
using DateRange = std::pair<Date, Date>;

/// Source of "today"; injectable so relative windows are testable
using TodayProvider = std::function<Date()>;

/// Sentinel used in place of NULL datetimes
inline constexpr const char* kFallbackDatetime = "0001-01-01 00:00:00.000000";
inline constexpr const char* kFallbackDate = "0001-01-01";
inline constexpr const char* kFallbackTime = "00:00:00";

Date todayUtc();

// Accepts "YYYY-MM-DD" optionally followed by a time part
std::optional<Date> parseDate(std::string_view text);
// Accepts "YYYY-MM-DD[ HH:MM[:SS[.ffffff]]]" (also with 'T' separator)
std::optional<DateTime> parseDatetime(std::string_view text);
// Accepts "HH:MM[:SS[.ffffff]]"
std::optional<std::chrono::microseconds> parseTime(std::string_view text);

std::string formatDate(const Date& d);                       // 2024-01-31
std::string formatDatetime(const DateTime& dt);              // 2024-01-31 10:00:00.000000
std::string formatTime(std::chrono::microseconds since_midnight); // 10:00:00.000000

Date addDays(const Date& d, int days);
Date addMonths(const Date& d, int months);

Date firstDayOfWeek(const Date& d);   // weeks start on Monday
Date lastDayOfWeek(const Date& d);
Date firstDayOfMonth(const Date& d);
Date lastDayOfMonth(const Date& d);
Date quarterStart(const Date& d);
Date quarterEnd(const Date& d);
Date yearStart(const Date& d);
Date yearEnd(const Date& d);

/// Resolve a named window such as "last week", "this quarter", "next 6 months",
/// "today". Throws ValidationError on unknown names.
DateRange timespanDateRange(std::string_view timespan, const Date& today);

/// Map a previous/next operator with a period ("1 week", "3 months", ...) to
/// the timespan name understood by timespanDateRange.
std::string relativeTimespan(std::string_view op, std::string_view period);

} // namespace utils
} // namespace strata
