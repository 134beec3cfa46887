#include "utils/date_utils.h"
#include "utils/errors.h"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <map>

namespace strata {
namespace utils {

using namespace std::chrono;

namespace {

// Reads exactly `width` digits starting at pos; advances pos on success
std::optional<int> readDigits(std::string_view s, size_t& pos, size_t width) {
    if (pos + width > s.size()) return std::nullopt;
    int v = 0;
    for (size_t i = 0; i < width; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        v = v * 10 + (c - '0');
    }
    pos += width;
    return v;
}

bool expect(std::string_view s, size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::optional<microseconds> parseTimeAt(std::string_view s, size_t& pos) {
    auto h = readDigits(s, pos, 2);
    if (!h || !expect(s, pos, ':')) return std::nullopt;
    auto m = readDigits(s, pos, 2);
    if (!m) return std::nullopt;
    int sec = 0;
    int64_t micros = 0;
    if (expect(s, pos, ':')) {
        auto sv = readDigits(s, pos, 2);
        if (!sv) return std::nullopt;
        sec = *sv;
        if (expect(s, pos, '.')) {
            // up to 6 fractional digits, right padded
            int digits = 0;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
                if (digits < 6) {
                    micros = micros * 10 + (s[pos] - '0');
                    ++digits;
                }
                ++pos;
            }
            if (digits == 0) return std::nullopt;
            for (; digits < 6; ++digits) micros *= 10;
        }
    }
    if (*h > 23 || *m > 59 || sec > 59) return std::nullopt;
    return hours(*h) + minutes(*m) + seconds(sec) + microseconds(micros);
}

std::optional<Date> parseDateAt(std::string_view s, size_t& pos) {
    auto y = readDigits(s, pos, 4);
    if (!y || !expect(s, pos, '-')) return std::nullopt;
    auto m = readDigits(s, pos, 2);
    if (!m || !expect(s, pos, '-')) return std::nullopt;
    auto d = readDigits(s, pos, 2);
    if (!d) return std::nullopt;
    Date date{year{*y}, month{static_cast<unsigned>(*m)}, day{static_cast<unsigned>(*d)}};
    if (!date.ok()) return std::nullopt;
    return date;
}

} // namespace

Date todayUtc() {
    return Date{floor<days>(system_clock::now())};
}

std::optional<Date> parseDate(std::string_view text) {
    text = trim(text);
    size_t pos = 0;
    auto d = parseDateAt(text, pos);
    if (!d) return std::nullopt;
    if (pos != text.size() && text[pos] != ' ' && text[pos] != 'T') return std::nullopt;
    return d;
}

std::optional<DateTime> parseDatetime(std::string_view text) {
    text = trim(text);
    size_t pos = 0;
    auto d = parseDateAt(text, pos);
    if (!d) return std::nullopt;
    DateTime result = time_point_cast<microseconds>(sys_days{*d});
    if (pos == text.size()) return result;
    if (text[pos] != ' ' && text[pos] != 'T') return std::nullopt;
    ++pos;
    auto t = parseTimeAt(text, pos);
    if (!t || pos != text.size()) return std::nullopt;
    return result + *t;
}

std::optional<microseconds> parseTime(std::string_view text) {
    text = trim(text);
    size_t pos = 0;
    auto t = parseTimeAt(text, pos);
    if (!t || pos != text.size()) return std::nullopt;
    return t;
}

std::string formatDate(const Date& d) {
    return fmt::format("{:04}-{:02}-{:02}",
        static_cast<int>(d.year()), static_cast<unsigned>(d.month()), static_cast<unsigned>(d.day()));
}

std::string formatTime(microseconds since_midnight) {
    hh_mm_ss<microseconds> t{since_midnight};
    return fmt::format("{:02}:{:02}:{:02}.{:06}",
        t.hours().count(), t.minutes().count(), t.seconds().count(), t.subseconds().count());
}

std::string formatDatetime(const DateTime& dt) {
    auto day_point = floor<days>(dt);
    return formatDate(Date{day_point}) + " " + formatTime(dt - day_point);
}

Date addDays(const Date& d, int n) {
    return Date{sys_days{d} + days{n}};
}

Date addMonths(const Date& d, int n) {
    year_month ym = year_month{d.year(), d.month()} + months{n};
    // clamp to the last valid day of the target month
    auto last = year_month_day_last{ym.year(), month_day_last{ym.month()}}.day();
    return Date{ym.year(), ym.month(), std::min(d.day(), last)};
}

Date firstDayOfWeek(const Date& d) {
    weekday wd{sys_days{d}};
    // iso_encoding: Monday=1 .. Sunday=7
    return addDays(d, -static_cast<int>(wd.iso_encoding() - 1));
}

Date lastDayOfWeek(const Date& d) {
    return addDays(firstDayOfWeek(d), 6);
}

Date firstDayOfMonth(const Date& d) {
    return Date{d.year(), d.month(), day{1}};
}

Date lastDayOfMonth(const Date& d) {
    return Date{year_month_day_last{d.year(), month_day_last{d.month()}}};
}

Date quarterStart(const Date& d) {
    unsigned m = static_cast<unsigned>(d.month());
    unsigned first = ((m - 1) / 3) * 3 + 1;
    return Date{d.year(), month{first}, day{1}};
}

Date quarterEnd(const Date& d) {
    return lastDayOfMonth(addMonths(quarterStart(d), 2));
}

Date yearStart(const Date& d) {
    return Date{d.year(), January, day{1}};
}

Date yearEnd(const Date& d) {
    return Date{d.year(), December, day{31}};
}

DateRange timespanDateRange(std::string_view timespan, const Date& today) {
    std::string key(trim(timespan));
    std::transform(key.begin(), key.end(), key.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "today") return {today, today};
    if (key == "yesterday") return {addDays(today, -1), addDays(today, -1)};
    if (key == "tomorrow") return {addDays(today, 1), addDays(today, 1)};

    if (key == "last week") {
        auto d = addDays(today, -7);
        return {firstDayOfWeek(d), lastDayOfWeek(d)};
    }
    if (key == "last month") {
        auto d = addMonths(today, -1);
        return {firstDayOfMonth(d), lastDayOfMonth(d)};
    }
    if (key == "last quarter") {
        auto d = addMonths(today, -3);
        return {quarterStart(d), quarterEnd(d)};
    }
    if (key == "last 6 months") {
        return {quarterStart(addMonths(today, -6)), quarterEnd(addMonths(today, -3))};
    }
    if (key == "last year") {
        auto d = Date{today.year() - years{1}, January, day{1}};
        return {yearStart(d), yearEnd(d)};
    }

    if (key == "this week") return {firstDayOfWeek(today), lastDayOfWeek(today)};
    if (key == "this month") return {firstDayOfMonth(today), lastDayOfMonth(today)};
    if (key == "this quarter") return {quarterStart(today), quarterEnd(today)};
    if (key == "this year") return {yearStart(today), yearEnd(today)};

    if (key == "next week") {
        auto d = addDays(today, 7);
        return {firstDayOfWeek(d), lastDayOfWeek(d)};
    }
    if (key == "next month") {
        auto d = addMonths(today, 1);
        return {firstDayOfMonth(d), lastDayOfMonth(d)};
    }
    if (key == "next quarter") {
        auto d = addMonths(today, 3);
        return {quarterStart(d), quarterEnd(d)};
    }
    if (key == "next 6 months") {
        return {quarterStart(addMonths(today, 3)), quarterEnd(addMonths(today, 6))};
    }
    if (key == "next year") {
        auto d = Date{today.year() + years{1}, January, day{1}};
        return {yearStart(d), yearEnd(d)};
    }

    throw ValidationError("Unknown timespan: " + key);
}

std::string relativeTimespan(std::string_view op, std::string_view period) {
    static const std::map<std::string, std::string, std::less<>> kPeriods = {
        {"1 week", "week"},
        {"1 month", "month"},
        {"3 months", "quarter"},
        {"6 months", "6 months"},
        {"1 year", "year"},
    };

    std::string direction;
    if (op == "previous") {
        direction = "last";
    } else if (op == "next") {
        direction = "next";
    } else {
        throw ValidationError("Relative timespan requires 'previous' or 'next', got: " + std::string(op));
    }

    auto it = kPeriods.find(trim(period));
    if (it == kPeriods.end()) {
        throw ValidationError("Unknown period for '" + std::string(op) + "': " + std::string(period));
    }
    return direction + " " + it->second;
}

} // namespace utils
} // namespace strata
