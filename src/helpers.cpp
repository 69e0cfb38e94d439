#include "locamat/helpers.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <iterator>
#include <sstream>

namespace locamat {
namespace helpers {

namespace {

bool is_leap(int64_t year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int32_t days_in_month(int64_t year, int32_t month) {
    static const int32_t kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) return 29;
    return kDays[month - 1];
}

bool all_digits(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
}

} // anonymous namespace

bool is_valid(const Date& date) {
    if (date.month() < 1 || date.month() > 12) return false;
    return date.day() >= 1 && date.day() <= days_in_month(date.year(), date.month());
}

// Days-from-civil over 400-year eras; exact for every Gregorian date.
CivilDay to_civil_day(const Date& date) {
    if (!is_valid(date)) {
        throw InvalidArgumentError("invalid date: " + to_iso(date));
    }
    int64_t y = date.year();
    const int64_t m = date.month();
    const int64_t d = date.day();
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date from_civil_day(CivilDay day) {
    day += 719468;
    const int64_t era = (day >= 0 ? day : day - 146096) / 146097;
    const int64_t doe = day - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t d = doy - (153 * mp + 2) / 5 + 1;
    const int64_t m = mp < 10 ? mp + 3 : mp - 9;
    const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return make_date(static_cast<int32_t>(y), static_cast<int32_t>(m), static_cast<int32_t>(d));
}

Date today() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    CivilDay day = seconds / 86400;
    if (seconds % 86400 < 0) --day;
    return from_civil_day(day);
}

std::string to_iso(const Date& date) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", date.year(), date.month(), date.day());
    return buffer;
}

Date parse_iso_date(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-' ||
        !all_digits(text.substr(0, 4)) || !all_digits(text.substr(5, 2)) ||
        !all_digits(text.substr(8, 2))) {
        throw InvalidArgumentError("malformed date: '" + text + "'");
    }
    Date date = make_date(std::stoi(text.substr(0, 4)), std::stoi(text.substr(5, 2)),
                          std::stoi(text.substr(8, 2)));
    if (!is_valid(date)) {
        throw InvalidArgumentError("invalid date: '" + text + "'");
    }
    return date;
}

Money parse_money(const std::string& text) {
    auto dot = text.find('.');
    std::string units = text.substr(0, dot);
    std::string fraction = dot == std::string::npos ? "" : text.substr(dot + 1);

    if (!all_digits(units) || units.size() > 15 || fraction.size() > 2 ||
        (dot != std::string::npos && !all_digits(fraction))) {
        throw InvalidArgumentError("malformed amount: '" + text + "'");
    }
    while (fraction.size() < 2) fraction.push_back('0');
    return make_money(std::stoll(units) * 100 + std::stoll(fraction));
}

std::string format_money(const Money& money) {
    int64_t cents = money.cents();
    std::string sign = cents < 0 ? "-" : "";
    uint64_t magnitude = cents < 0 ? 0 - static_cast<uint64_t>(cents) : static_cast<uint64_t>(cents);
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%s%llu.%02llu", sign.c_str(),
                  static_cast<unsigned long long>(magnitude / 100),
                  static_cast<unsigned long long>(magnitude % 100));
    return buffer;
}

IdList sorted_unique(IdList ids) {
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

IdList missing_ids(const IdList& requested, const IdList& found) {
    IdList missing;
    std::set_difference(requested.begin(), requested.end(), found.begin(), found.end(),
                        std::back_inserter(missing));
    return missing;
}

std::string join_ids(const IdList& ids) {
    std::ostringstream ss;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << ids[i];
    }
    return ss.str();
}

} // namespace helpers
} // namespace locamat
