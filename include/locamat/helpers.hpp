#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "locamat/types.pb.h"
#include "errors.hpp"

namespace locamat {

/**
 * Helper functions for dates, money and identifier lists.
 */
namespace helpers {

/// Serial day number, counted from 1970-01-01.
using CivilDay = int64_t;

/**
 * Build a Date. Does not validate; see is_valid().
 */
inline Date make_date(int32_t year, int32_t month, int32_t day) {
    Date date;
    date.set_year(year);
    date.set_month(month);
    date.set_day(day);
    return date;
}

/**
 * Check that a Date names a real day of the proleptic Gregorian calendar.
 */
bool is_valid(const Date& date);

/**
 * Convert a Date to its serial day number.
 * @throws InvalidArgumentError if the date is not valid
 */
CivilDay to_civil_day(const Date& date);

/**
 * Convert a serial day number back to a Date.
 */
Date from_civil_day(CivilDay day);

/**
 * Signed number of days from `from` to `to`.
 */
inline int64_t days_between(const Date& from, const Date& to) {
    return to_civil_day(to) - to_civil_day(from);
}

inline bool is_before(const Date& lhs, const Date& rhs) {
    return to_civil_day(lhs) < to_civil_day(rhs);
}

/**
 * Today's date in UTC.
 */
Date today();

/**
 * Format as YYYY-MM-DD.
 */
std::string to_iso(const Date& date);

/**
 * Parse YYYY-MM-DD.
 * @throws InvalidArgumentError on malformed input
 */
Date parse_iso_date(const std::string& text);

inline Money make_money(int64_t cents) {
    Money money;
    money.set_cents(cents);
    return money;
}

/**
 * Parse a decimal amount with at most two fractional digits ("5", "5.5", "5.00").
 * @throws InvalidArgumentError on malformed input
 */
Money parse_money(const std::string& text);

/**
 * Format as a decimal amount with two fractional digits.
 */
std::string format_money(const Money& money);

/**
 * Sort ascending and drop duplicates.
 */
IdList sorted_unique(IdList ids);

/**
 * Ids of `requested` that do not appear in `found`. Both must be sorted.
 */
IdList missing_ids(const IdList& requested, const IdList& found);

/**
 * Render as "1, 2, 3".
 */
std::string join_ids(const IdList& ids);

} // namespace helpers
} // namespace locamat
