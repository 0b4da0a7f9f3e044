#include "calendar.hpp"
#include "errors.hpp"
#include <cctype>
#include <cstdio>

namespace covercalc {

namespace {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

// Parse a fixed-width run of digits; returns false if any character is not a digit
bool parse_digits(const std::string& s, size_t pos, size_t len, int& out) {
    if (pos + len > s.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
        value = value * 10 + (s[i] - '0');
    }
    out = value;
    return true;
}

} // anonymous namespace

unsigned days_in_month(int year, unsigned month) {
    static const unsigned DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        throw ValidationError("Month must be between 1 and 12");
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

// ============================================================================
// Date Implementation
// ============================================================================

Date::Date() : year(1970), month(1), day(1) {}

Date::Date(int y, unsigned m, unsigned d) : year(y), month(m), day(d) {
    if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) {
        throw ValidationError("Invalid calendar date");
    }
}

Date Date::parse(const std::string& iso) {
    int y = 0, m = 0, d = 0;
    if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-' ||
        !parse_digits(iso, 0, 4, y) || !parse_digits(iso, 5, 2, m) ||
        !parse_digits(iso, 8, 2, d)) {
        throw ValidationError("Date must be formatted YYYY-MM-DD: '" + iso + "'");
    }
    if (m < 1 || m > 12 || d < 1 || static_cast<unsigned>(d) > days_in_month(y, static_cast<unsigned>(m))) {
        throw ValidationError("Invalid calendar date: '" + iso + "'");
    }
    return Date(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
}

std::string Date::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
    return buf;
}

// Civil-from-days / days-from-civil (Howard Hinnant's algorithms)
int64_t Date::to_days() const {
    const int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = (static_cast<int64_t>(month) + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + static_cast<int64_t>(day) - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::from_days(int64_t days) {
    const int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t d = doy - (153 * mp + 2) / 5 + 1;
    const int64_t m = mp < 10 ? mp + 3 : mp - 9;
    const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return Date(static_cast<int>(y), static_cast<unsigned>(m), static_cast<unsigned>(d));
}

Date Date::add_days(int64_t days) const {
    return from_days(to_days() + days);
}

Date Date::add_months(int months) const {
    int total = year * 12 + static_cast<int>(month) - 1 + months;
    int y = total / 12;
    unsigned m = static_cast<unsigned>(total % 12) + 1;
    unsigned last = days_in_month(y, m);
    return Date(y, m, day > last ? last : day);
}

bool Date::operator==(const Date& other) const {
    return year == other.year && month == other.month && day == other.day;
}

bool Date::operator!=(const Date& other) const {
    return !(*this == other);
}

bool Date::operator<(const Date& other) const {
    if (year != other.year) return year < other.year;
    if (month != other.month) return month < other.month;
    return day < other.day;
}

bool Date::operator<=(const Date& other) const {
    return !(other < *this);
}

bool Date::operator>(const Date& other) const {
    return other < *this;
}

bool Date::operator>=(const Date& other) const {
    return !(*this < other);
}

// ============================================================================
// YearMonth Implementation
// ============================================================================

YearMonth::YearMonth() : year(1970), month(1) {}

YearMonth::YearMonth(int y, unsigned m) : year(y), month(m) {
    if (m < 1 || m > 12) {
        throw ValidationError("Month must be between 1 and 12");
    }
}

YearMonth YearMonth::parse(const std::string& iso) {
    int y = 0, m = 0;
    if (iso.size() != 7 || iso[4] != '-' ||
        !parse_digits(iso, 0, 4, y) || !parse_digits(iso, 5, 2, m) ||
        m < 1 || m > 12) {
        throw ValidationError("Month must be formatted YYYY-MM: '" + iso + "'");
    }
    return YearMonth(y, static_cast<unsigned>(m));
}

std::string YearMonth::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u", year, month);
    return buf;
}

Date YearMonth::first_day() const {
    return Date(year, month, 1);
}

Date YearMonth::last_day() const {
    return Date(year, month, days_in_month(year, month));
}

bool YearMonth::operator==(const YearMonth& other) const {
    return year == other.year && month == other.month;
}

int64_t days_30_360(const Date& from, const Date& to) {
    int64_t d1 = from.day == 31 ? 30 : from.day;
    int64_t d2 = to.day == 31 ? 30 : to.day;
    return (static_cast<int64_t>(to.year) - from.year) * 360 +
           (static_cast<int64_t>(to.month) - static_cast<int64_t>(from.month)) * 30 +
           (d2 - d1);
}

} // namespace covercalc
