#ifndef COVERCALC_CALENDAR_HPP
#define COVERCALC_CALENDAR_HPP

#include <cstdint>
#include <string>

namespace covercalc {

// Date: proleptic Gregorian calendar date, ISO "YYYY-MM-DD" at the boundary
struct Date {
    int year;
    unsigned month;  // 1-12
    unsigned day;    // 1-31

    Date();
    Date(int y, unsigned m, unsigned d);

    // Parse "YYYY-MM-DD"; throws ValidationError on malformed or impossible dates
    static Date parse(const std::string& iso);

    std::string to_string() const;

    // Days since 1970-01-01
    int64_t to_days() const;
    static Date from_days(int64_t days);

    Date add_days(int64_t days) const;
    Date add_months(int months) const;

    bool operator==(const Date& other) const;
    bool operator!=(const Date& other) const;
    bool operator<(const Date& other) const;
    bool operator<=(const Date& other) const;
    bool operator>(const Date& other) const;
    bool operator>=(const Date& other) const;
};

// YearMonth: calendar month, ISO "YYYY-MM" at the boundary
struct YearMonth {
    int year;
    unsigned month;

    YearMonth();
    YearMonth(int y, unsigned m);

    static YearMonth parse(const std::string& iso);

    std::string to_string() const;

    Date first_day() const;
    Date last_day() const;

    bool operator==(const YearMonth& other) const;
};

unsigned days_in_month(int year, unsigned month);

// Day count between two dates under the 30/360 convention.
// Day 31 is treated as day 30 on both ends.
int64_t days_30_360(const Date& from, const Date& to);

} // namespace covercalc

#endif // COVERCALC_CALENDAR_HPP
