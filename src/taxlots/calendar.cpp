#include "taxlots/calendar.hpp"
#include "taxlots/errors.hpp"

#include <cctype>
#include <cstdio>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace taxlots {

namespace {

constexpr long kSecondsPerDay = 86400;

// Howard Hinnant's days_from_civil / civil_from_days.
long days_from_civil(long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

struct Civil {
    int year;
    int month;
    int day;
};

Civil civil_from_days(long z) {
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long y = static_cast<long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Civil{static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d)};
}

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (month == 2 && is_leap(year)) ? 29 : kDays[month - 1];
}

// Reads exactly `width` digits starting at `pos`.
bool read_number(const std::string& text, std::size_t pos, std::size_t width, int& out) {
    if (pos + width > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + width; ++i) {
        const unsigned char ch = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(ch)) {
            return false;
        }
        value = value * 10 + (ch - '0');
    }
    out = value;
    return true;
}

} // namespace

CalendarDate CalendarDate::from_ymd(int year, int month, int day) {
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        std::ostringstream oss;
        oss << year << '-' << month << '-' << day;
        throw InvalidRecord("Invalid calendar date", oss.str());
    }
    return CalendarDate(days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)));
}

CalendarDate CalendarDate::from_time_point(Timestamp tp) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    long days = static_cast<long>(seconds / kSecondsPerDay);
    if (seconds % kSecondsPerDay < 0) {
        --days;
    }
    return CalendarDate(days);
}

CalendarDate CalendarDate::parse_iso(const std::string& text) {
    int year = 0;
    int month = 0;
    int day = 0;
    if (text.size() != 10 || text[4] != '-' || text[7] != '-' ||
        !read_number(text, 0, 4, year) || !read_number(text, 5, 2, month) || !read_number(text, 8, 2, day)) {
        throw InvalidRecord("Unparseable date, expected YYYY-MM-DD", text);
    }
    return from_ymd(year, month, day);
}

CalendarDate CalendarDate::parse_dmy(const std::string& text) {
    int year = 0;
    int month = 0;
    int day = 0;
    if (text.size() != 10 || text[2] != '.' || text[5] != '.' ||
        !read_number(text, 0, 2, day) || !read_number(text, 3, 2, month) || !read_number(text, 6, 4, year)) {
        throw InvalidRecord("Unparseable date, expected DD.MM.YYYY", text);
    }
    return from_ymd(year, month, day);
}

int CalendarDate::year() const {
    return civil_from_days(days_).year;
}

int CalendarDate::month() const {
    return civil_from_days(days_).month;
}

int CalendarDate::day() const {
    return civil_from_days(days_).day;
}

std::string CalendarDate::to_iso() const {
    const Civil c = civil_from_days(days_);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", c.year, c.month, c.day);
    return buffer;
}

std::string CalendarDate::to_dmy() const {
    const Civil c = civil_from_days(days_);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d.%02d.%04d", c.day, c.month, c.year);
    return buffer;
}

Timestamp parse_timestamp(const std::string& text) {
    // 2018-11-08, 09:33:38
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (text.size() != 20 || text.compare(10, 2, ", ") != 0 || text[14] != ':' || text[17] != ':' ||
        !read_number(text, 12, 2, hour) || !read_number(text, 15, 2, minute) ||
        !read_number(text, 18, 2, second) || hour > 23 || minute > 59 || second > 59) {
        throw InvalidRecord("Unparseable timestamp, expected YYYY-MM-DD, HH:MM:SS", text);
    }
    const CalendarDate date = CalendarDate::parse_iso(text.substr(0, 10));
    const long long seconds = static_cast<long long>(date.days_since_epoch()) * kSecondsPerDay +
                              hour * 3600LL + minute * 60LL + second;
    return Timestamp{std::chrono::seconds(seconds)};
}

std::string format_timestamp(Timestamp tp) {
    const CalendarDate date = CalendarDate::from_time_point(tp);
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    const long long of_day = seconds - static_cast<long long>(date.days_since_epoch()) * kSecondsPerDay;

    std::ostringstream oss;
    oss << date.to_iso() << ' '
        << std::setfill('0') << std::setw(2) << of_day / 3600 << ':'
        << std::setw(2) << (of_day / 60) % 60 << ':'
        << std::setw(2) << of_day % 60;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const CalendarDate& date) {
    return os << date.to_iso();
}

} // namespace taxlots
