#pragma once

#include <chrono>
#include <iosfwd>
#include <string>

namespace taxlots {

using Timestamp = std::chrono::system_clock::time_point;

// Proleptic Gregorian calendar day, stored as days since 1970-01-01.
class CalendarDate {
public:
    CalendarDate() = default;

    // Throws InvalidRecord for out-of-range month/day values.
    static CalendarDate from_ymd(int year, int month, int day);
    static CalendarDate from_days(long days) { return CalendarDate(days); }
    static CalendarDate from_time_point(Timestamp tp);

    // "YYYY-MM-DD"
    static CalendarDate parse_iso(const std::string& text);
    // "DD.MM.YYYY"
    static CalendarDate parse_dmy(const std::string& text);

    [[nodiscard]] long days_since_epoch() const { return days_; }
    [[nodiscard]] int year() const;
    [[nodiscard]] int month() const;
    [[nodiscard]] int day() const;

    std::string to_iso() const;
    std::string to_dmy() const;

    CalendarDate operator+(long days) const { return CalendarDate(days_ + days); }
    CalendarDate operator-(long days) const { return CalendarDate(days_ - days); }
    long operator-(const CalendarDate& other) const { return days_ - other.days_; }

    bool operator==(const CalendarDate& other) const { return days_ == other.days_; }
    bool operator!=(const CalendarDate& other) const { return days_ != other.days_; }
    bool operator<(const CalendarDate& other) const { return days_ < other.days_; }
    bool operator<=(const CalendarDate& other) const { return days_ <= other.days_; }
    bool operator>(const CalendarDate& other) const { return days_ > other.days_; }
    bool operator>=(const CalendarDate& other) const { return days_ >= other.days_; }

private:
    explicit CalendarDate(long days) : days_(days) {}

    long days_ = 0;
};

// Broker statement timestamp "YYYY-MM-DD, HH:MM:SS", interpreted as UTC.
// Throws InvalidRecord.
Timestamp parse_timestamp(const std::string& text);

std::string format_timestamp(Timestamp tp);

std::ostream& operator<<(std::ostream& os, const CalendarDate& date);

} // namespace taxlots
