#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <cstdint>
#include <compare>
#include <optional>

namespace tally {

/**
 * Generate a new random identifier (UUID version 4, hyphenated, lowercase).
 *
 * Bytes come from libsodium's CSPRNG so ids minted on different devices
 * never collide in a shared snapshot.
 */
[[nodiscard]] std::string generate_id();

/**
 * Initialize libsodium once per process. Safe to call repeatedly.
 */
[[nodiscard]] bool ensure_sodium();

/**
 * Timestamp - Represents a point in time.
 *
 * Stored as milliseconds since Unix epoch for SQLite compatibility.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    [[nodiscard]] constexpr bool is_epoch() const noexcept {
        return millis_ == 0;
    }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(millis_));
    }

    /**
     * Format as ISO 8601 string, e.g. 2024-03-01T09:30:00.000Z.
     */
    [[nodiscard]] std::string to_iso_string() const;

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(millis_ + d.count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

/**
 * CalendarDate - A day on the proleptic Gregorian calendar, no time zone.
 *
 * Only real dates can be constructed through parse(); 2024-02-30 is rejected.
 */
class CalendarDate {
public:
    constexpr CalendarDate() noexcept = default;

    /**
     * Parse "YYYY-MM-DD". Returns nullopt for malformed or impossible dates.
     */
    [[nodiscard]] static std::optional<CalendarDate> parse(std::string_view text);

    /**
     * Build from components, validating the day against the month length.
     */
    [[nodiscard]] static std::optional<CalendarDate> from_ymd(int year, int month, int day);

    /**
     * Convert a spreadsheet serial day number (days since 1899-12-30).
     */
    [[nodiscard]] static std::optional<CalendarDate> from_serial(int64_t serial);

    [[nodiscard]] constexpr int year() const noexcept { return year_; }
    [[nodiscard]] constexpr int month() const noexcept { return month_; }
    [[nodiscard]] constexpr int day() const noexcept { return day_; }
    [[nodiscard]] constexpr bool is_valid() const noexcept { return month_ != 0; }

    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const CalendarDate&) const = default;
    bool operator==(const CalendarDate&) const = default;

private:
    constexpr CalendarDate(int y, int m, int d) noexcept : year_(y), month_(m), day_(d) {}

    int year_ = 0;
    int month_ = 0;
    int day_ = 0;
};

/**
 * YearMonth - A calendar month, the key granularity of budgets.
 */
class YearMonth {
public:
    constexpr YearMonth() noexcept = default;

    /**
     * Parse "YYYY-MM". Returns nullopt for malformed input or month outside 1..12.
     */
    [[nodiscard]] static std::optional<YearMonth> parse(std::string_view text);

    [[nodiscard]] constexpr int year() const noexcept { return year_; }
    [[nodiscard]] constexpr int month() const noexcept { return month_; }
    [[nodiscard]] constexpr bool is_valid() const noexcept { return month_ != 0; }

    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const YearMonth&) const = default;
    bool operator==(const YearMonth&) const = default;

private:
    constexpr YearMonth(int y, int m) noexcept : year_(y), month_(m) {}

    int year_ = 0;
    int month_ = 0;
};

[[nodiscard]] constexpr bool is_leap_year(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

[[nodiscard]] constexpr int days_in_month(int year, int month) noexcept {
    constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return days[month - 1];
}

} // namespace tally
