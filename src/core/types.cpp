#include "core/types.hpp"

#include <sodium.h>

#include <array>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace tally {

namespace {

// Fixed-width unsigned decimal field, no sign, no whitespace.
std::optional<int> parse_digits(std::string_view text) {
    if (text.empty()) return std::nullopt;
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    return value;
}

// Howard Hinnant's civil_from_days.
std::optional<CalendarDate> civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CalendarDate::from_ymd(static_cast<int>(m <= 2 ? y + 1 : y),
                                  static_cast<int>(m), static_cast<int>(d));
}

} // namespace

bool ensure_sodium() {
    static const bool initialized = sodium_init() >= 0;
    return initialized;
}

std::string generate_id() {
    if (!ensure_sodium()) {
        throw std::runtime_error("libsodium initialization failed");
    }

    std::array<uint8_t, 16> bytes{};
    randombytes_buf(bytes.data(), bytes.size());

    // Version 4, RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        out += hex[bytes[i] >> 4];
        out += hex[bytes[i] & 0x0F];
    }
    return out;
}

std::string Timestamp::to_iso_string() const {
    auto time_t = Clock::to_time_t(to_time_point());
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    auto ms = millis_ % 1000;
    if (ms < 0) ms += 1000;
    oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

std::optional<CalendarDate> CalendarDate::parse(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    auto year = parse_digits(text.substr(0, 4));
    auto month = parse_digits(text.substr(5, 2));
    auto day = parse_digits(text.substr(8, 2));
    if (!year || !month || !day) {
        return std::nullopt;
    }
    return from_ymd(*year, *month, *day);
}

std::optional<CalendarDate> CalendarDate::from_ymd(int year, int month, int day) {
    if (year < 1 || year > 9999) return std::nullopt;
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > days_in_month(year, month)) return std::nullopt;
    return CalendarDate(year, month, day);
}

std::optional<CalendarDate> CalendarDate::from_serial(int64_t serial) {
    // Serial 0 is 1899-12-30, which is 25569 days before the Unix epoch.
    constexpr int64_t unix_epoch_serial = 25569;
    if (serial < 1 || serial > 2958465) {
        return std::nullopt;
    }
    return civil_from_days(serial - unix_epoch_serial);
}

std::string CalendarDate::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year_ << '-'
        << std::setw(2) << month_ << '-' << std::setw(2) << day_;
    return oss.str();
}

std::optional<YearMonth> YearMonth::parse(std::string_view text) {
    if (text.size() != 7 || text[4] != '-') {
        return std::nullopt;
    }
    auto year = parse_digits(text.substr(0, 4));
    auto month = parse_digits(text.substr(5, 2));
    if (!year || !month || *year < 1 || *month < 1 || *month > 12) {
        return std::nullopt;
    }
    return YearMonth(*year, *month);
}

std::string YearMonth::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year_ << '-' << std::setw(2) << month_;
    return oss.str();
}

static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");
static_assert(std::is_trivially_copyable_v<CalendarDate>, "CalendarDate should be trivially copyable");

} // namespace tally
