#include <catch2/catch_test_macros.hpp>
#include "core/types.hpp"

#include <set>

using namespace tally;

TEST_CASE("generate_id produces distinct version 4 ids", "[types]") {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = generate_id();
        REQUIRE(id.size() == 36);
        REQUIRE(id[8] == '-');
        REQUIRE(id[13] == '-');
        REQUIRE(id[14] == '4');
        REQUIRE(id[18] == '-');
        REQUIRE(id[23] == '-');
        ids.insert(id);
    }
    REQUIRE(ids.size() == 100);
}

TEST_CASE("Timestamp", "[types]") {
    SECTION("Default is the epoch") {
        Timestamp ts;
        REQUIRE(ts.is_epoch());
        REQUIRE(ts.millis() == 0);
    }

    SECTION("Ordering follows millis") {
        REQUIRE(Timestamp(1000) < Timestamp(2000));
        REQUIRE(Timestamp(1000) + std::chrono::milliseconds(500) == Timestamp(1500));
        REQUIRE((Timestamp(2000) - Timestamp(500)).count() == 1500);
    }

    SECTION("ISO rendering is UTC with milliseconds") {
        REQUIRE(Timestamp(0).to_iso_string() == "1970-01-01T00:00:00.000Z");
        REQUIRE(Timestamp(1709285400123).to_iso_string() == "2024-03-01T09:30:00.123Z");
    }

    SECTION("now() is after 2020") {
        REQUIRE(Timestamp::now().millis() > 1577836800000);
    }
}

TEST_CASE("CalendarDate parsing", "[types]") {
    SECTION("Valid dates round-trip") {
        auto date = CalendarDate::parse("2024-02-29");
        REQUIRE(date.has_value());
        REQUIRE(date->year() == 2024);
        REQUIRE(date->month() == 2);
        REQUIRE(date->day() == 29);
        REQUIRE(date->to_string() == "2024-02-29");
    }

    SECTION("Impossible dates are rejected") {
        REQUIRE_FALSE(CalendarDate::parse("2023-02-29").has_value());
        REQUIRE_FALSE(CalendarDate::parse("2024-02-30").has_value());
        REQUIRE_FALSE(CalendarDate::parse("2024-13-01").has_value());
        REQUIRE_FALSE(CalendarDate::parse("2024-04-31").has_value());
        REQUIRE_FALSE(CalendarDate::parse("2024-00-10").has_value());
    }

    SECTION("Malformed text is rejected") {
        REQUIRE_FALSE(CalendarDate::parse("").has_value());
        REQUIRE_FALSE(CalendarDate::parse("2024/01/01").has_value());
        REQUIRE_FALSE(CalendarDate::parse("2024-1-01").has_value());
        REQUIRE_FALSE(CalendarDate::parse("24-01-2024").has_value());
        REQUIRE_FALSE(CalendarDate::parse("2024-01-0a").has_value());
        REQUIRE_FALSE(CalendarDate::parse("2024-+1-01").has_value());
    }

    SECTION("Default-constructed date is invalid") {
        REQUIRE_FALSE(CalendarDate{}.is_valid());
    }

    SECTION("Dates order chronologically") {
        REQUIRE(*CalendarDate::parse("2023-12-31") < *CalendarDate::parse("2024-01-01"));
        REQUIRE(*CalendarDate::parse("2024-01-02") > *CalendarDate::parse("2024-01-01"));
    }
}

TEST_CASE("CalendarDate from spreadsheet serials", "[types]") {
    REQUIRE(CalendarDate::from_serial(45292)->to_string() == "2024-01-01");
    REQUIRE(CalendarDate::from_serial(25569)->to_string() == "1970-01-01");
    REQUIRE(CalendarDate::from_serial(45351)->to_string() == "2024-02-29");
    REQUIRE_FALSE(CalendarDate::from_serial(0).has_value());
    REQUIRE_FALSE(CalendarDate::from_serial(-5).has_value());
}

TEST_CASE("YearMonth parsing", "[types]") {
    auto month = YearMonth::parse("2024-03");
    REQUIRE(month.has_value());
    REQUIRE(month->year() == 2024);
    REQUIRE(month->month() == 3);
    REQUIRE(month->to_string() == "2024-03");

    REQUIRE_FALSE(YearMonth::parse("2024-13").has_value());
    REQUIRE_FALSE(YearMonth::parse("2024-00").has_value());
    REQUIRE_FALSE(YearMonth::parse("2024-3").has_value());
    REQUIRE_FALSE(YearMonth::parse("2024-03-01").has_value());
    REQUIRE(*YearMonth::parse("2023-12") < *YearMonth::parse("2024-01"));
}

TEST_CASE("Calendar helpers", "[types]") {
    REQUIRE(is_leap_year(2024));
    REQUIRE(is_leap_year(2000));
    REQUIRE_FALSE(is_leap_year(1900));
    REQUIRE_FALSE(is_leap_year(2023));
    REQUIRE(days_in_month(2024, 2) == 29);
    REQUIRE(days_in_month(2023, 2) == 28);
    REQUIRE(days_in_month(2024, 11) == 30);
    REQUIRE(days_in_month(2024, 13) == 0);
}
