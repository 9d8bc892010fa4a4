#include "pch.h"

#include "Aera.Core/date_util.h"

#include <stdexcept>

TEST(TestCore_DateUtil, ParseIsoDate) {
    using namespace aera::core;
    using namespace std::chrono;

    auto date = parse_iso_date("2026-02-14");
    ASSERT_EQ(year{2026}, date.year());
    ASSERT_EQ(month{2}, date.month());
    ASSERT_EQ(day{14}, date.day());
    ASSERT_EQ("2026-02-14", to_iso_string(date));
}

TEST(TestCore_DateUtil, ParseInvalidDateThrows) {
    using namespace aera::core;

    ASSERT_THROW(parse_iso_date(""), std::invalid_argument);
    ASSERT_THROW(parse_iso_date("2026/02/14"), std::invalid_argument);
    ASSERT_THROW(parse_iso_date("2026-2-14"), std::invalid_argument);
    ASSERT_THROW(parse_iso_date("2026-02-30"), std::invalid_argument);
    ASSERT_THROW(parse_iso_date("20x6-02-14"), std::invalid_argument);
}

TEST(TestCore_DateUtil, AddDaysAcrossMonthAndYear) {
    using namespace aera::core;

    ASSERT_EQ("2026-01-15", to_iso_string(add_days(parse_iso_date("2026-02-14"), -30)));
    ASSERT_EQ("2024-02-29", to_iso_string(add_days(parse_iso_date("2024-03-30"), -30)));
    ASSERT_EQ("2025-12-02", to_iso_string(add_days(parse_iso_date("2026-01-01"), -30)));
}

TEST(TestCore_DateUtil, IsoTimestampUtcMilliseconds) {
    using namespace aera::core;
    using namespace std::chrono;

    auto time = sys_days{year{2026} / 2 / 14} + hours{3} + minutes{4} + seconds{5} +
                milliseconds{67};
    ASSERT_EQ("2026-02-14T03:04:05.067Z",
              to_iso_timestamp(time_point_cast<system_clock::duration>(time)));
}

TEST(TestCore_DateUtil, TodayIsValid) {
    using namespace aera::core;

    ASSERT_TRUE(today_utc().ok());
}
