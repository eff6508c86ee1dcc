// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/cron.h>

#include <boost/test/unit_test.hpp>

#include <time.h>

using scverify::CronSchedule;

namespace {

CronSchedule::time_point At(int year, int mon, int mday, int hour, int min, int sec)
{
    struct tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = mday;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

CronSchedule Parse(const std::string& expr)
{
    std::optional<CronSchedule> schedule = CronSchedule::Parse(expr);
    BOOST_REQUIRE_MESSAGE(schedule, expr);
    return *schedule;
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(cron_tests)

BOOST_AUTO_TEST_CASE(default_schedule_is_hourly)
{
    CronSchedule schedule = Parse(scverify::DEFAULT_REFRESH_SCHEDULE);
    BOOST_CHECK(*schedule.Next(At(2024, 3, 1, 10, 15, 30)) == At(2024, 3, 1, 11, 0, 0));
    // strictly after: a tick exactly on the hour moves to the next hour
    BOOST_CHECK(*schedule.Next(At(2024, 3, 1, 11, 0, 0)) == At(2024, 3, 1, 12, 0, 0));
    // across a day and year boundary
    BOOST_CHECK(*schedule.Next(At(2023, 12, 31, 23, 59, 59)) == At(2024, 1, 1, 0, 0, 0));
}

BOOST_AUTO_TEST_CASE(steps_ranges_lists)
{
    CronSchedule every15 = Parse("*/15 * * * * *");
    BOOST_CHECK(*every15.Next(At(2024, 3, 1, 10, 15, 1)) == At(2024, 3, 1, 10, 15, 15));
    BOOST_CHECK(*every15.Next(At(2024, 3, 1, 10, 15, 45)) == At(2024, 3, 1, 10, 16, 0));

    CronSchedule office = Parse("0 30 9-17 * * mon-fri");
    // Saturday 2024-03-02 -> Monday 2024-03-04 09:30
    BOOST_CHECK(*office.Next(At(2024, 3, 2, 12, 0, 0)) == At(2024, 3, 4, 9, 30, 0));
    BOOST_CHECK(*office.Next(At(2024, 3, 4, 17, 30, 0)) == At(2024, 3, 5, 9, 30, 0));

    CronSchedule list = Parse("0 0 6,18 * * *");
    BOOST_CHECK(*list.Next(At(2024, 3, 1, 7, 0, 0)) == At(2024, 3, 1, 18, 0, 0));
}

BOOST_AUTO_TEST_CASE(month_and_day_names)
{
    CronSchedule schedule = Parse("0 0 0 1 JAN,jul *");
    BOOST_CHECK(*schedule.Next(At(2024, 2, 10, 0, 0, 0)) == At(2024, 7, 1, 0, 0, 0));
    BOOST_CHECK(*schedule.Next(At(2024, 7, 1, 0, 0, 0)) == At(2025, 1, 1, 0, 0, 0));

    CronSchedule sunday = Parse("0 0 12 * * sun");
    BOOST_CHECK(*sunday.Next(At(2024, 3, 1, 0, 0, 0)) == At(2024, 3, 3, 12, 0, 0));
}

BOOST_AUTO_TEST_CASE(weekdays_count_from_sunday)
{
    // 2024-01-01 is a Monday
    CronSchedule one = Parse("0 0 0 * * 1");
    BOOST_CHECK(*one.Next(At(2024, 1, 1, 0, 0, 0)) == At(2024, 1, 7, 0, 0, 0));
    CronSchedule seven = Parse("0 0 0 * * 7");
    BOOST_CHECK(*seven.Next(At(2024, 1, 1, 0, 0, 0)) == At(2024, 1, 6, 0, 0, 0));
    CronSchedule two = Parse("0 0 0 * * 2");
    BOOST_CHECK(*two.Next(At(2024, 1, 1, 0, 0, 0)) == At(2024, 1, 8, 0, 0, 0));

    BOOST_CHECK(!CronSchedule::Parse("0 0 0 * * 0"));
    BOOST_CHECK(!CronSchedule::Parse("0 0 0 * * 8"));
}

BOOST_AUTO_TEST_CASE(day_fields_must_both_match)
{
    // a Monday that is also the 15th
    CronSchedule schedule = Parse("0 0 0 15 * Mon");
    BOOST_CHECK(*schedule.Next(At(2024, 1, 1, 0, 0, 0)) == At(2024, 1, 15, 0, 0, 0));
    BOOST_CHECK(*schedule.Next(At(2024, 1, 15, 0, 0, 0)) == At(2024, 4, 15, 0, 0, 0));
    // Friday the 13th; 2024-03-01 is a Friday but not the 13th
    CronSchedule friday13 = Parse("0 0 0 13 * fri");
    BOOST_CHECK(*friday13.Next(At(2024, 2, 29, 1, 0, 0)) == At(2024, 9, 13, 0, 0, 0));
}

BOOST_AUTO_TEST_CASE(year_field)
{
    CronSchedule schedule = Parse("0 0 0 1 1 * 2030");
    BOOST_CHECK(*schedule.Next(At(2024, 1, 1, 0, 0, 0)) == At(2030, 1, 1, 0, 0, 0));
    BOOST_CHECK(!schedule.Next(At(2030, 1, 1, 0, 0, 0)));
}

BOOST_AUTO_TEST_CASE(leap_day)
{
    CronSchedule schedule = Parse("0 0 0 29 2 *");
    BOOST_CHECK(*schedule.Next(At(2025, 1, 1, 0, 0, 0)) == At(2028, 2, 29, 0, 0, 0));
}

BOOST_AUTO_TEST_CASE(reject_invalid)
{
    std::string strError;
    BOOST_CHECK(!CronSchedule::Parse("0 0 * * *", &strError));
    BOOST_CHECK(strError.find("6 or 7 fields") != std::string::npos);
    BOOST_CHECK(!CronSchedule::Parse("60 0 * * * *"));
    BOOST_CHECK(!CronSchedule::Parse("0 0 25 * * *"));
    BOOST_CHECK(!CronSchedule::Parse("0 0 * 0 * *"));
    BOOST_CHECK(!CronSchedule::Parse("0 0 * * foo *"));
    BOOST_CHECK(!CronSchedule::Parse("*/0 * * * * *"));
    BOOST_CHECK(!CronSchedule::Parse("5-1 * * * * *"));
    BOOST_CHECK(!CronSchedule::Parse("0 0 * * * * 1969"));
}

BOOST_AUTO_TEST_SUITE_END()
