// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_COMPILER_CRON_H
#define SCVERIFY_COMPILER_CRON_H

/**
 * @file cron.h
 * @brief Cron schedules for version list refreshes
 */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace scverify {

/** Hourly, on the hour */
static const char* const DEFAULT_REFRESH_SCHEDULE = "0 0 * * * * *";

/**
 * A cron schedule with a seconds field:
 *
 *     sec min hour day-of-month month day-of-week [year]
 *
 * Every field accepts '*', numbers, ranges "a-b", lists "a,b" and steps
 * "x/n". Months and weekdays also accept three letter names. Weekdays run
 * 1-7 starting with Sunday = 1. A day must match both the day-of-month and
 * the day-of-week field. Times are evaluated in UTC.
 */
class CronSchedule
{
public:
    typedef std::chrono::system_clock::time_point time_point;

    /**
     * Parse an expression.
     * @param[out] strError reason for a failure, if non-null
     */
    static std::optional<CronSchedule> Parse(const std::string& expr, std::string* strError = nullptr);

    /** First matching instant strictly after t, or std::nullopt if there is none */
    std::optional<time_point> Next(time_point t) const;

    const std::string& ToString() const { return expr_; }

private:
    struct Field
    {
        int min;
        int max;
        std::vector<bool> allowed;

        Field() : min(0), max(0) {}
        bool Matches(int v) const { return v >= min && v <= max && allowed[v - min]; }
    };

    CronSchedule() {}

    static bool ParseField(const std::string& str, int min, int max, const char* const* names, int nameBase,
                           Field& field, std::string& strError);

    bool DayMatches(int mday, int wday) const;

    std::string expr_;
    Field seconds_;
    Field minutes_;
    Field hours_;
    Field days_;
    Field months_;
    Field weekdays_;
    Field years_;
};

} // namespace scverify

#endif // SCVERIFY_COMPILER_CRON_H
