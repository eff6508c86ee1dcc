// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/cron.h>

#include <util.h>
#include <utilstrencodings.h>

#include <time.h>

namespace scverify {

namespace {

const int MIN_YEAR = 1970;
const int MAX_YEAR = 2199;

const char* const MONTH_NAMES[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                   "jul", "aug", "sep", "oct", "nov", "dec", nullptr};
const char* const WEEKDAY_NAMES[] = {"sun", "mon", "tue", "wed", "thu", "fri", "sat", nullptr};

bool ParseValue(const std::string& strIn, const char* const* names, int nameBase, int& out)
{
    std::string str = ToLower(strIn);
    if (names) {
        for (int i = 0; names[i]; ++i) {
            if (str == names[i]) {
                out = nameBase + i;
                return true;
            }
        }
    }
    int64_t n;
    if (!ParseInt64(str, &n) || n < 0 || n > 100000) {
        return false;
    }
    out = (int)n;
    return true;
}

time_t MakeTime(int year, int mon, int mday, int hour, int min, int sec)
{
    struct tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = mday;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    return timegm(&tm);
}

} // anonymous namespace

bool CronSchedule::ParseField(const std::string& str, int min, int max, const char* const* names, int nameBase,
                              Field& field, std::string& strError)
{
    field.min = min;
    field.max = max;
    field.allowed.assign(max - min + 1, false);

    for (const std::string& part : SplitString(str, ',')) {
        std::string range = part;
        int step = 1;
        std::string::size_type slash = part.find('/');
        if (slash != std::string::npos) {
            range = part.substr(0, slash);
            int64_t n;
            if (!ParseInt64(part.substr(slash + 1), &n) || n <= 0 || n > max) {
                strError = strprintf("invalid step in '%s'", part);
                return false;
            }
            step = (int)n;
        }

        int lo, hi;
        if (range == "*" || range == "?") {
            lo = min;
            hi = max;
        } else {
            std::string::size_type dash = range.find('-');
            if (dash == std::string::npos) {
                if (!ParseValue(range, names, nameBase, lo)) {
                    strError = strprintf("invalid value '%s'", range);
                    return false;
                }
                // "5/15" means every 15 starting at 5
                hi = (slash != std::string::npos) ? max : lo;
            } else if (!ParseValue(range.substr(0, dash), names, nameBase, lo) ||
                       !ParseValue(range.substr(dash + 1), names, nameBase, hi)) {
                strError = strprintf("invalid range '%s'", range);
                return false;
            }
        }
        if (lo < min || hi > max || lo > hi) {
            strError = strprintf("'%s' is out of range %d-%d", part, min, max);
            return false;
        }
        for (int v = lo; v <= hi; v += step) {
            field.allowed[v - min] = true;
        }
    }
    return true;
}

std::optional<CronSchedule> CronSchedule::Parse(const std::string& expr, std::string* strErrorOut)
{
    std::string strError;
    std::vector<std::string> fields;
    for (const std::string& f : SplitString(TrimString(expr), ' ')) {
        if (!f.empty()) fields.push_back(f);
    }

    CronSchedule schedule;
    schedule.expr_ = expr;
    bool ok = false;
    if (fields.size() != 6 && fields.size() != 7) {
        strError = strprintf("expected 6 or 7 fields, got %u", fields.size());
    } else {
        ok = ParseField(fields[0], 0, 59, nullptr, 0, schedule.seconds_, strError) &&
             ParseField(fields[1], 0, 59, nullptr, 0, schedule.minutes_, strError) &&
             ParseField(fields[2], 0, 23, nullptr, 0, schedule.hours_, strError) &&
             ParseField(fields[3], 1, 31, nullptr, 0, schedule.days_, strError) &&
             ParseField(fields[4], 1, 12, MONTH_NAMES, 1, schedule.months_, strError) &&
             ParseField(fields[5], 1, 7, WEEKDAY_NAMES, 1, schedule.weekdays_, strError) &&
             ParseField(fields.size() == 7 ? fields[6] : "*", MIN_YEAR, MAX_YEAR, nullptr, 0, schedule.years_, strError);
    }
    if (!ok) {
        if (strErrorOut) *strErrorOut = strprintf("invalid schedule '%s': %s", expr, strError);
        return std::nullopt;
    }
    return schedule;
}

bool CronSchedule::DayMatches(int mday, int wday) const
{
    // tm_wday counts from Sunday = 0; weekday fields count from Sunday = 1
    return days_.Matches(mday) && weekdays_.Matches(wday + 1);
}

std::optional<CronSchedule::time_point> CronSchedule::Next(time_point t) const
{
    time_t cur = std::chrono::system_clock::to_time_t(t);
    // to_time_t may round up; start from the next whole second after t
    if (std::chrono::system_clock::from_time_t(cur) > t) {
        cur -= 1;
    }
    cur += 1;

    while (true) {
        struct tm tm;
        if (!gmtime_r(&cur, &tm)) {
            return std::nullopt;
        }
        int year = tm.tm_year + 1900;
        int mon = tm.tm_mon + 1;
        if (year > MAX_YEAR) {
            return std::nullopt;
        }
        if (!years_.Matches(year)) {
            cur = MakeTime(year + 1, 1, 1, 0, 0, 0);
            continue;
        }
        if (!months_.Matches(mon)) {
            cur = (mon == 12) ? MakeTime(year + 1, 1, 1, 0, 0, 0) : MakeTime(year, mon + 1, 1, 0, 0, 0);
            continue;
        }
        if (!DayMatches(tm.tm_mday, tm.tm_wday)) {
            // timegm normalizes day overflow into the next month
            cur = MakeTime(year, mon, tm.tm_mday + 1, 0, 0, 0);
            continue;
        }
        if (!hours_.Matches(tm.tm_hour)) {
            cur = MakeTime(year, mon, tm.tm_mday, tm.tm_hour + 1, 0, 0);
            continue;
        }
        if (!minutes_.Matches(tm.tm_min)) {
            cur = MakeTime(year, mon, tm.tm_mday, tm.tm_hour, tm.tm_min + 1, 0);
            continue;
        }
        if (!seconds_.Matches(tm.tm_sec)) {
            cur += 1;
            continue;
        }
        return std::chrono::system_clock::from_time_t(cur);
    }
}

} // namespace scverify
