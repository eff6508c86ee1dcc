// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_UTILTIME_H
#define SCVERIFY_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTimeMicros() and GetTimeMillis() both return the system time, but in
 * different units. GetTime() returns the system time in seconds, but also
 * supports mocktime, where the time can be specified by the user, eg for
 * testing (eg with the setmocktime rpc, or -mocktime argument).
 */
int64_t GetTime();
int64_t GetTimeMillis();
int64_t GetTimeMicros();
void SetMockTime(int64_t nMockTimeIn);
void MilliSleep(int64_t n);

/** ISO 8601 date and time in UTC, e.g. 2026-10-18T09:00:00Z */
std::string FormatISO8601DateTime(int64_t nTime);
/** ISO 8601 date in UTC, e.g. 2026-10-18 */
std::string FormatISO8601Date(int64_t nTime);

#endif // SCVERIFY_UTILTIME_H
