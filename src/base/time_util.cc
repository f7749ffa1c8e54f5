/**
 * Copyright (c) 2017, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file time_util.cc
 */

#include <stdlib.h>

#include "time_util.hh"

#include "date/date.h"
#include "fmt/format.h"

namespace jlv {

ssize_t
strftime_rfc3339(
    char* buffer, size_t buffer_size, time64_t tim, int millis, char sep)
{
    struct tm gmtm;
    int year, month, index = 0;

    if (buffer_size < 24) {
        return -1;
    }

    secs2tm(tim, &gmtm);
    year = gmtm.tm_year + 1900;
    month = gmtm.tm_mon + 1;
    if (0 <= year && year <= 9999) {
        buffer[index++] = '0' + ((year / 1000) % 10);
        buffer[index++] = '0' + ((year / 100) % 10);
        buffer[index++] = '0' + ((year / 10) % 10);
        buffer[index++] = '0' + ((year / 1) % 10);
    } else {
        /* ISO 8601 expanded year, e.g. -0001 or +10000 */
        auto year_res = fmt::format_to_n(
            buffer, buffer_size, FMT_STRING("{:+05}"), year);
        if (year_res.size + 20 > buffer_size) {
            return -1;
        }
        index = year_res.size;
    }
    buffer[index++] = '-';
    buffer[index++] = '0' + ((month / 10) % 10);
    buffer[index++] = '0' + ((month / 1) % 10);
    buffer[index++] = '-';
    buffer[index++] = '0' + ((gmtm.tm_mday / 10) % 10);
    buffer[index++] = '0' + ((gmtm.tm_mday / 1) % 10);
    buffer[index++] = sep;
    index += strftime_clock_millis(
        &buffer[index], buffer_size - index, tim, millis);

    return index;
}

ssize_t
strftime_clock_millis(char* buffer,
                      size_t buffer_size,
                      time64_t tim,
                      int millis)
{
    struct tm gmtm;
    int index = 0;

    if (buffer_size < 13) {
        return -1;
    }

    secs2tm(tim, &gmtm);
    buffer[index++] = '0' + ((gmtm.tm_hour / 10) % 10);
    buffer[index++] = '0' + ((gmtm.tm_hour / 1) % 10);
    buffer[index++] = ':';
    buffer[index++] = '0' + ((gmtm.tm_min / 10) % 10);
    buffer[index++] = '0' + ((gmtm.tm_min / 1) % 10);
    buffer[index++] = ':';
    buffer[index++] = '0' + ((gmtm.tm_sec / 10) % 10);
    buffer[index++] = '0' + ((gmtm.tm_sec / 1) % 10);
    buffer[index++] = '.';
    buffer[index++] = '0' + ((millis / 100) % 10);
    buffer[index++] = '0' + ((millis / 10) % 10);
    buffer[index++] = '0' + ((millis / 1) % 10);
    buffer[index] = '\0';

    return index;
}

std::string
format_utc_offset(long gmtoff)
{
    auto mins = labs(gmtoff) / 60;

    return fmt::format(FMT_STRING("{}{:02}:{:02}"),
                       gmtoff < 0 ? '-' : '+',
                       mins / 60,
                       mins % 60);
}

long
local_gmtoff(time64_t tim)
{
    auto tt = static_cast<time_t>(tim);
    struct tm localtm;

    if (localtime_r(&tt, &localtm) == nullptr) {
        return 0;
    }

    return localtm.tm_gmtoff;
}

std::optional<time64_t>
civil_to_secs(
    int year, unsigned month, unsigned day, int hour, int min, int sec)
{
    auto ymd = date::year{year} / date::month{month} / date::day{day};

    if (!ymd.ok() || hour < 0 || hour > 23 || min < 0 || min > 59 || sec < 0
        || sec > 60)
    {
        return std::nullopt;
    }

    auto days = date::sys_days{ymd}.time_since_epoch().count();

    return static_cast<time64_t>(days) * 86400 + hour * 3600 + min * 60 + sec;
}

}  // namespace jlv

static const int SECSPERMIN = 60;
static const int SECSPERHOUR = 60 * SECSPERMIN;
static const int SECSPERDAY = 24 * SECSPERHOUR;
static const int YEAR_BASE = 1900;
static const int EPOCH_WDAY = 4;
static const int DAYSPERWEEK = 7;
static const int EPOCH_YEAR = 1970;

#define isleap(y) ((((y) % 4) == 0 && ((y) % 100) != 0) || ((y) % 400) == 0)

static const int year_lengths[2] = {365, 366};

static const unsigned short int mon_yday[2][13] = {
    /* Normal years.  */
    {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334, 365},
    /* Leap years.  */
    {0, 31, 60, 91, 121, 152, 182, 213, 244, 274, 305, 335, 366},
};

struct tm*
secs2tm(jlv::time64_t tim, struct tm* res)
{
    int yleap;
    const unsigned short int* ip;

    int64_t days = tim / SECSPERDAY;
    int64_t rem = tim % SECSPERDAY;
    while (rem < 0) {
        rem += SECSPERDAY;
        --days;
    }

    /* compute hour, min, and sec */
    res->tm_hour = (int) (rem / SECSPERHOUR);
    rem %= SECSPERHOUR;
    res->tm_min = (int) (rem / SECSPERMIN);
    res->tm_sec = (int) (rem % SECSPERMIN);

    /* compute day of week */
    if ((res->tm_wday = ((EPOCH_WDAY + days) % DAYSPERWEEK)) < 0) {
        res->tm_wday += DAYSPERWEEK;
    }

    /* compute year & day of year */
    int y = EPOCH_YEAR;
    if (days >= 0) {
        for (;;) {
            yleap = isleap(y);
            if (days < year_lengths[yleap]) {
                break;
            }
            y++;
            days -= year_lengths[yleap];
        }
    } else {
        do {
            --y;
            yleap = isleap(y);
            days += year_lengths[yleap];
        } while (days < 0);
    }

    res->tm_year = y - YEAR_BASE;
    res->tm_yday = days;
    ip = mon_yday[isleap(y)];
    for (y = 11; days < (int64_t) ip[y]; --y) {
        continue;
    }
    days -= ip[y];
    res->tm_mon = y;
    res->tm_mday = days + 1;

    res->tm_isdst = 0;

    return (res);
}
