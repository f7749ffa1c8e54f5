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
 * @file time_util.hh
 */

#ifndef jlv_time_util_hh
#define jlv_time_util_hh

#include <optional>
#include <string>

#include <inttypes.h>
#include <sys/types.h>
#include <time.h>

namespace jlv {

/** Seconds since the epoch, signed so pre-1970 instants are representable. */
using time64_t = int64_t;

/**
 * Write the given time as "YYYY-MM-DD<sep>HH:MM:SS.mmm".  The time is
 * broken down as-is, so add the zone offset first to get a local wall clock.
 *
 * @return The number of characters written, not including the terminator.
 */
ssize_t strftime_rfc3339(
    char* buffer, size_t buffer_size, time64_t tim, int millis, char sep = 'T');

/**
 * Write only the clock part of the given time as "HH:MM:SS.mmm".
 */
ssize_t strftime_clock_millis(char* buffer,
                              size_t buffer_size,
                              time64_t tim,
                              int millis);

/** @return The offset formatted as "+HH:MM" or "-HH:MM". */
std::string format_utc_offset(long gmtoff);

/** @return The host's offset from UTC, in seconds, at the given instant. */
long local_gmtoff(time64_t tim);

/**
 * Convert a proleptic Gregorian calendar date and time of day into seconds
 * since the epoch.
 *
 * @return std::nullopt if the date or time fields are out of range.
 */
std::optional<time64_t> civil_to_secs(
    int year, unsigned month, unsigned day, int hour, int min, int sec);

}  // namespace jlv

struct tm* secs2tm(jlv::time64_t tim, struct tm* res);

#endif
