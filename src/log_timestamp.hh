/**
 * Copyright (c) 2024, Timothy Stack
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
 * @file log_timestamp.hh
 */

#ifndef jlv_log_timestamp_hh
#define jlv_log_timestamp_hh

#include <optional>
#include <string>
#include <string_view>

#include <stdint.h>

#include "base/time_util.hh"
#include "result.h"
#include "yajlpp/json_value.hh"

namespace date {
class time_zone;
}

namespace jlv {

enum class timestamp_style {
    time,
    full,
};

/**
 * A point in time normalized to UTC.
 */
struct log_instant {
    time64_t li_secs{0};
    /** Always in the range [0, 1e9), even for instants before the epoch. */
    uint32_t li_nanos{0};

    int millis() const { return this->li_nanos / 1000000; }

    bool operator==(const log_instant& other) const
    {
        return this->li_secs == other.li_secs
            && this->li_nanos == other.li_nanos;
    }
};

/**
 * The zone that timestamps are displayed in: the host's zone, UTC, or a zone
 * from the IANA database.
 */
class timezone_ref {
public:
    /**
     * Resolve a zone name.  "local" and "utc" are matched without regard to
     * case, anything else is looked up in the zone database.
     *
     * @return The zone or an "unknown timezone" message.
     */
    static Result<timezone_ref, std::string> resolve(std::string_view name);

    bool is_utc() const { return this->tr_kind == kind_t::utc; }

    /** @return The zone's offset from UTC, in seconds, at the given time. */
    long offset_at(time64_t secs) const;

private:
    enum class kind_t {
        local,
        utc,
        named,
    };

    timezone_ref(kind_t kind, const date::time_zone* zone)
        : tr_kind(kind), tr_zone(zone)
    {
    }

    kind_t tr_kind;
    const date::time_zone* tr_zone;
};

/**
 * A zone name that is only looked up the first time it is needed, so a bad
 * name is not an error for input that has no timestamps.
 */
class lazy_timezone {
public:
    explicit lazy_timezone(std::string name) : lt_name(std::move(name)) {}

    /** @return The resolved zone, looking it up on the first call. */
    Result<const timezone_ref*, std::string> get();

    bool is_resolved() const { return this->lt_zone.has_value(); }

private:
    std::string lt_name;
    std::optional<timezone_ref> lt_zone;
};

/**
 * Interpret a JSON value as a timestamp.  Strings are parsed as RFC 3339
 * or as an ISO 8601 date and time without an offset, which is taken to be
 * UTC.  Numbers are epoch milliseconds when their magnitude is at least
 * 1e12 and epoch seconds otherwise.
 *
 * @return The instant or std::nullopt if the value is not a timestamp.
 */
std::optional<log_instant> parse_timestamp(const json::value& val);

std::optional<log_instant> parse_timestamp_text(std::string_view str);

std::optional<log_instant> epoch_to_instant(double epoch);

/**
 * Render an instant in the given zone, with millisecond precision.
 */
std::string format_timestamp(const log_instant& inst,
                             const timezone_ref& tz,
                             timestamp_style style);

Result<std::string, std::string> format_timestamp(const log_instant& inst,
                                                  std::string_view tz_name,
                                                  timestamp_style style);

}  // namespace jlv

#endif
