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
 * @file log_timestamp.cc
 */

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "log_timestamp.hh"

#include <ctype.h>

#include "base/jlv_log.hh"
#include "base/string_util.hh"
#include "date/tz.h"
#include "fmt/format.h"

namespace jlv {

/* 0000-01-01T00:00:00Z and 9999-12-31T23:59:59Z */
static constexpr time64_t MIN_SECS = -62167219200LL;
static constexpr time64_t MAX_SECS = 253402300799LL;

static constexpr double MILLIS_THRESHOLD = 1e12;

namespace {

struct text_scanner {
    explicit text_scanner(std::string_view str) : ts_str(str) {}

    bool at_end() const { return this->ts_index >= this->ts_str.size(); }

    std::optional<char> peek() const
    {
        if (this->at_end()) {
            return std::nullopt;
        }
        return this->ts_str[this->ts_index];
    }

    bool consume(char ch)
    {
        if (this->peek() == ch) {
            this->ts_index += 1;
            return true;
        }
        return false;
    }

    std::optional<int> digits(size_t count)
    {
        int retval = 0;

        for (size_t lpc = 0; lpc < count; lpc++) {
            auto ch = this->peek();

            if (!ch || !isdigit((unsigned char) ch.value())) {
                return std::nullopt;
            }
            retval = retval * 10 + (ch.value() - '0');
            this->ts_index += 1;
        }

        return retval;
    }

    std::string_view ts_str;
    size_t ts_index{0};
};

}  // namespace

Result<timezone_ref, std::string>
timezone_ref::resolve(std::string_view name)
{
    auto lower = tolower(name);

    if (lower == "local") {
        return Ok(timezone_ref{kind_t::local, nullptr});
    }
    if (lower == "utc") {
        return Ok(timezone_ref{kind_t::utc, nullptr});
    }

    try {
        const auto* zone = date::locate_zone(std::string(name));

        return Ok(timezone_ref{kind_t::named, zone});
    } catch (const std::runtime_error& e) {
        log_debug("zone lookup failed: %s", e.what());
        return Err(fmt::format(FMT_STRING("unknown timezone: {}"), name));
    }
}

Result<const timezone_ref*, std::string>
lazy_timezone::get()
{
    if (!this->lt_zone) {
        this->lt_zone = TRY(timezone_ref::resolve(this->lt_name));
        log_info("displaying timestamps in zone: %s", this->lt_name.c_str());
    }

    return Ok(&this->lt_zone.value());
}

long
timezone_ref::offset_at(time64_t secs) const
{
    switch (this->tr_kind) {
        case kind_t::local:
            return local_gmtoff(secs);
        case kind_t::utc:
            return 0;
        case kind_t::named: {
            auto info = this->tr_zone->get_info(
                date::sys_seconds{std::chrono::seconds{secs}});

            return info.offset.count();
        }
    }

    return 0;
}

std::optional<log_instant>
parse_timestamp(const json::value& val)
{
    if (val.is_string()) {
        return parse_timestamp_text(val.as_text());
    }
    if (val.is_number()) {
        auto epoch = val.as_double();

        if (epoch) {
            return epoch_to_instant(epoch.value());
        }
    }

    return std::nullopt;
}

std::optional<log_instant>
parse_timestamp_text(std::string_view str)
{
    text_scanner sc(str);

    auto year = sc.digits(4);
    if (!year || !sc.consume('-')) {
        return std::nullopt;
    }
    auto month = sc.digits(2);
    if (!month || !sc.consume('-')) {
        return std::nullopt;
    }
    auto day = sc.digits(2);
    if (!day) {
        return std::nullopt;
    }
    auto sep = sc.peek();
    if (!sep || (sep != 'T' && sep != 't' && sep != ' ')) {
        return std::nullopt;
    }
    sc.ts_index += 1;
    auto hour = sc.digits(2);
    if (!hour || !sc.consume(':')) {
        return std::nullopt;
    }
    auto min = sc.digits(2);
    if (!min || !sc.consume(':')) {
        return std::nullopt;
    }
    auto sec = sc.digits(2);
    if (!sec) {
        return std::nullopt;
    }

    log_instant retval;
    if (sc.consume('.')) {
        size_t frac_digits = 0;
        uint32_t scale = 100000000;

        while (sc.peek() && isdigit((unsigned char) sc.peek().value())) {
            if (frac_digits < 9) {
                retval.li_nanos += (sc.peek().value() - '0') * scale;
                scale /= 10;
            }
            frac_digits += 1;
            sc.ts_index += 1;
        }
        if (frac_digits == 0) {
            return std::nullopt;
        }
    }

    long gmtoff = 0;
    if (sc.at_end()) {
        // no offset means UTC, but only with the ISO separators
        if (sep == 't') {
            return std::nullopt;
        }
    } else if (sc.peek() == 'Z' || sc.peek() == 'z') {
        sc.ts_index += 1;
    } else if (sc.peek() == '+' || sc.peek() == '-') {
        auto sign = sc.peek() == '-' ? -1 : 1;

        sc.ts_index += 1;
        auto off_hour = sc.digits(2);
        if (!off_hour || !sc.consume(':')) {
            return std::nullopt;
        }
        auto off_min = sc.digits(2);
        if (!off_min || off_hour.value() > 23 || off_min.value() > 59) {
            return std::nullopt;
        }
        gmtoff = sign * (off_hour.value() * 3600 + off_min.value() * 60);
    } else {
        return std::nullopt;
    }
    if (!sc.at_end()) {
        return std::nullopt;
    }

    auto secs = civil_to_secs(year.value(),
                              month.value(),
                              day.value(),
                              hour.value(),
                              min.value(),
                              sec.value());
    if (!secs) {
        return std::nullopt;
    }

    retval.li_secs = secs.value() - gmtoff;
    if (retval.li_secs < MIN_SECS || retval.li_secs > MAX_SECS) {
        return std::nullopt;
    }

    return retval;
}

std::optional<log_instant>
epoch_to_instant(double epoch)
{
    if (!std::isfinite(epoch)) {
        return std::nullopt;
    }

    log_instant retval;
    if (std::fabs(epoch) >= MILLIS_THRESHOLD) {
        if (epoch < MIN_SECS * 1000.0 || epoch >= (MAX_SECS + 1) * 1000.0) {
            return std::nullopt;
        }

        // fractions of a millisecond are truncated toward zero
        auto millis = static_cast<int64_t>(epoch);
        auto secs = millis / 1000;
        auto rem = millis % 1000;
        if (rem < 0) {
            rem += 1000;
            secs -= 1;
        }
        retval.li_secs = secs;
        retval.li_nanos = static_cast<uint32_t>(rem) * 1000000;
    } else {
        auto whole = std::floor(epoch);
        auto nanos = static_cast<uint32_t>((epoch - whole) * 1e9);

        retval.li_secs = static_cast<time64_t>(whole);
        retval.li_nanos = std::min(nanos, (uint32_t) 999999999);
    }

    if (retval.li_secs < MIN_SECS || retval.li_secs > MAX_SECS) {
        return std::nullopt;
    }

    return retval;
}

std::string
format_timestamp(const log_instant& inst,
                 const timezone_ref& tz,
                 timestamp_style style)
{
    char buffer[64];
    auto gmtoff = tz.offset_at(inst.li_secs);
    auto wall_secs = inst.li_secs + gmtoff;

    if (style == timestamp_style::time) {
        strftime_clock_millis(
            buffer, sizeof(buffer), wall_secs, inst.millis());
        return buffer;
    }

    strftime_rfc3339(buffer, sizeof(buffer), wall_secs, inst.millis(), 'T');

    std::string retval = buffer;
    if (tz.is_utc()) {
        retval.push_back('Z');
    } else {
        retval.append(format_utc_offset(gmtoff));
    }

    return retval;
}

Result<std::string, std::string>
format_timestamp(const log_instant& inst,
                 std::string_view tz_name,
                 timestamp_style style)
{
    auto tz = TRY(timezone_ref::resolve(tz_name));

    return Ok(format_timestamp(inst, tz, style));
}

}  // namespace jlv
