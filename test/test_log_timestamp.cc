/**
 * Copyright (c) 2014, Timothy Stack
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
 * @file test_log_timestamp.cc
 */

#include "config.h"
#include "doctest/doctest.h"
#include "log_timestamp.hh"
#include "yajlpp/json_value.hh"

using namespace jlv;

static std::string
fmt_utc(const json::value& val, timestamp_style style = timestamp_style::full)
{
    auto inst = parse_timestamp(val);

    REQUIRE(inst.has_value());
    return format_timestamp(inst.value(), "utc", style).unwrap();
}

TEST_CASE("parse_timestamp-rfc3339")
{
    CHECK(fmt_utc(json::value::from_string("2024-01-15T10:30:00Z"))
          == "2024-01-15T10:30:00.000Z");
    CHECK(fmt_utc(json::value::from_string("2024-01-15T10:30:00.123456Z"))
          == "2024-01-15T10:30:00.123Z");
    CHECK(fmt_utc(json::value::from_string("2024-01-15T10:30:00+02:00"))
          == "2024-01-15T08:30:00.000Z");
    CHECK(fmt_utc(json::value::from_string("2024-01-15T10:30:00.999-05:30"))
          == "2024-01-15T16:00:00.999Z");
    CHECK(fmt_utc(json::value::from_string("2024-01-15 10:30:00"))
          == "2024-01-15T10:30:00.000Z");
}

TEST_CASE("parse_timestamp-fraction-truncated")
{
    auto inst = parse_timestamp_text("2024-01-15T10:30:00.1234567891234Z");

    REQUIRE(inst.has_value());
    CHECK(inst->li_nanos == 123456789);
    CHECK(inst->millis() == 123);
}

TEST_CASE("parse_timestamp-invalid")
{
    CHECK_FALSE(parse_timestamp_text("not a time").has_value());
    CHECK_FALSE(parse_timestamp_text("2024-13-15T10:30:00Z").has_value());
    CHECK_FALSE(parse_timestamp_text("2024-02-30T10:30:00Z").has_value());
    CHECK_FALSE(parse_timestamp_text("2024-01-15t10:30:00").has_value());
    CHECK_FALSE(parse_timestamp_text("2024-1-15T10:30:00Z").has_value());
    CHECK_FALSE(parse_timestamp(json::value::from_bool(true)).has_value());
    CHECK_FALSE(parse_timestamp(json::value()).has_value());
}

TEST_CASE("parse_timestamp-epoch")
{
    CHECK(fmt_utc(json::value::from_number("1705314600123"))
          == "2024-01-15T10:30:00.123Z");
    CHECK(fmt_utc(json::value::from_number("1705314600"))
          == "2024-01-15T10:30:00.000Z");
    CHECK(fmt_utc(json::value::from_number("1705314600.5"))
          == "2024-01-15T10:30:00.500Z");
    CHECK(fmt_utc(json::value::from_number("-1"))
          == "1969-12-31T23:59:59.000Z");
}

TEST_CASE("epoch_to_instant-negative")
{
    auto secs = epoch_to_instant(-1.5);

    REQUIRE(secs.has_value());
    CHECK(secs->li_secs == -2);
    CHECK(secs->li_nanos == 500000000);

    auto millis = epoch_to_instant(-1705314600123.0);

    REQUIRE(millis.has_value());
    CHECK(millis->li_secs == -1705314601);
    CHECK(millis->li_nanos == 877000000);

    const double epochs[] = {
        -0.000001, -1e12, -999999.999, 0.9999999999, 1e12 + 1, -86400.25,
    };
    for (auto epoch : epochs) {
        auto inst = epoch_to_instant(epoch);

        REQUIRE(inst.has_value());
        CHECK(inst->li_nanos < 1000000000);
    }
}

TEST_CASE("format_timestamp-styles")
{
    auto inst = parse_timestamp_text("2024-01-15T10:30:00.042Z").value();

    CHECK(format_timestamp(inst, "UTC", timestamp_style::time).unwrap()
          == "10:30:00.042");
    CHECK(format_timestamp(inst, "utc", timestamp_style::full).unwrap()
          == "2024-01-15T10:30:00.042Z");
}

TEST_CASE("format_timestamp-named-zone")
{
    auto inst = parse_timestamp_text("2024-01-15T10:30:00Z").value();

    CHECK(format_timestamp(inst, "America/New_York", timestamp_style::full)
              .unwrap()
          == "2024-01-15T05:30:00.000-05:00");
    CHECK(format_timestamp(inst, "Asia/Kolkata", timestamp_style::time)
              .unwrap()
          == "16:00:00.000");
}

TEST_CASE("format_timestamp-unknown-zone")
{
    auto inst = parse_timestamp_text("2024-01-15T10:30:00Z").value();
    auto res = format_timestamp(inst, "Mars/Olympus", timestamp_style::full);

    REQUIRE(res.isErr());
    CHECK(res.unwrapErr() == "unknown timezone: Mars/Olympus");
}

TEST_CASE("format_timestamp-expanded-year")
{
    auto inst = parse_timestamp_text("0000-01-01T00:00:00Z").value();

    CHECK(format_timestamp(inst, "Etc/GMT+5", timestamp_style::full).unwrap()
          == "-0001-12-31T19:00:00.000-05:00");
    CHECK(format_timestamp(inst, "utc", timestamp_style::full).unwrap()
          == "0000-01-01T00:00:00.000Z");
}

TEST_CASE("timezone_ref::resolve")
{
    CHECK(timezone_ref::resolve("UTC").unwrap().is_utc());
    CHECK(timezone_ref::resolve("Local").isOk());
    CHECK_FALSE(timezone_ref::resolve("local").unwrap().is_utc());
    CHECK(timezone_ref::resolve("Europe/Paris").unwrap().offset_at(1705314600)
          == 3600);
}
