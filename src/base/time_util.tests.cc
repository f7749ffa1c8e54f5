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
 * @file time_util.tests.cc
 */

#include "base/time_util.hh"

#include "config.h"
#include "doctest/doctest.h"

TEST_CASE("strftime_rfc3339")
{
    char buffer[64];

    CHECK(jlv::strftime_rfc3339(buffer, sizeof(buffer), 0, 0) == 23);
    CHECK(std::string(buffer) == "1970-01-01T00:00:00.000");

    jlv::strftime_rfc3339(buffer, sizeof(buffer), -1, 999, ' ');
    CHECK(std::string(buffer) == "1969-12-31 23:59:59.999");

    jlv::strftime_rfc3339(buffer, sizeof(buffer), 253402300799LL, 7);
    CHECK(std::string(buffer) == "9999-12-31T23:59:59.007");

    CHECK(jlv::strftime_rfc3339(buffer, 10, 0, 0) == -1);

    CHECK(jlv::strftime_rfc3339(buffer, sizeof(buffer), -62167237200LL, 0)
          == 24);
    CHECK(std::string(buffer) == "-0001-12-31T19:00:00.000");

    jlv::strftime_rfc3339(buffer, sizeof(buffer), 253402318799LL, 0);
    CHECK(std::string(buffer) == "+10000-01-01T04:59:59.000");

    CHECK(jlv::strftime_rfc3339(buffer, 24, -62167237200LL, 0) == -1);
}

TEST_CASE("strftime_clock_millis")
{
    char buffer[16];

    jlv::strftime_clock_millis(buffer, sizeof(buffer), 1705314600, 42);
    CHECK(std::string(buffer) == "10:30:00.042");
}

TEST_CASE("format_utc_offset")
{
    CHECK(jlv::format_utc_offset(0) == "+00:00");
    CHECK(jlv::format_utc_offset(-18000) == "-05:00");
    CHECK(jlv::format_utc_offset(19800) == "+05:30");
}

TEST_CASE("civil_to_secs")
{
    CHECK(jlv::civil_to_secs(2024, 1, 15, 10, 30, 0) == 1705314600);
    CHECK(jlv::civil_to_secs(1970, 1, 1, 0, 0, 0) == 0);
    CHECK(jlv::civil_to_secs(0, 1, 1, 0, 0, 0) == -62167219200LL);
    CHECK(jlv::civil_to_secs(2024, 2, 29, 0, 0, 0).has_value());
    CHECK_FALSE(jlv::civil_to_secs(2023, 2, 29, 0, 0, 0).has_value());
    CHECK_FALSE(jlv::civil_to_secs(2024, 1, 15, 24, 0, 0).has_value());
}

TEST_CASE("secs2tm")
{
    struct tm tm;

    secs2tm(-86400, &tm);
    CHECK(tm.tm_year == 69);
    CHECK(tm.tm_mon == 11);
    CHECK(tm.tm_mday == 31);
    CHECK(tm.tm_wday == 3);
}
