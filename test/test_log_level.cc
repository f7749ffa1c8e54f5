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
 * @file test_log_level.cc
 */

#include "config.h"
#include "doctest/doctest.h"
#include "log_level.hh"
#include "log_record.hh"
#include "yajlpp/json_value.hh"

TEST_CASE("string2level")
{
    CHECK(string2level("info") == LEVEL_INFO);
    CHECK(string2level("Warning") == LEVEL_WARNING);
    CHECK(string2level("WARN") == LEVEL_WARNING);
    CHECK(string2level("critical") == LEVEL_FATAL);
    CHECK(string2level("PANIC") == LEVEL_FATAL);
    CHECK_FALSE(string2level("verbose").has_value());
    CHECK_FALSE(string2level("").has_value());
}

TEST_CASE("number2level")
{
    CHECK(number2level(10) == LEVEL_TRACE);
    CHECK(number2level(60) == LEVEL_FATAL);
    CHECK_FALSE(number2level(35).has_value());
    CHECK_FALSE(number2level(0).has_value());
}

TEST_CASE("level ordering")
{
    CHECK(LEVEL_TRACE < LEVEL_DEBUG);
    CHECK(LEVEL_WARNING < LEVEL_ERROR);
    CHECK(LEVEL_ERROR < LEVEL_FATAL);
    CHECK(std::string(level_names[LEVEL_WARNING]) == "WARN");
}

TEST_CASE("value_to_level")
{
    using jlv::json::value;

    CHECK(jlv::value_to_level(value::from_string("error")) == LEVEL_ERROR);
    CHECK(jlv::value_to_level(value::from_number("20")) == LEVEL_DEBUG);
    CHECK_FALSE(jlv::value_to_level(value::from_number("20.0")).has_value());
    CHECK_FALSE(jlv::value_to_level(value::from_bool(true)).has_value());
}
