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
 * @file string_util.tests.cc
 */

#include "base/string_util.hh"

#include "config.h"
#include "doctest/doctest.h"

TEST_CASE("trim")
{
    CHECK(trim("  abc \t") == "abc");
    CHECK(trim("") == "");
    CHECK(trim("   ") == "");
    CHECK(trim(" caf\xc3\xa9\xc2\xa0 ") == "caf\xc3\xa9\xc2\xa0");
    CHECK(trim("\xe2\x82\xac") == "\xe2\x82\xac");
}

TEST_CASE("split_list")
{
    auto fields = split_list(" user_id, ,request_id ,");

    REQUIRE(fields.size() == 2);
    CHECK(fields[0] == "user_id");
    CHECK(fields[1] == "request_id");
    CHECK(split_list("").empty());
}

TEST_CASE("utf8_decode_next")
{
    std::string_view str = "a\xc3\xa9\xe2\x82\xac\xf0\x9f\x98\x80";
    size_t index = 0;

    CHECK(utf8_decode_next(str, index) == 'a');
    CHECK(utf8_decode_next(str, index) == 0xe9);
    CHECK(utf8_decode_next(str, index) == 0x20ac);
    CHECK(utf8_decode_next(str, index) == 0x1f600);
    CHECK(index == str.size());

    SUBCASE("overlong")
    {
        std::string_view bad = "\xc0\xaf";
        size_t bad_index = 0;

        CHECK_FALSE(utf8_decode_next(bad, bad_index).has_value());
        CHECK(bad_index == 1);
    }

    SUBCASE("surrogate")
    {
        std::string_view bad = "\xed\xa0\x80";
        size_t bad_index = 0;

        CHECK_FALSE(utf8_decode_next(bad, bad_index).has_value());
    }

    SUBCASE("truncated")
    {
        std::string_view bad = "\xe2\x82";
        size_t bad_index = 0;

        CHECK_FALSE(utf8_decode_next(bad, bad_index).has_value());
        CHECK(bad_index == 1);
    }
}

TEST_CASE("utf8_string_length")
{
    CHECK(utf8_string_length("") == 0);
    CHECK(utf8_string_length("abc") == 3);
    CHECK(utf8_string_length("\xc3\xa9t\xc3\xa9") == 3);
}

TEST_CASE("abbreviate_dotted")
{
    CHECK(abbreviate_dotted("com.example.service.MyHandler")
          == "c.e.s.MyHandler");
    CHECK(abbreviate_dotted("") == "");
    CHECK(abbreviate_dotted("MyHandler") == "MyHandler");
    CHECK(abbreviate_dotted("a..b") == "a..b");
    CHECK(abbreviate_dotted("\xc3\xa9tude.Handler") == "\xc3\xa9.Handler");
    CHECK(abbreviate_dotted("com.example.") == "c.e.");
}

TEST_CASE("truncate_dotted_left")
{
    CHECK(truncate_dotted_left("com.example.service.Handler", 0)
          == "com.example.service.Handler");
    CHECK(truncate_dotted_left("com.example.service.Handler", 15)
          == "service.Handler");
    CHECK(truncate_dotted_left("c.e.s.MyHandler", 15) == "c.e.s.MyHandler");
    CHECK(truncate_dotted_left("c.e.s.MyHandler", 13) == "e.s.MyHandler");
    CHECK(truncate_dotted_left("VeryLongName", 4) == "Name");
    CHECK(truncate_dotted_left("abc.defghijk", 3) == "ijk");
    CHECK(truncate_dotted_left("abcdef.", 3) == "ef.");
    CHECK(truncate_dotted_left("\xc3\xa9\xc3\xa9\xc3\xa9", 2)
          == "\xc3\xa9\xc3\xa9");
}
