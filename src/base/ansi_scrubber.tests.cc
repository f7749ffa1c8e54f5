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
 * @file ansi_scrubber.tests.cc
 */

#include "base/ansi_scrubber.hh"

#include "config.h"
#include "doctest/doctest.h"

TEST_CASE("scrub_control_chars")
{
    CHECK(scrub_control_chars("hello\tworld\n") == "hello\tworld\n");
    CHECK(scrub_control_chars("\x1b[31mred\x1b[0m") == "[31mred[0m");
    CHECK(scrub_control_chars("a\rb\x07" "c\x7f") == "abc");
    CHECK(scrub_control_chars("x\xc2\x9by") == "xy");
    CHECK(scrub_control_chars("\xc3\xa9t\xc3\xa9") == "\xc3\xa9t\xc3\xa9");
}

TEST_CASE("scrub_control_chars-malformed")
{
    CHECK(scrub_control_chars("a\x9b[2Jb") == "a[2Jb");
    CHECK(scrub_control_chars("\xff\xfe") == "");
    CHECK(scrub_control_chars("\xe2\x82") == "");
}

TEST_CASE("scrub_control_chars-idempotent")
{
    const char* inputs[] = {
        "plain",
        "\x1b]0;title\x07rest",
        "tab\there\nnewline",
        "\xc2\x85next line",
        "\xf0\x9f\x98\x80 \xed\xa0\x80",
    };

    for (const auto* input : inputs) {
        auto once = scrub_control_chars(input);

        CHECK(scrub_control_chars(once) == once);
    }
}
