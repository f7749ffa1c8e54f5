/**
 * Copyright (c) 2020, Timothy Stack
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
 * @file log_level.cc
 */

#include "log_level.hh"

#include "base/string_util.hh"

const std::array<const char*, LEVEL__MAX> level_names = {
    "TRACE",
    "DEBUG",
    "INFO",
    "WARN",
    "ERROR",
    "FATAL",
};

std::optional<log_level_t>
string2level(std::string_view levelstr)
{
    auto upper = toupper(levelstr);

    if (upper == "TRACE") {
        return LEVEL_TRACE;
    }
    if (upper == "DEBUG") {
        return LEVEL_DEBUG;
    }
    if (upper == "INFO") {
        return LEVEL_INFO;
    }
    if (upper == "WARN" || upper == "WARNING") {
        return LEVEL_WARNING;
    }
    if (upper == "ERROR") {
        return LEVEL_ERROR;
    }
    if (upper == "FATAL" || upper == "CRITICAL" || upper == "PANIC") {
        return LEVEL_FATAL;
    }

    return std::nullopt;
}

std::optional<log_level_t>
number2level(int64_t num)
{
    switch (num) {
        case 10:
            return LEVEL_TRACE;
        case 20:
            return LEVEL_DEBUG;
        case 30:
            return LEVEL_INFO;
        case 40:
            return LEVEL_WARNING;
        case 50:
            return LEVEL_ERROR;
        case 60:
            return LEVEL_FATAL;
        default:
            return std::nullopt;
    }
}
