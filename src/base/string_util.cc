/**
 * Copyright (c) 2018, Timothy Stack
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
 * @file string_util.cc
 */

#include <algorithm>

#include "string_util.hh"

#include <ctype.h>

std::string
trim(std::string_view str)
{
    std::string_view::size_type start, end;

    for (start = 0;
         start < str.size() && isspace((unsigned char) str[start]);
         start++)
    {
    }
    for (end = str.size();
         end > start && isspace((unsigned char) str[end - 1]);
         end--)
    {
    }

    return std::string(str.substr(start, end - start));
}

std::string
tolower(std::string_view str)
{
    std::string retval;

    for (const auto ch : str) {
        retval.push_back(::tolower((unsigned char) ch));
    }

    return retval;
}

std::string
toupper(std::string_view str)
{
    std::string retval;

    for (const auto ch : str) {
        retval.push_back(::toupper((unsigned char) ch));
    }

    return retval;
}

std::vector<std::string>
split_list(std::string_view str, char sep)
{
    std::vector<std::string> retval;

    while (true) {
        auto pos = str.find(sep);
        auto entry = trim(str.substr(0, pos));

        if (!entry.empty()) {
            retval.emplace_back(std::move(entry));
        }
        if (pos == std::string_view::npos) {
            break;
        }
        str.remove_prefix(pos + 1);
    }

    return retval;
}

/*
  Well-Formed UTF-8 Byte Sequences, from "Unicode Encoding Forms", 3.9 of the
  Unicode Standard.

  |  Code Points        | First Byte | Second Byte | Third Byte | Fourth Byte |
  |  U+0000..U+007F     |     00..7F |             |            |             |
  |  U+0080..U+07FF     |     C2..DF |      80..BF |            |             |
  |  U+0800..U+0FFF     |         E0 |      A0..BF |     80..BF |             |
  |  U+1000..U+CFFF     |     E1..EC |      80..BF |     80..BF |             |
  |  U+D000..U+D7FF     |         ED |      80..9F |     80..BF |             |
  |  U+E000..U+FFFF     |     EE..EF |      80..BF |     80..BF |             |
  |  U+10000..U+3FFFF   |         F0 |      90..BF |     80..BF |      80..BF |
  |  U+40000..U+FFFFF   |     F1..F3 |      80..BF |     80..BF |      80..BF |
  |  U+100000..U+10FFFF |         F4 |      80..8F |     80..BF |      80..BF |
*/
std::optional<uint32_t>
utf8_decode_next(std::string_view str, size_t& index)
{
    const auto* ustr = reinterpret_cast<const unsigned char*>(str.data());
    auto lead = ustr[index];
    size_t length;
    unsigned char second_min = 0x80, second_max = 0xBF;
    uint32_t retval;

    if (lead <= 0x7F) {
        index += 1;
        return lead;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        retval = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        retval = lead & 0x0F;
        if (lead == 0xE0) {
            second_min = 0xA0;
        } else if (lead == 0xED) {
            second_max = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        retval = lead & 0x07;
        if (lead == 0xF0) {
            second_min = 0x90;
        } else if (lead == 0xF4) {
            second_max = 0x8F;
        }
    } else {
        index += 1;
        return std::nullopt;
    }

    if (index + length > str.size()) {
        index += 1;
        return std::nullopt;
    }
    for (size_t lpc = 1; lpc < length; lpc++) {
        auto min = lpc == 1 ? second_min : 0x80;
        auto max = lpc == 1 ? second_max : 0xBF;
        auto ch = ustr[index + lpc];

        if (ch < min || ch > max) {
            index += 1;
            return std::nullopt;
        }
        retval = (retval << 6) | (ch & 0x3F);
    }

    index += length;
    return retval;
}

size_t
utf8_string_length(std::string_view str)
{
    size_t retval = 0;

    for (size_t index = 0; index < str.size();) {
        utf8_decode_next(str, index);
        retval += 1;
    }

    return retval;
}

std::string
utf8_suffix(std::string_view str, size_t max_chars)
{
    auto char_count = utf8_string_length(str);

    if (char_count <= max_chars) {
        return std::string(str);
    }

    size_t index = 0;
    for (size_t skip = char_count - max_chars; skip > 0; skip--) {
        utf8_decode_next(str, index);
    }

    return std::string(str.substr(index));
}

std::string
abbreviate_dotted(std::string_view str)
{
    auto last_dot = str.rfind('.');

    if (last_dot == std::string_view::npos) {
        return std::string(str);
    }

    std::string retval;
    size_t start = 0;

    while (start <= last_dot) {
        auto end = str.find('.', start);

        if (end > start) {
            auto index = start;

            utf8_decode_next(str, index);
            retval.append(str.substr(start, index - start));
        }
        retval.push_back('.');
        start = end + 1;
    }
    retval.append(str.substr(last_dot + 1));

    return retval;
}

std::string
truncate_dotted_left(std::string_view str, size_t max_chars)
{
    if (max_chars == 0 || utf8_string_length(str) <= max_chars) {
        return std::string(str);
    }

    auto remaining = str;
    while (utf8_string_length(remaining) > max_chars) {
        auto dot_pos = remaining.find('.');

        if (dot_pos == std::string_view::npos
            || dot_pos + 1 == remaining.size())
        {
            break;
        }
        remaining.remove_prefix(dot_pos + 1);
    }

    return utf8_suffix(remaining, max_chars);
}
