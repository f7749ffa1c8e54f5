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
 * @file string_util.hh
 */

#ifndef jlv_string_util_hh
#define jlv_string_util_hh

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <stdint.h>
#include <string.h>

inline bool
is_line_ending(char ch)
{
    return ch == '\r' || ch == '\n';
}

inline bool
startswith(std::string_view str, std::string_view prefix)
{
    return str.substr(0, prefix.size()) == prefix;
}

std::string trim(std::string_view str);

std::string tolower(std::string_view str);

std::string toupper(std::string_view str);

/**
 * Split a comma-separated list, trimming the entries and dropping any that
 * end up empty.
 */
std::vector<std::string> split_list(std::string_view str, char sep = ',');

/**
 * Decode the UTF-8 sequence that starts at the given index.
 *
 * @param str The string to decode.
 * @param index The offset of the sequence's first byte.  On return, it is
 *   advanced past the sequence, or by a single byte if the sequence is not
 *   well-formed.
 * @return The code point or std::nullopt for a malformed sequence.
 */
std::optional<uint32_t> utf8_decode_next(std::string_view str, size_t& index);

/** @return The number of code points in a well-formed UTF-8 string. */
size_t utf8_string_length(std::string_view str);

/** @return The last max_chars code points of the string. */
std::string utf8_suffix(std::string_view str, size_t max_chars);

/**
 * Shorten a dotted name by keeping only the first character of every segment
 * except the last, so "com.example.Handler" becomes "c.e.Handler".
 */
std::string abbreviate_dotted(std::string_view str);

/**
 * Fit a dotted name into max_chars code points by dropping whole segments
 * from the left, then cutting characters from the left if that is not
 * enough.  A max_chars of zero means unlimited.
 */
std::string truncate_dotted_left(std::string_view str, size_t max_chars);

#endif
