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
 * @file json_value.hh
 */

#ifndef jlv_json_value_hh
#define jlv_json_value_hh

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <stdint.h>

#include "result.h"
#include "yajlpp.hh"

namespace jlv::json {

enum class value_type {
    null_value,
    boolean,
    number,
    string,
    array,
    object,
};

/**
 * An immutable JSON document tree.  Object members are kept in document
 * order and numbers keep their original text so the value can be written
 * back out without loss.
 */
class value {
public:
    value() = default;

    static value from_bool(bool b);
    static value from_number(std::string text);
    static value from_string(std::string str);

    value_type type() const { return this->v_type; }

    bool is_null() const { return this->v_type == value_type::null_value; }
    bool is_bool() const { return this->v_type == value_type::boolean; }
    bool is_number() const { return this->v_type == value_type::number; }
    bool is_string() const { return this->v_type == value_type::string; }
    bool is_array() const { return this->v_type == value_type::array; }
    bool is_object() const { return this->v_type == value_type::object; }

    /**
     * @return The content of a string or the original text of a number.
     */
    const std::string& as_text() const { return this->v_text; }

    /**
     * @return The number as a 64-bit integer, if it was written as an integer
     * that fits.
     */
    std::optional<int64_t> as_int64() const;

    /** @return The number as a double, if this is a number. */
    std::optional<double> as_double() const;

    size_t size() const { return this->v_children.size(); }

    /** @return The keys of an object, in document order. */
    const std::vector<std::string>& keys() const { return this->v_keys; }

    /**
     * @return The elements of an array or the member values of an object,
     * parallel to keys().
     */
    const std::vector<value>& children() const { return this->v_children; }

    /** @return The member with the given key or nullptr. */
    const value* find(std::string_view key) const;

    yajl_gen_status gen(yajl_gen hand) const;

    /** @return The value in compact JSON form. */
    std::string to_json() const;

    bool operator==(const value& other) const;

    bool operator!=(const value& other) const { return !(*this == other); }

private:
    friend class value_builder;

    value_type v_type{value_type::null_value};
    bool v_bool{false};
    std::string v_text;
    std::vector<std::string> v_keys;
    std::vector<value> v_children;
};

/**
 * Parse text that must contain exactly one JSON value, optionally surrounded
 * by whitespace.
 *
 * @return The value or the parser's error message.
 */
Result<value, std::string> parse(std::string_view text);

}  // namespace jlv::json

#endif
