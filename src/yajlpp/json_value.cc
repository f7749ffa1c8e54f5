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
 * @file json_value.cc
 */

#include <errno.h>
#include <stdlib.h>

#include <unordered_map>

#include "json_value.hh"

#include "base/jlv_log.hh"

namespace jlv::json {

/* yajl's generator refuses to open a container at depth 128. */
static constexpr size_t MAX_DEPTH = 127;

value
value::from_bool(bool b)
{
    value retval;

    retval.v_type = value_type::boolean;
    retval.v_bool = b;
    return retval;
}

value
value::from_number(std::string text)
{
    value retval;

    retval.v_type = value_type::number;
    retval.v_text = std::move(text);
    return retval;
}

value
value::from_string(std::string str)
{
    value retval;

    retval.v_type = value_type::string;
    retval.v_text = std::move(str);
    return retval;
}

std::optional<int64_t>
value::as_int64() const
{
    if (this->v_type != value_type::number
        || this->v_text.find_first_of(".eE") != std::string::npos)
    {
        return std::nullopt;
    }

    char* end = nullptr;

    errno = 0;
    auto retval = strtoll(this->v_text.c_str(), &end, 10);
    if (errno == ERANGE || end == this->v_text.c_str() || *end != '\0') {
        return std::nullopt;
    }

    return static_cast<int64_t>(retval);
}

std::optional<double>
value::as_double() const
{
    if (this->v_type != value_type::number) {
        return std::nullopt;
    }

    char* end = nullptr;
    auto retval = strtod(this->v_text.c_str(), &end);
    if (end == this->v_text.c_str()) {
        return std::nullopt;
    }

    return retval;
}

const value*
value::find(std::string_view key) const
{
    for (size_t lpc = 0; lpc < this->v_keys.size(); lpc++) {
        if (this->v_keys[lpc] == key) {
            return &this->v_children[lpc];
        }
    }

    return nullptr;
}

yajl_gen_status
value::gen(yajl_gen hand) const
{
    switch (this->v_type) {
        case value_type::null_value:
            return yajl_gen_null(hand);
        case value_type::boolean:
            return yajl_gen_bool(hand, this->v_bool);
        case value_type::number:
            return yajl_gen_number(
                hand, this->v_text.c_str(), this->v_text.length());
        case value_type::string:
            return yajl_gen_string(hand, this->v_text);
        case value_type::array: {
            auto rc = yajl_gen_array_open(hand);
            if (rc != yajl_gen_status_ok) {
                return rc;
            }
            for (const auto& child : this->v_children) {
                rc = child.gen(hand);
                if (rc != yajl_gen_status_ok) {
                    return rc;
                }
            }
            return yajl_gen_array_close(hand);
        }
        case value_type::object: {
            auto rc = yajl_gen_map_open(hand);
            if (rc != yajl_gen_status_ok) {
                return rc;
            }
            for (size_t lpc = 0; lpc < this->v_keys.size(); lpc++) {
                rc = yajl_gen_string(hand, this->v_keys[lpc]);
                if (rc != yajl_gen_status_ok) {
                    return rc;
                }
                rc = this->v_children[lpc].gen(hand);
                if (rc != yajl_gen_status_ok) {
                    return rc;
                }
            }
            return yajl_gen_map_close(hand);
        }
    }

    return yajl_gen_status_ok;
}

std::string
value::to_json() const
{
    yajlpp_gen ygen;
    auto rc = this->gen(ygen);

    ensure(rc == yajl_gen_status_ok);

    return ygen.to_string();
}

bool
value::operator==(const value& other) const
{
    if (this->v_type != other.v_type) {
        return false;
    }

    switch (this->v_type) {
        case value_type::null_value:
            return true;
        case value_type::boolean:
            return this->v_bool == other.v_bool;
        case value_type::number:
            return this->v_text == other.v_text
                || this->as_double() == other.as_double();
        case value_type::string:
            return this->v_text == other.v_text;
        case value_type::array:
            return this->v_children == other.v_children;
        case value_type::object: {
            if (this->v_keys.size() != other.v_keys.size()) {
                return false;
            }
            for (size_t lpc = 0; lpc < this->v_keys.size(); lpc++) {
                const auto* other_child = other.find(this->v_keys[lpc]);

                if (other_child == nullptr
                    || *other_child != this->v_children[lpc])
                {
                    return false;
                }
            }
            return true;
        }
    }

    return false;
}

/**
 * Assembles a value from the yajl parser events.
 */
class value_builder {
public:
    static const yajl_callbacks CALLBACKS;

    int add(value&& val)
    {
        if (this->vb_stack.empty()) {
            this->vb_root = std::move(val);
            return 1;
        }

        auto& top = this->vb_stack.back();
        if (top.f_value.v_type == value_type::array) {
            top.f_value.v_children.emplace_back(std::move(val));
            return 1;
        }

        // a repeated key keeps its original position and takes the new value
        auto iter = top.f_key_index.find(top.f_key);
        if (iter != top.f_key_index.end()) {
            top.f_value.v_children[iter->second] = std::move(val);
        } else {
            top.f_key_index.emplace(top.f_key, top.f_value.v_keys.size());
            top.f_value.v_keys.emplace_back(std::move(top.f_key));
            top.f_value.v_children.emplace_back(std::move(val));
        }
        return 1;
    }

    int open(value_type type)
    {
        if (this->vb_stack.size() >= MAX_DEPTH) {
            this->vb_error = "recursion limit exceeded";
            return 0;
        }

        this->vb_stack.emplace_back();
        this->vb_stack.back().f_value.v_type = type;
        return 1;
    }

    int close()
    {
        auto val = std::move(this->vb_stack.back().f_value);

        this->vb_stack.pop_back();
        return this->add(std::move(val));
    }

    struct frame {
        value f_value;
        std::string f_key;
        std::unordered_map<std::string, size_t> f_key_index;
    };

    std::vector<frame> vb_stack;
    std::optional<value> vb_root;
    std::string vb_error;

private:
    static value_builder& from(void* ctx)
    {
        return *static_cast<value_builder*>(ctx);
    }

    static int handle_null(void* ctx) { return from(ctx).add(value{}); }

    static int handle_boolean(void* ctx, int b)
    {
        return from(ctx).add(value::from_bool(b));
    }

    static int handle_number(void* ctx, const char* num, size_t len)
    {
        return from(ctx).add(value::from_number(std::string(num, len)));
    }

    static int handle_string(void* ctx, const unsigned char* str, size_t len)
    {
        return from(ctx).add(
            value::from_string(std::string((const char*) str, len)));
    }

    static int handle_start_map(void* ctx)
    {
        return from(ctx).open(value_type::object);
    }

    static int handle_map_key(void* ctx, const unsigned char* key, size_t len)
    {
        from(ctx).vb_stack.back().f_key.assign((const char*) key, len);
        return 1;
    }

    static int handle_start_array(void* ctx)
    {
        return from(ctx).open(value_type::array);
    }

    static int handle_end(void* ctx) { return from(ctx).close(); }
};

const yajl_callbacks value_builder::CALLBACKS = {
    value_builder::handle_null,
    value_builder::handle_boolean,
    nullptr,
    nullptr,
    value_builder::handle_number,
    value_builder::handle_string,
    value_builder::handle_start_map,
    value_builder::handle_map_key,
    value_builder::handle_end,
    value_builder::handle_start_array,
    value_builder::handle_end,
};

Result<value, std::string>
parse(std::string_view text)
{
    value_builder vb;
    auto handle = yajlpp::alloc_handle(&value_builder::CALLBACKS, &vb);

    auto status = yajl_parse(
        handle.in(), (const unsigned char*) text.data(), text.length());
    if (status == yajl_status_ok) {
        status = yajl_complete_parse(handle.in());
    }
    if (status != yajl_status_ok) {
        if (!vb.vb_error.empty()) {
            return Err(vb.vb_error);
        }
        return Err(yajlpp::get_error(handle.in(), status));
    }
    if (!vb.vb_root) {
        return Err(std::string("no JSON value found"));
    }

    return Ok(std::move(vb.vb_root.value()));
}

}  // namespace jlv::json
