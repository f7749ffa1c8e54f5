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
 * @file log_record.cc
 */

#include <array>

#include "log_record.hh"

namespace jlv {

std::string
value_to_string(const json::value& val)
{
    if (val.is_string()) {
        return val.as_text();
    }

    return val.to_json();
}

std::optional<log_level_t>
value_to_level(const json::value& val)
{
    if (val.is_string()) {
        return string2level(val.as_text());
    }
    if (val.is_number()) {
        auto num = val.as_int64();

        if (num) {
            return number2level(num.value());
        }
    }

    return std::nullopt;
}

Result<log_record, std::string>
log_record::extract(json::value val,
                    const field_mapping& fm,
                    lazy_timezone& tz,
                    timestamp_style style)
{
    log_record retval;

    if (!val.is_object()) {
        retval.lr_message = val.to_json();
        retval.lr_raw = std::move(val);
        return Ok(std::move(retval));
    }

    auto level_key = field_mapping::find_key(fm.fm_level, val);
    auto ts_key = field_mapping::find_key(fm.fm_timestamp, val);
    auto logger_key = field_mapping::find_key(fm.fm_logger, val);
    auto message_key = field_mapping::find_key(fm.fm_message, val);
    auto stack_key = field_mapping::find_key(fm.fm_stack_trace, val);

    if (level_key) {
        retval.lr_level = value_to_level(*val.find(level_key.value()));
    }
    if (ts_key) {
        const auto& ts_val = *val.find(ts_key.value());
        auto inst = parse_timestamp(ts_val);

        if (inst) {
            const auto* zone = TRY(tz.get());

            retval.lr_timestamp = format_timestamp(inst.value(), *zone, style);
        } else {
            retval.lr_timestamp = value_to_string(ts_val);
        }
    }
    if (logger_key) {
        retval.lr_logger = value_to_string(*val.find(logger_key.value()));
    }
    if (message_key) {
        retval.lr_message = value_to_string(*val.find(message_key.value()));
    }
    if (stack_key) {
        retval.lr_stack_trace = value_to_string(*val.find(stack_key.value()));
    }

    const std::array<std::optional<std::string_view>, 5> consumed = {
        level_key,
        ts_key,
        logger_key,
        message_key,
        stack_key,
    };
    const auto& keys = val.keys();
    for (size_t lpc = 0; lpc < keys.size(); lpc++) {
        auto is_consumed = false;

        for (const auto& ckey : consumed) {
            if (ckey && ckey.value() == keys[lpc]) {
                is_consumed = true;
                break;
            }
        }
        if (!is_consumed) {
            retval.lr_extras.emplace(keys[lpc], val.children()[lpc]);
        }
    }

    retval.lr_raw = std::move(val);

    return Ok(std::move(retval));
}

}  // namespace jlv
