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
 * @file log_record.hh
 */

#ifndef jlv_log_record_hh
#define jlv_log_record_hh

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "log_level.hh"
#include "log_schema.hh"
#include "log_timestamp.hh"
#include "result.h"
#include "yajlpp/json_value.hh"

namespace jlv {

/**
 * The parts of a JSON log record that are rendered, normalized across
 * schemas.
 */
struct log_record {
    std::optional<log_level_t> lr_level;
    /** Formatted for display, or the original text if it was not a time. */
    std::optional<std::string> lr_timestamp;
    std::optional<std::string> lr_logger;
    std::optional<std::string> lr_message;
    std::optional<std::string> lr_stack_trace;
    /** Members not claimed by one of the fields above, sorted by key. */
    std::map<std::string, json::value> lr_extras;
    json::value lr_raw;

    /**
     * Pull the record's fields out of a parsed JSON value using the given
     * mapping.  A value that is not an object becomes a record holding only
     * a message, the value in compact JSON form.
     *
     * @param tz The zone to display the timestamp in, it is resolved when
     *   the first parsable timestamp is seen.
     * @return The record, or an error if the zone cannot be resolved.
     */
    static Result<log_record, std::string> extract(json::value val,
                                                   const field_mapping& fm,
                                                   lazy_timezone& tz,
                                                   timestamp_style style);
};

/** @return The content of a string or the compact JSON form of anything else. */
std::string value_to_string(const json::value& val);

/**
 * @return The level named by a string or given as a bunyan-style integer.
 */
std::optional<log_level_t> value_to_level(const json::value& val);

}  // namespace jlv

#endif
