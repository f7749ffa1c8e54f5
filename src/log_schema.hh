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
 * @file log_schema.hh
 */

#ifndef jlv_log_schema_hh
#define jlv_log_schema_hh

#include <optional>
#include <string_view>
#include <vector>

#include "yajlpp/json_value.hh"

namespace jlv {

/**
 * The JSON logging conventions that are recognized.
 */
enum class log_schema_t {
    logstash,
    logrus,
    bunyan,
    generic,
};

enum class schema_choice {
    auto_detect,
    logstash,
    logrus,
    bunyan,
    generic,
};

const char* schema_name(log_schema_t schema);

/** @return The choice with the given lowercase name ("auto", "bunyan", ...) */
std::optional<schema_choice> schema_choice_from_name(std::string_view name);

/**
 * The JSON keys that hold each part of a record for a schema.  Every list is
 * ordered and the first key present in an object is used.
 */
struct field_mapping {
    std::vector<std::string_view> fm_level;
    std::vector<std::string_view> fm_timestamp;
    std::vector<std::string_view> fm_logger;
    std::vector<std::string_view> fm_message;
    std::vector<std::string_view> fm_stack_trace;

    /** @return The first candidate present in the object, if any. */
    static std::optional<std::string_view> find_key(
        const std::vector<std::string_view>& candidates,
        const json::value& obj);
};

const field_mapping& mapping_for(log_schema_t schema);

/**
 * A row of the detection table.  An object's score for the schema is the
 * number of signature keys present plus the bonus.
 */
struct schema_rule {
    log_schema_t sr_schema;
    std::vector<std::string_view> sr_signature;
    int (*sr_bonus)(const json::value& obj);

    int score(const json::value& obj) const;
};

/**
 * @return The detection table, ordered by the priority used to break ties.
 */
const std::vector<schema_rule>& schema_rules();

/**
 * Guess the schema of a record from its keys.  Non-objects and objects that
 * match no signature key are generic.  When schemas tie for the best score,
 * the one listed first in schema_rules() wins.
 */
log_schema_t detect_schema(const json::value& val);

log_schema_t schema_from_choice(schema_choice choice, const json::value& val);

}  // namespace jlv

#endif
