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
 * @file log_schema.cc
 */

#include <algorithm>

#include "log_schema.hh"

namespace jlv {

const char*
schema_name(log_schema_t schema)
{
    switch (schema) {
        case log_schema_t::logstash:
            return "logstash";
        case log_schema_t::logrus:
            return "logrus";
        case log_schema_t::bunyan:
            return "bunyan";
        case log_schema_t::generic:
            return "generic";
    }

    return "generic";
}

std::optional<schema_choice>
schema_choice_from_name(std::string_view name)
{
    if (name == "auto") {
        return schema_choice::auto_detect;
    }
    if (name == "logstash") {
        return schema_choice::logstash;
    }
    if (name == "logrus") {
        return schema_choice::logrus;
    }
    if (name == "bunyan") {
        return schema_choice::bunyan;
    }
    if (name == "generic") {
        return schema_choice::generic;
    }

    return std::nullopt;
}

std::optional<std::string_view>
field_mapping::find_key(const std::vector<std::string_view>& candidates,
                        const json::value& obj)
{
    for (const auto& key : candidates) {
        if (obj.find(key) != nullptr) {
            return key;
        }
    }

    return std::nullopt;
}

const field_mapping&
mapping_for(log_schema_t schema)
{
    static const field_mapping LOGSTASH_MAPPING = {
        {"level"},
        {"@timestamp"},
        {"logger_name"},
        {"message"},
        {"stack_trace"},
    };
    static const field_mapping LOGRUS_MAPPING = {
        {"level"},
        {"time"},
        {"component"},
        {"msg"},
        {"stack_trace", "stacktrace"},
    };
    static const field_mapping BUNYAN_MAPPING = {
        {"level"},
        {"time"},
        {"name"},
        {"msg"},
        {"stack"},
    };
    static const field_mapping GENERIC_MAPPING = {
        {"level", "severity", "loglevel", "log_level", "lvl"},
        {"timestamp", "@timestamp", "time", "ts", "datetime", "date"},
        {"logger", "logger_name", "name", "component", "source", "caller"},
        {"message", "msg", "text", "body", "log"},
        {"stack_trace", "stacktrace", "stack", "exception", "traceback"},
    };

    switch (schema) {
        case log_schema_t::logstash:
            return LOGSTASH_MAPPING;
        case log_schema_t::logrus:
            return LOGRUS_MAPPING;
        case log_schema_t::bunyan:
            return BUNYAN_MAPPING;
        case log_schema_t::generic:
            break;
    }

    return GENERIC_MAPPING;
}

int
schema_rule::score(const json::value& obj) const
{
    int retval = std::count_if(
        this->sr_signature.begin(),
        this->sr_signature.end(),
        [&obj](const auto& key) { return obj.find(key) != nullptr; });

    if (this->sr_bonus != nullptr) {
        retval += this->sr_bonus(obj);
    }

    return retval;
}

static int
logstash_bonus(const json::value& obj)
{
    return obj.find("@timestamp") != nullptr ? 2 : 0;
}

static int
bunyan_bonus(const json::value& obj)
{
    const auto* level = obj.find("level");

    if (obj.find("v") != nullptr && level != nullptr && level->is_number()) {
        return 3;
    }

    return 0;
}

const std::vector<schema_rule>&
schema_rules()
{
    static const std::vector<schema_rule> RETVAL = {
        {
            log_schema_t::logstash,
            {
                "@timestamp",
                "level",
                "logger_name",
                "message",
                "stack_trace",
                "thread_name",
                "@version",
            },
            logstash_bonus,
        },
        {
            log_schema_t::bunyan,
            {"v", "level", "name", "hostname", "pid", "time", "msg"},
            bunyan_bonus,
        },
        {
            log_schema_t::logrus,
            {"level", "msg", "time", "component"},
            nullptr,
        },
    };

    return RETVAL;
}

log_schema_t
detect_schema(const json::value& val)
{
    if (!val.is_object()) {
        return log_schema_t::generic;
    }

    const auto& rules = schema_rules();
    std::vector<int> scores;
    int max_score = 0;

    for (const auto& rule : rules) {
        scores.emplace_back(rule.score(val));
        max_score = std::max(max_score, scores.back());
    }

    if (max_score == 0) {
        return log_schema_t::generic;
    }

    for (size_t lpc = 0; lpc < rules.size(); lpc++) {
        if (scores[lpc] == max_score) {
            return rules[lpc].sr_schema;
        }
    }

    return log_schema_t::generic;
}

log_schema_t
schema_from_choice(schema_choice choice, const json::value& val)
{
    switch (choice) {
        case schema_choice::auto_detect:
            return detect_schema(val);
        case schema_choice::logstash:
            return log_schema_t::logstash;
        case schema_choice::logrus:
            return log_schema_t::logrus;
        case schema_choice::bunyan:
            return log_schema_t::bunyan;
        case schema_choice::generic:
            break;
    }

    return log_schema_t::generic;
}

}  // namespace jlv
