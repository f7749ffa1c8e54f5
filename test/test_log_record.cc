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
 * @file test_log_record.cc
 */

#include "config.h"
#include "doctest/doctest.h"
#include "log_record.hh"
#include "yajlpp/json_value.hh"

using namespace jlv;

static log_record
extract(const char* json, log_schema_t schema)
{
    lazy_timezone tz("utc");
    auto res = log_record::extract(json::parse(json).unwrap(),
                                   mapping_for(schema),
                                   tz,
                                   timestamp_style::full);

    REQUIRE(res.isOk());
    return res.unwrap();
}

TEST_CASE("log_record::extract-logstash")
{
    auto lr = extract(
        R"({"@timestamp":"2024-01-15T10:30:00Z","level":"WARN",)"
        R"("logger_name":"com.example.App","message":"disk low",)"
        R"("stack_trace":"at a\nat b","thread_name":"main","@version":"1"})",
        log_schema_t::logstash);

    CHECK(lr.lr_level == LEVEL_WARNING);
    CHECK(lr.lr_timestamp == "2024-01-15T10:30:00.000Z");
    CHECK(lr.lr_logger == "com.example.App");
    CHECK(lr.lr_message == "disk low");
    CHECK(lr.lr_stack_trace == "at a\nat b");
    REQUIRE(lr.lr_extras.size() == 2);
    CHECK(lr.lr_extras.begin()->first == "@version");
    CHECK(lr.lr_extras.rbegin()->first == "thread_name");
}

TEST_CASE("log_record::extract-bunyan")
{
    auto lr = extract(R"({"v":0,"level":50,"name":"api","hostname":"h",)"
                      R"("pid":12,"time":1705314600123,"msg":"boom"})",
                      log_schema_t::bunyan);

    CHECK(lr.lr_level == LEVEL_ERROR);
    CHECK(lr.lr_timestamp == "2024-01-15T10:30:00.123Z");
    CHECK(lr.lr_logger == "api");
    CHECK(lr.lr_message == "boom");
    CHECK(lr.lr_extras.count("pid") == 1);
    CHECK(lr.lr_extras.count("v") == 1);
    CHECK(lr.lr_extras.count("name") == 0);
}

TEST_CASE("log_record::extract-logrus-stacktrace-alias")
{
    auto lr = extract(R"({"level":"error","msg":"x","stacktrace":"trace"})",
                      log_schema_t::logrus);

    CHECK(lr.lr_stack_trace == "trace");
    CHECK(lr.lr_extras.empty());
}

TEST_CASE("log_record::extract-generic-first-match")
{
    auto lr = extract(R"({"msg":"second","message":"first","lvl":"debug",)"
                      R"("ts":"yesterday"})",
                      log_schema_t::generic);

    CHECK(lr.lr_message == "first");
    CHECK(lr.lr_level == LEVEL_DEBUG);
    CHECK(lr.lr_timestamp == "yesterday");
    REQUIRE(lr.lr_extras.size() == 1);
    CHECK(lr.lr_extras.begin()->first == "msg");
}

TEST_CASE("log_record::extract-unmapped-values")
{
    auto lr = extract(R"({"level":"verbose","message":{"a":1},"n":null})",
                      log_schema_t::generic);

    CHECK_FALSE(lr.lr_level.has_value());
    CHECK(lr.lr_message == R"({"a":1})");
    CHECK(value_to_string(lr.lr_extras.at("n")) == "null");

    auto float_level = extract(R"({"level":30.5})", log_schema_t::bunyan);
    CHECK_FALSE(float_level.lr_level.has_value());
}

TEST_CASE("log_record::extract-non-object")
{
    auto lr = extract("[1,\"two\"]", log_schema_t::generic);

    CHECK(lr.lr_message == R"([1,"two"])");
    CHECK_FALSE(lr.lr_level.has_value());
    CHECK(lr.lr_extras.empty());
    CHECK(lr.lr_raw.is_array());
}

TEST_CASE("log_record::extract-bad-timezone")
{
    lazy_timezone tz("Nowhere/Special");
    auto no_ts = json::parse(R"({"msg":"no time"})").unwrap();
    CHECK(log_record::extract(no_ts,
                              mapping_for(log_schema_t::logrus),
                              tz,
                              timestamp_style::full)
              .isOk());

    auto val = json::parse(R"({"time":"2024-01-15T10:30:00Z"})").unwrap();
    auto res = log_record::extract(val,
                                   mapping_for(log_schema_t::logrus),
                                   tz,
                                   timestamp_style::full);

    REQUIRE(res.isErr());
    CHECK(res.unwrapErr() == "unknown timezone: Nowhere/Special");
}

TEST_CASE("log_record::extract-zone-resolved-once")
{
    lazy_timezone tz("Etc/GMT+5");
    auto no_ts = json::parse(R"({"msg":"no time"})").unwrap();

    REQUIRE(log_record::extract(no_ts,
                                mapping_for(log_schema_t::logrus),
                                tz,
                                timestamp_style::full)
                .isOk());
    CHECK_FALSE(tz.is_resolved());

    auto first = json::parse(R"({"time":"2024-01-15T10:30:00Z"})").unwrap();
    auto lr = log_record::extract(first,
                                  mapping_for(log_schema_t::logrus),
                                  tz,
                                  timestamp_style::full)
                  .unwrap();
    CHECK(tz.is_resolved());
    CHECK(lr.lr_timestamp == "2024-01-15T05:30:00.000-05:00");

    auto zone = tz.get();
    REQUIRE(zone.isOk());
    auto* zone_ptr = zone.unwrap();
    CHECK(tz.get().unwrap() == zone_ptr);
}

TEST_CASE("log_record::extract-never-duplicates-canonical-keys")
{
    const char* inputs[] = {
        R"({"@timestamp":"2024-01-15T10:30:00Z","level":"INFO",)"
        R"("logger_name":"l","message":"m","stack_trace":"s","x":1})",
        R"({"level":"info","time":"t","component":"c","msg":"m",)"
        R"("stack_trace":"s","stacktrace":"t","x":1})",
        R"({"level":30,"time":1,"name":"n","msg":"m","stack":"s","x":1})",
        R"({"severity":"info","date":"d","caller":"c","body":"b",)"
        R"("traceback":"t","x":1})",
    };
    const log_schema_t schemas[] = {
        log_schema_t::logstash,
        log_schema_t::logrus,
        log_schema_t::bunyan,
        log_schema_t::generic,
    };

    for (auto schema : schemas) {
        const auto& fm = mapping_for(schema);

        for (const auto* input : inputs) {
            auto val = json::parse(input).unwrap();
            auto lr = extract(input, schema);
            const std::vector<std::string_view>* roles[] = {
                &fm.fm_level,
                &fm.fm_timestamp,
                &fm.fm_logger,
                &fm.fm_message,
                &fm.fm_stack_trace,
            };

            for (const auto* role : roles) {
                auto key = field_mapping::find_key(*role, val);

                if (key) {
                    CHECK(lr.lr_extras.count(std::string(key.value())) == 0);
                }
            }
        }
    }
}
