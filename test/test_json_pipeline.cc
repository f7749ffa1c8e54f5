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
 * @file test_json_pipeline.cc
 */

#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

#include "config.h"
#include "doctest/doctest.h"
#include "json_pipeline.hh"
#include "yajlpp/json_value.hh"

using namespace jlv;

namespace {

/** Collects the lines written to it. */
class vector_sink : public line_sink {
public:
    Result<void, pipeline_error> write_line(std::string_view line) override
    {
        this->vs_lines.emplace_back(line);
        return Ok();
    }

    std::vector<std::string> vs_lines;
};

/** Produces lines from memory. */
class vector_source : public line_source {
public:
    explicit vector_source(std::vector<std::string> lines)
        : vs_lines(std::move(lines))
    {
    }

    Result<std::optional<std::string>, std::string> next_line() override
    {
        if (this->vs_index >= this->vs_lines.size()) {
            return Ok(std::optional<std::string>());
        }

        return Ok(std::make_optional(this->vs_lines[this->vs_index++]));
    }

    const std::string& get_name() const override { return this->vs_name; }

private:
    std::vector<std::string> vs_lines;
    size_t vs_index{0};
    std::string vs_name{"<memory>"};
};

/** Reports a closed pipe for every write. */
class closed_sink : public line_sink {
public:
    Result<void, pipeline_error> write_line(std::string_view line) override
    {
        return Err(pipeline_error::broken_pipe());
    }
};

pipeline_options
test_options()
{
    pipeline_options retval;

    retval.po_color = color_mode::never;
    retval.po_timezone = "utc";
    return retval;
}

Result<std::vector<std::string>, pipeline_error>
process(const pipeline_options& opts, std::vector<std::string> lines)
{
    json_pipeline pipeline(opts, line_style{});
    vector_source src(std::move(lines));
    vector_sink sink;

    TRY(pipeline.process(src, sink));

    return Ok(std::move(sink.vs_lines));
}

std::filesystem::path
test_path(const char* name)
{
    return std::filesystem::temp_directory_path()
        / (std::string("jlv-") + name + "-" + std::to_string(getpid()));
}

std::string
read_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;

    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

TEST_CASE("json_pipeline-min-level")
{
    auto opts = test_options();

    opts.po_min_level = LEVEL_WARNING;
    auto out = process(opts,
                       {
                           R"({"level":"DEBUG","message":"debug msg"})",
                           R"({"level":"ERROR","message":"error msg"})",
                           R"({"message":"no level"})",
                           R"({"level":"WARN","message":"warn msg"})",
                       })
                   .unwrap();

    REQUIRE(out.size() == 3);
    CHECK(out[0].find("error msg") != std::string::npos);
    CHECK(out[1].find("no level") != std::string::npos);
    CHECK(out[2].find("warn msg") != std::string::npos);
}

TEST_CASE("json_pipeline-logstash")
{
    auto opts = test_options();

    opts.po_ts_style = timestamp_style::full;
    auto out = process(opts,
                       {
                           R"({"@timestamp":"2024-01-15T10:30:00Z",)"
                           R"("level":"INFO","logger_name":"com.example.App",)"
                           R"("message":"started"})",
                       })
                   .unwrap();

    REQUIRE(out.size() == 1);
    CHECK(out[0] == "2024-01-15T10:30:00.000Z INFO [c.e.App] started");
}

TEST_CASE("json_pipeline-schema-cached")
{
    auto opts = test_options();

    // the first line is logstash, so "msg" is not the message afterwards
    auto out = process(opts,
                       {
                           R"({"@timestamp":"2024-01-15T10:30:00Z",)"
                           R"("level":"INFO","message":"first"})",
                           R"({"level":"INFO","msg":"second"})",
                       })
                   .unwrap();

    REQUIRE(out.size() == 2);
    CHECK(out[0] == "10:30:00.000 INFO [] first");
    CHECK(out[1] == " INFO [] ");
}

TEST_CASE("json_pipeline-forced-schema")
{
    auto opts = test_options();

    opts.po_schema = schema_choice::bunyan;
    auto out = process(opts, {R"({"level":40,"name":"svc","msg":"careful"})"})
                   .unwrap();

    REQUIRE(out.size() == 1);
    CHECK(out[0] == " WARN [svc] careful");
}

TEST_CASE("json_pipeline-non-json")
{
    auto opts = test_options();
    std::vector<std::string> lines = {
        "plain \x1b[31mtext",
        R"({"level":"INFO","message":"ok"})",
    };

    SUBCASE("passthrough")
    {
        auto out = process(opts, lines).unwrap();

        REQUIRE(out.size() == 2);
        CHECK(out[0] == "plain [31mtext");
    }

    SUBCASE("skip")
    {
        opts.po_non_json = non_json_policy::skip;
        auto out = process(opts, lines).unwrap();

        REQUIRE(out.size() == 1);
        CHECK(out[0].find("ok") != std::string::npos);
    }

    SUBCASE("fail")
    {
        opts.po_non_json = non_json_policy::fail;
        auto res = process(opts, lines);

        REQUIRE(res.isErr());
        CHECK(res.unwrapErr().pe_kind == pipeline_error::kind_t::parse);
        CHECK(res.unwrapErr().to_string()
              == "Parse error: not valid JSON: plain [31mtext");
    }
}

TEST_CASE("json_pipeline-bad-timezone")
{
    auto opts = test_options();

    opts.po_timezone = "Not/AZone";

    auto no_time = process(opts, {R"({"message":"fine"})"});
    CHECK(no_time.isOk());

    auto res = process(
        opts, {R"({"@timestamp":"2024-01-15T10:30:00Z","message":"x"})"});
    REQUIRE(res.isErr());
    CHECK(res.unwrapErr().to_string()
          == "Timezone error: unknown timezone: Not/AZone");
}

TEST_CASE("json_pipeline-raw-json")
{
    auto opts = test_options();
    const auto* input = R"({"level":"INFO","message":"hello","extra":"data"})";

    opts.po_raw_json = true;
    auto out = process(opts, {input}).unwrap();

    REQUIRE(out.size() == 1);
    CHECK(json::parse(out[0]).unwrap() == json::parse(input).unwrap());
}

TEST_CASE("json_pipeline-broken-pipe")
{
    auto opts = test_options();
    json_pipeline pipeline(opts, line_style{});
    vector_source src({R"({"message":"a"})"});
    closed_sink sink;

    auto res = pipeline.process(src, sink);
    REQUIRE(res.isErr());
    CHECK(res.unwrapErr().pe_kind == pipeline_error::kind_t::broken_pipe);
}

TEST_CASE("run-files-to-output")
{
    auto in1 = test_path("run-in1");
    auto in2 = test_path("run-in2");
    auto out = test_path("run-out");

    std::ofstream(in1) << R"({"level":"DEBUG","message":"one"})" << "\n"
                       << R"({"level":"ERROR","message":"two"})" << "\n";
    std::ofstream(in2) << R"({"level":"INFO","message":"three"})";

    auto opts = test_options();
    opts.po_color = color_mode::always;
    opts.po_template = "{message}";
    opts.po_output = out;
    opts.po_files = {in1, in2};

    auto res = run(opts);
    REQUIRE(res.isOk());
    CHECK(read_file(out) == "one\ntwo\nthree\n");

    std::filesystem::remove(in1);
    std::filesystem::remove(in2);
    std::filesystem::remove(out);
}

TEST_CASE("run-follow-last-file")
{
    auto in1 = test_path("run-follow-in1");
    auto in2 = test_path("run-follow-in2");
    auto out = test_path("run-follow-out");

    std::ofstream(in1) << R"({"message":"before"})" << "\n";
    std::ofstream(in2) << R"({"message":"tail 1"})" << "\n";

    auto opts = test_options();
    auto eof_count = std::make_shared<int>(0);
    opts.po_template = "{message}";
    opts.po_output = out;
    opts.po_files = {in1, in2};
    opts.po_follow = true;
    opts.po_follow_options.fo_backoff = std::chrono::milliseconds(1);
    opts.po_follow_options.fo_stop = [in2, eof_count]() {
        if ((*eof_count)++ == 0) {
            std::ofstream(in2, std::ios::app)
                << R"({"message":"tail 2"})" << "\n";
            return false;
        }
        return true;
    };

    auto res = run(opts);
    REQUIRE(res.isOk());
    CHECK(read_file(out) == "before\ntail 1\ntail 2\n");

    std::filesystem::remove(in1);
    std::filesystem::remove(in2);
    std::filesystem::remove(out);
}

TEST_CASE("run-missing-file")
{
    auto opts = test_options();

    opts.po_files = {"/non-existent/app.log"};
    opts.po_output = test_path("run-missing-out");

    auto res = run(opts);
    REQUIRE(res.isErr());
    CHECK(res.unwrapErr().pe_kind == pipeline_error::kind_t::io);
    CHECK(res.unwrapErr().to_string().find("I/O error: ") == 0);

    std::filesystem::remove(opts.po_output.value());
}
