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
 * @file test_line_format.cc
 */

#include "config.h"
#include "doctest/doctest.h"
#include "line_format.hh"
#include "yajlpp/json_value.hh"

using namespace jlv;

static log_record
sample_record()
{
    log_record retval;

    retval.lr_level = LEVEL_INFO;
    retval.lr_timestamp = "10:30:00.000";
    retval.lr_logger = "com.example.service.MyHandler";
    retval.lr_message = "request done";
    retval.lr_extras.emplace("user", json::value::from_string("alice"));
    retval.lr_extras.emplace("status", json::value::from_number("200"));
    retval.lr_raw = json::parse(R"({"level":"INFO"})").unwrap();

    return retval;
}

static std::string
render(const log_record& lr,
       const char* tmpl = DEFAULT_TEMPLATE,
       const std::vector<std::string>& add = {},
       const std::vector<std::string>& omit = {},
       render_options opts = {},
       const line_style& style = line_style{})
{
    auto tokens = parse_template(tmpl);
    auto ctx = render_context::create(tokens, add, omit);

    return render_record(lr, tokens, style, opts, ctx);
}

TEST_CASE("parse_template")
{
    auto tokens = parse_template("{timestamp} {level} [{logger}] {user}");

    REQUIRE(tokens.size() == 7);
    CHECK(tokens[0] == format_token::field(field_role::timestamp));
    CHECK(tokens[1] == format_token::literal(" "));
    CHECK(tokens[2] == format_token::field(field_role::level));
    CHECK(tokens[3] == format_token::literal(" ["));
    CHECK(tokens[4] == format_token::field(field_role::logger));
    CHECK(tokens[5] == format_token::literal("] "));
    CHECK(tokens[6] == format_token::custom("user"));
}

TEST_CASE("parse_template-escapes")
{
    CHECK(parse_template("{{literal}}")
          == std::vector<format_token>{format_token::literal("{literal}")});
    CHECK(parse_template("a } b")
          == std::vector<format_token>{format_token::literal("a } b")});
    CHECK(parse_template("x {message")
          == std::vector<format_token>{
              format_token::literal("x "),
              format_token::field(field_role::message),
          });
    CHECK(parse_template("{}")
          == std::vector<format_token>{format_token::custom("")});
    CHECK(parse_template("").empty());
}

TEST_CASE("render_record-default")
{
    CHECK(render(sample_record())
          == "10:30:00.000 INFO [c.e.s.MyHandler] request done");
}

TEST_CASE("render_record-missing-fields")
{
    log_record lr;

    lr.lr_message = "only a message";
    CHECK(render(lr) == "  [] only a message");
}

TEST_CASE("render_record-logger")
{
    render_options opts;

    opts.ro_logger_format = logger_format::as_is;
    opts.ro_logger_max_len = 15;
    CHECK(render(sample_record(), "{logger}", {}, {}, opts) == "MyHandler");

    opts.ro_logger_format = logger_format::short_dots;
    opts.ro_logger_max_len = 0;
    CHECK(render(sample_record(), "{logger}", {}, {}, opts)
          == "c.e.s.MyHandler");
}

TEST_CASE("format_logger")
{
    CHECK(format_logger("com.example.service.MyHandler",
                        logger_format::short_dots,
                        0)
          == "c.e.s.MyHandler");
    CHECK(format_logger("com.example.service.Handler", logger_format::as_is, 15)
          == "service.Handler");
    CHECK(format_logger("com.example.service.MyHandler",
                        logger_format::short_dots,
                        13)
          == "e.s.MyHandler");
    CHECK(format_logger("VeryLongName", logger_format::as_is, 4) == "Name");
}

TEST_CASE("render_record-extras")
{
    auto lr = sample_record();

    CHECK(render(lr, "{message}") == "request done");
    CHECK(render(lr, "{message}", {"user"}) == "request done user=alice");
    CHECK(render(lr, "{message}", {"missing"}) == "request done");
    CHECK(render(lr, "{message}", {}, {"user"}) == "request done status=200");
    CHECK(render(lr, "{message}", {}, {"nothing"})
          == "request done status=200 user=alice");
    CHECK(render(lr, "{message} {user}", {}, {"nothing"})
          == "request done alice status=200");
    CHECK(render(lr, "{message} <{absent}>") == "request done <>");
}

TEST_CASE("render_record-expanded")
{
    render_options opts;

    opts.ro_expanded = true;
    CHECK(render(sample_record(), "{message}", {"user", "status"}, {}, opts)
          == "request done\n  status: 200\n  user: alice");
}

TEST_CASE("render_record-stack-trace")
{
    auto lr = sample_record();

    lr.lr_stack_trace = "java.lang.Error\n\tat A.b()\n";
    CHECK(render(lr, "{message}")
          == "request done\n    java.lang.Error\n    \tat A.b()");
    CHECK(render(lr, "{message}", {}, {"stack_trace"}) == "request done");
}

TEST_CASE("render_record-sanitizes")
{
    log_record lr;

    lr.lr_message = "evil\x1b]0;pwned\x07 text";
    lr.lr_logger = "a\x1b[2J";
    lr.lr_extras.emplace("k\x1b", json::value::from_string("v\x9b"));
    CHECK(render(lr, "{logger} {message}", {}, {"none"})
          == "a[2J evil]0;pwned text k=v");
}

TEST_CASE("render_record-raw-json")
{
    auto raw = json::parse(R"({"level":"INFO","message":"hello","extra":"data"})")
                   .unwrap();
    log_record lr;
    render_options opts;

    lr.lr_raw = raw;
    opts.ro_raw_json = true;
    CHECK(json::parse(render(lr, DEFAULT_TEMPLATE, {}, {}, opts)).unwrap()
          == raw);
}

TEST_CASE("render_record-color")
{
    line_style style(true, fmt::terminal_color::magenta, fmt::terminal_color::cyan);
    auto lr = sample_record();
    auto out = render(lr, "{level} {message}", {"user"}, {}, {}, style);

    CHECK(out
          == "\x1b[32mINFO\x1b[0m request done "
             "\x1b[35muser\x1b[0m=\x1b[36malice\x1b[0m");

    lr.lr_stack_trace = "at x";
    CHECK(render(lr, "{message}", {}, {}, {}, style)
          == "request done\n\x1b[2m    at x\x1b[0m");
}

TEST_CASE("line_style::paint_level")
{
    line_style plain;

    CHECK(plain.paint_level(LEVEL_WARNING) == "WARN");
    CHECK(plain.paint_level(LEVEL_FATAL) == "FATAL");

    line_style colored(true, fmt::terminal_color::red, fmt::terminal_color::blue);
    CHECK(colored.paint_level(LEVEL_ERROR) == "\x1b[31mERROR\x1b[0m");
    CHECK(colored.paint_level(LEVEL_INFO) != colored.paint_level(LEVEL_DEBUG));
}

TEST_CASE("color names")
{
    CHECK(color_from_name("magenta") == fmt::terminal_color::magenta);
    CHECK_FALSE(color_from_name("purple").has_value());
    CHECK(color_mode_from_name("never") == color_mode::never);
    CHECK(should_colorize(color_mode::always, -1));
    CHECK_FALSE(should_colorize(color_mode::never, -1));
}
