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
 * @file jlv.cc
 */

#include <map>
#include <string>
#include <vector>

#include <errno.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>

#include "CLI/CLI.hpp"
#include "base/jlv_log.hh"
#include "base/string_util.hh"
#include "config.h"
#include "fmt/format.h"
#include "json_pipeline.hh"

using namespace jlv;

static const std::vector<std::string> COLOR_NAMES = {
    "black",
    "red",
    "green",
    "yellow",
    "blue",
    "magenta",
    "cyan",
    "white",
};

int
main(int argc, char* argv[])
{
    pipeline_options opts;
    std::string debug_log_name;
    std::string add_fields;
    std::string omit_fields;
    std::string color_name = "auto";
    std::string schema_name = "auto";
    std::string min_level;
    std::string key_color = "magenta";
    std::string value_color = "cyan";
    std::string output;
    std::vector<std::string> file_args;

    signal(SIGPIPE, SIG_IGN);

    log_argv(argc, argv);

    CLI::App app{"A viewer for JSON log files"};

    app.set_version_flag("-V,--version", VCS_PACKAGE_STRING);
    app.add_option(
           "-d", debug_log_name, "Write debug messages to the given file.")
        ->type_name("FILE");
    app.add_option("-f,--format", opts.po_template, "The output template.")
        ->capture_default_str();
    auto* add_opt = app.add_option(
        "--add-fields",
        add_fields,
        "Comma-separated list of extra fields to show.");
    auto* omit_opt = app.add_option(
        "--omit-fields",
        omit_fields,
        "Comma-separated list of extra fields to hide, all others are shown.");
    add_opt->excludes(omit_opt);
    omit_opt->excludes(add_opt);
    app.add_option("--color", color_name, "When to colorize the output.")
        ->check(CLI::IsMember({"auto", "always", "never"}))
        ->capture_default_str();
    app.add_option("--non-json", opts.po_non_json, "How to handle lines that are not JSON.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, non_json_policy>{
                {"passthrough", non_json_policy::passthrough},
                {"print-as-is", non_json_policy::passthrough},
                {"skip", non_json_policy::skip},
                {"fail", non_json_policy::fail},
            },
            CLI::ignore_case));
    app.add_option("--schema", schema_name, "The log schema of the input.")
        ->check(CLI::IsMember(
            {"auto", "logstash", "logrus", "bunyan", "generic"}))
        ->capture_default_str();
    app.add_option("--logger-format",
                   opts.po_logger_format,
                   "How to display logger names.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, logger_format>{
                {"short-dots", logger_format::short_dots},
                {"as-is", logger_format::as_is},
            },
            CLI::ignore_case));
    app.add_option("--logger-length",
                   opts.po_logger_length,
                   "The maximum length of a logger name, 0 for no limit.")
        ->capture_default_str();
    app.add_option("--ts-format", opts.po_ts_style, "How to display timestamps.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, timestamp_style>{
                {"time", timestamp_style::time},
                {"full", timestamp_style::full},
            },
            CLI::ignore_case));
    app.add_option("--min-level", min_level, "Hide records below this level.")
        ->check(CLI::IsMember(
            {"trace", "debug", "info", "warn", "error", "fatal"},
            CLI::ignore_case));
    app.add_flag("--raw-json", opts.po_raw_json, "Output the original JSON.");
    app.add_flag("--expanded",
                 opts.po_expanded,
                 "Show extra fields on separate lines.");
    app.add_option("--key-color", key_color, "The color of extra field keys.")
        ->check(CLI::IsMember(COLOR_NAMES))
        ->capture_default_str();
    app.add_option(
           "--value-color", value_color, "The color of extra field values.")
        ->check(CLI::IsMember(COLOR_NAMES))
        ->capture_default_str();
    app.add_option("--tz",
                   opts.po_timezone,
                   "The timezone for timestamps: local, utc or an IANA name.")
        ->capture_default_str();
    app.add_flag("--follow",
                 opts.po_follow,
                 "Wait for more data to be appended to the last file.");
    app.add_option("-o,--output", output, "Write to a file instead of stdout.")
        ->type_name("FILE");
    app.add_option("file", file_args, "The files to read, stdin if none.");

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp& e) {
        fmt::print(FMT_STRING("{}\n"), app.help());
        return EXIT_SUCCESS;
    } catch (const CLI::CallForVersion& e) {
        fmt::print(FMT_STRING("{}\n"), VCS_PACKAGE_STRING);
        return EXIT_SUCCESS;
    } catch (const CLI::ParseError& e) {
        fmt::print(stderr,
                   FMT_STRING("error: invalid command-line arguments -- {}\n"),
                   e.what());
        return e.get_exit_code();
    }

    if (!debug_log_name.empty()) {
        if (!log_open_path(debug_log_name)) {
            fmt::print(stderr,
                       FMT_STRING("error: unable to open debug log: {} -- {}\n"),
                       debug_log_name,
                       strerror(errno));
            return EXIT_FAILURE;
        }
        jlv_log_level = jlv_log_level_t::TRACE;
        log_argv(argc, argv);
    }
    log_host_info();

    opts.po_add_fields = split_list(add_fields);
    opts.po_omit_fields = split_list(omit_fields);
    opts.po_color = color_mode_from_name(color_name).value();
    opts.po_schema = schema_choice_from_name(schema_name).value();
    opts.po_key_color = color_from_name(key_color).value();
    opts.po_value_color = color_from_name(value_color).value();
    if (!min_level.empty()) {
        opts.po_min_level = string2level(min_level);
    }
    if (!output.empty()) {
        opts.po_output = output;
    }
    for (const auto& file : file_args) {
        opts.po_files.emplace_back(file);
    }

    auto run_res = run(opts);
    if (run_res.isErr()) {
        auto err = run_res.unwrapErr();

        if (err.pe_kind == pipeline_error::kind_t::broken_pipe) {
            log_info("exiting after the output was closed");
            return EXIT_SUCCESS;
        }

        log_error("%s", err.to_string().c_str());
        fmt::print(stderr, FMT_STRING("error: {}\n"), err.to_string());
        return EXIT_FAILURE;
    }

    log_info("exiting normally");
    return EXIT_SUCCESS;
}
