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
 * @file json_pipeline.cc
 */

#include <unistd.h>

#include "json_pipeline.hh"

#include "base/ansi_scrubber.hh"
#include "base/jlv_log.hh"
#include "config.h"
#include "log_record.hh"
#include "yajlpp/json_value.hh"

namespace jlv {

json_pipeline::json_pipeline(const pipeline_options& opts, line_style style)
    : jp_options(opts), jp_style(std::move(style)),
      jp_tokens(parse_template(opts.po_template)),
      jp_timezone(opts.po_timezone)
{
    this->jp_render_options.ro_raw_json = opts.po_raw_json;
    this->jp_render_options.ro_expanded = opts.po_expanded;
    this->jp_render_options.ro_logger_format = opts.po_logger_format;
    this->jp_render_options.ro_logger_max_len = opts.po_logger_length;
    this->jp_context = render_context::create(
        this->jp_tokens, opts.po_add_fields, opts.po_omit_fields);
}

Result<std::optional<std::string>, pipeline_error>
json_pipeline::process_line(std::string_view line,
                            std::optional<log_schema_t>& schema) const
{
    auto parse_res = json::parse(line);

    if (parse_res.isErr()) {
        switch (this->jp_options.po_non_json) {
            case non_json_policy::passthrough:
                return Ok(std::make_optional(scrub_control_chars(line)));
            case non_json_policy::skip:
                log_debug("skipping non-JSON line -- %s",
                          parse_res.unwrapErr().c_str());
                return Ok(std::optional<std::string>());
            case non_json_policy::fail:
                break;
        }
        return Err(pipeline_error::parse(
            "not valid JSON: " + scrub_control_chars(line)));
    }

    auto val = parse_res.unwrap();
    if (!schema) {
        schema = schema_from_choice(this->jp_options.po_schema, val);
        log_info("using schema: %s", schema_name(schema.value()));
    }

    auto extract_res = log_record::extract(std::move(val),
                                           mapping_for(schema.value()),
                                           this->jp_timezone,
                                           this->jp_options.po_ts_style);
    if (extract_res.isErr()) {
        return Err(pipeline_error::timezone(extract_res.unwrapErr()));
    }

    auto lr = extract_res.unwrap();
    if (this->jp_options.po_min_level && lr.lr_level
        && lr.lr_level.value() < this->jp_options.po_min_level.value())
    {
        return Ok(std::optional<std::string>());
    }

    return Ok(std::make_optional(render_record(lr,
                                               this->jp_tokens,
                                               this->jp_style,
                                               this->jp_render_options,
                                               this->jp_context)));
}

Result<void, pipeline_error>
json_pipeline::process(line_source& src, line_sink& sink)
{
    std::optional<log_schema_t> schema;

    while (true) {
        auto line_res = src.next_line();
        if (line_res.isErr()) {
            return Err(pipeline_error::io(line_res.unwrapErr()));
        }

        auto line = line_res.unwrap();
        if (!line) {
            break;
        }

        auto out = TRY(this->process_line(line.value(), schema));
        if (out) {
            TRY(sink.write_line(out.value()));
        }
    }

    log_info("finished reading: %s", src.get_name().c_str());
    return Ok();
}

static Result<void, pipeline_error>
process_inputs(const pipeline_options& opts,
               json_pipeline& pipeline,
               line_sink& sink)
{
    if (opts.po_files.empty()) {
        auto src = fd_line_source::for_stdin();

        return pipeline.process(*src, sink);
    }

    for (size_t lpc = 0; lpc < opts.po_files.size(); lpc++) {
        const auto& path = opts.po_files[lpc];
        std::unique_ptr<line_source> src;

        if (opts.po_follow && lpc == opts.po_files.size() - 1) {
            auto open_res = follow_source::open(path, opts.po_follow_options);
            if (open_res.isErr()) {
                return Err(pipeline_error::io(open_res.unwrapErr()));
            }
            src = open_res.unwrap();
        } else {
            auto open_res = fd_line_source::open(path);
            if (open_res.isErr()) {
                return Err(pipeline_error::io(open_res.unwrapErr()));
            }
            src = open_res.unwrap();
        }

        TRY(pipeline.process(*src, sink));
    }

    return Ok();
}

Result<void, pipeline_error>
run(const pipeline_options& opts)
{
    std::unique_ptr<line_sink> sink;
    auto color_fd = STDOUT_FILENO;

    if (opts.po_output) {
        sink = TRY(file_line_sink::create(opts.po_output.value()));
        color_fd = -1;
    } else {
        sink = fd_line_sink::for_stdout();
    }

    auto style = line_style(should_colorize(opts.po_color, color_fd),
                            opts.po_key_color,
                            opts.po_value_color);
    log_info("color output: %s", style.is_enabled() ? "on" : "off");

    json_pipeline pipeline(opts, style);
    auto proc_res = process_inputs(opts, pipeline, *sink);
    auto close_res = sink->close();

    if (proc_res.isErr()) {
        return proc_res;
    }

    return close_res;
}

}  // namespace jlv
