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
 * @file json_pipeline.hh
 */

#ifndef jlv_json_pipeline_hh
#define jlv_json_pipeline_hh

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "follow_source.hh"
#include "line_format.hh"
#include "line_sink.hh"
#include "line_source.hh"
#include "line_style.hh"
#include "log_level.hh"
#include "log_schema.hh"
#include "log_timestamp.hh"
#include "pipeline_error.hh"
#include "result.h"

namespace jlv {

/** What to do with an input line that is not JSON. */
enum class non_json_policy {
    passthrough,
    skip,
    fail,
};

struct pipeline_options {
    std::string po_template{DEFAULT_TEMPLATE};
    std::vector<std::string> po_add_fields;
    std::vector<std::string> po_omit_fields;
    color_mode po_color{color_mode::auto_detect};
    non_json_policy po_non_json{non_json_policy::passthrough};
    schema_choice po_schema{schema_choice::auto_detect};
    logger_format po_logger_format{logger_format::short_dots};
    size_t po_logger_length{30};
    timestamp_style po_ts_style{timestamp_style::time};
    std::optional<log_level_t> po_min_level;
    bool po_raw_json{false};
    bool po_expanded{false};
    fmt::terminal_color po_key_color{fmt::terminal_color::magenta};
    fmt::terminal_color po_value_color{fmt::terminal_color::cyan};
    std::string po_timezone{"local"};
    bool po_follow{false};
    std::optional<std::filesystem::path> po_output;
    std::vector<std::filesystem::path> po_files;
    follow_options po_follow_options;
};

/**
 * Turns lines of JSON into rendered text according to a fixed set of
 * options.
 */
class json_pipeline {
public:
    json_pipeline(const pipeline_options& opts, line_style style);

    /**
     * Copy every line of the source to the sink.  The schema is detected
     * from the first JSON line of the source, unless one was chosen, and
     * reused for the rest of it.
     */
    Result<void, pipeline_error> process(line_source& src, line_sink& sink);

    /**
     * Handle a single line.
     *
     * @param schema The schema used for earlier lines of the same source, it
     *   is set if this is the first JSON line.
     * @return The text to output or std::nullopt if the line is dropped.
     */
    Result<std::optional<std::string>, pipeline_error> process_line(
        std::string_view line, std::optional<log_schema_t>& schema) const;

private:
    const pipeline_options& jp_options;
    line_style jp_style;
    std::vector<format_token> jp_tokens;
    render_options jp_render_options;
    render_context jp_context;
    mutable lazy_timezone jp_timezone;
};

/**
 * Read the inputs named in the options, or stdin if there are none, and
 * write the rendered lines to the output.  In follow mode, the last input
 * is tailed after the others have been read.
 */
Result<void, pipeline_error> run(const pipeline_options& opts);

}  // namespace jlv

#endif
