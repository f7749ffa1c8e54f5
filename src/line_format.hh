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
 * @file line_format.hh
 */

#ifndef jlv_line_format_hh
#define jlv_line_format_hh

#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "line_style.hh"
#include "log_record.hh"

namespace jlv {

enum class field_role {
    level,
    timestamp,
    logger,
    message,
};

enum class logger_format {
    short_dots,
    as_is,
};

/** A piece of a parsed output template. */
struct format_token {
    enum class kind_t {
        literal,
        field,
        custom_field,
    };

    static format_token literal(std::string text)
    {
        return format_token{kind_t::literal, std::move(text)};
    }

    static format_token field(field_role role)
    {
        return format_token{kind_t::field, "", role};
    }

    static format_token custom(std::string name)
    {
        return format_token{kind_t::custom_field, std::move(name)};
    }

    bool operator==(const format_token& rhs) const
    {
        if (this->ft_kind != rhs.ft_kind) {
            return false;
        }
        if (this->ft_kind == kind_t::field) {
            return this->ft_role == rhs.ft_role;
        }
        return this->ft_text == rhs.ft_text;
    }

    kind_t ft_kind;
    /** The literal text or the name of a custom field. */
    std::string ft_text;
    field_role ft_role{field_role::message};
};

constexpr const char* DEFAULT_TEMPLATE
    = "{timestamp} {level} [{logger}] {message}";

/**
 * Parse an output template.  Placeholders are written as "{name}" and
 * braces are escaped by doubling them.  An unmatched "}" is kept as is and
 * an unterminated placeholder runs to the end of the template.
 */
std::vector<format_token> parse_template(std::string_view tmpl);

/** The rendering settings that stay fixed for a whole run. */
struct render_options {
    bool ro_raw_json{false};
    bool ro_expanded{false};
    logger_format ro_logger_format{logger_format::short_dots};
    size_t ro_logger_max_len{30};
};

/**
 * Field selections derived once from the options and template.
 */
struct render_context {
    std::set<std::string> rc_omit_fields;
    std::set<std::string> rc_add_fields;
    std::set<std::string> rc_template_fields;

    static render_context create(const std::vector<format_token>& tokens,
                                 const std::vector<std::string>& add_fields,
                                 const std::vector<std::string>& omit_fields);

    /** @return True if the extra field should be appended to the line. */
    bool show_extra(const std::string& key) const;
};

/** @return The logger name as it should appear in output. */
std::string format_logger(std::string_view name,
                          logger_format lf,
                          size_t max_len);

/**
 * Render a record into its display form, which may span multiple lines
 * when extras are expanded or a stack trace is attached.
 */
std::string render_record(const log_record& lr,
                          const std::vector<format_token>& tokens,
                          const line_style& style,
                          const render_options& opts,
                          const render_context& ctx);

}  // namespace jlv

#endif
