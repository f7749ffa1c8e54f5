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
 * @file line_format.cc
 */

#include "line_format.hh"

#include "base/ansi_scrubber.hh"
#include "base/string_util.hh"

namespace jlv {

static format_token
token_for_name(std::string name)
{
    if (name == "level") {
        return format_token::field(field_role::level);
    }
    if (name == "timestamp") {
        return format_token::field(field_role::timestamp);
    }
    if (name == "logger") {
        return format_token::field(field_role::logger);
    }
    if (name == "message") {
        return format_token::field(field_role::message);
    }

    return format_token::custom(std::move(name));
}

std::vector<format_token>
parse_template(std::string_view tmpl)
{
    std::vector<format_token> retval;
    std::string literal;
    size_t index = 0;

    while (index < tmpl.size()) {
        auto ch = tmpl[index++];

        switch (ch) {
            case '{': {
                if (index < tmpl.size() && tmpl[index] == '{') {
                    index += 1;
                    literal.push_back('{');
                    break;
                }
                if (!literal.empty()) {
                    retval.emplace_back(format_token::literal(literal));
                    literal.clear();
                }

                auto close = tmpl.find('}', index);
                auto name = tmpl.substr(index,
                                        close == std::string_view::npos
                                            ? std::string_view::npos
                                            : close - index);

                retval.emplace_back(token_for_name(std::string(name)));
                index = close == std::string_view::npos ? tmpl.size()
                                                        : close + 1;
                break;
            }
            case '}':
                if (index < tmpl.size() && tmpl[index] == '}') {
                    index += 1;
                }
                literal.push_back('}');
                break;
            default:
                literal.push_back(ch);
                break;
        }
    }

    if (!literal.empty()) {
        retval.emplace_back(format_token::literal(literal));
    }

    return retval;
}

render_context
render_context::create(const std::vector<format_token>& tokens,
                       const std::vector<std::string>& add_fields,
                       const std::vector<std::string>& omit_fields)
{
    render_context retval;

    retval.rc_add_fields.insert(add_fields.begin(), add_fields.end());
    retval.rc_omit_fields.insert(omit_fields.begin(), omit_fields.end());
    for (const auto& tok : tokens) {
        if (tok.ft_kind == format_token::kind_t::custom_field) {
            retval.rc_template_fields.insert(tok.ft_text);
        }
    }

    return retval;
}

bool
render_context::show_extra(const std::string& key) const
{
    if (this->rc_template_fields.count(key) > 0) {
        return false;
    }
    if (!this->rc_add_fields.empty()) {
        return this->rc_add_fields.count(key) > 0;
    }
    if (!this->rc_omit_fields.empty()) {
        return this->rc_omit_fields.count(key) == 0;
    }

    return false;
}

std::string
format_logger(std::string_view name, logger_format lf, size_t max_len)
{
    std::string retval;

    switch (lf) {
        case logger_format::short_dots:
            retval = abbreviate_dotted(name);
            break;
        case logger_format::as_is:
            retval = std::string(name);
            break;
    }

    return truncate_dotted_left(retval, max_len);
}

static std::string
scrub_opt(const std::optional<std::string>& str)
{
    if (!str) {
        return std::string();
    }

    return scrub_control_chars(str.value());
}

std::string
render_record(const log_record& lr,
              const std::vector<format_token>& tokens,
              const line_style& style,
              const render_options& opts,
              const render_context& ctx)
{
    if (opts.ro_raw_json) {
        return lr.lr_raw.to_json();
    }

    std::string retval;

    for (const auto& tok : tokens) {
        switch (tok.ft_kind) {
            case format_token::kind_t::literal:
                retval.append(tok.ft_text);
                break;
            case format_token::kind_t::field:
                switch (tok.ft_role) {
                    case field_role::level:
                        if (lr.lr_level) {
                            retval.append(
                                style.paint_level(lr.lr_level.value()));
                        }
                        break;
                    case field_role::timestamp:
                        retval.append(scrub_opt(lr.lr_timestamp));
                        break;
                    case field_role::logger:
                        if (lr.lr_logger) {
                            retval.append(scrub_control_chars(
                                format_logger(lr.lr_logger.value(),
                                              opts.ro_logger_format,
                                              opts.ro_logger_max_len)));
                        }
                        break;
                    case field_role::message:
                        retval.append(scrub_opt(lr.lr_message));
                        break;
                }
                break;
            case format_token::kind_t::custom_field: {
                auto iter = lr.lr_extras.find(tok.ft_text);

                if (iter != lr.lr_extras.end()) {
                    retval.append(
                        scrub_control_chars(value_to_string(iter->second)));
                }
                break;
            }
        }
    }

    for (const auto& pair : lr.lr_extras) {
        if (!ctx.show_extra(pair.first)) {
            continue;
        }

        auto key = style.paint_key(scrub_control_chars(pair.first));
        auto value = style.paint_value(
            scrub_control_chars(value_to_string(pair.second)));

        if (opts.ro_expanded) {
            retval.append("\n  ");
            retval.append(key);
            retval.append(": ");
            retval.append(value);
        } else {
            retval.push_back(' ');
            retval.append(key);
            retval.push_back('=');
            retval.append(value);
        }
    }

    if (lr.lr_stack_trace && ctx.rc_omit_fields.count("stack_trace") == 0) {
        auto trace = scrub_control_chars(lr.lr_stack_trace.value());
        std::string_view remaining = trace;

        while (!remaining.empty()) {
            auto eol = remaining.find('\n');
            auto line = remaining.substr(0, eol);

            retval.append("\n");
            retval.append(style.paint_dim("    " + std::string(line)));
            if (eol == std::string_view::npos) {
                break;
            }
            remaining = remaining.substr(eol + 1);
        }
    }

    return retval;
}

}  // namespace jlv
