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
 * @file line_style.cc
 */

#include <stdlib.h>
#include <unistd.h>

#include "line_style.hh"

#include "config.h"
#include "fmt/format.h"
#include "log_level.hh"

namespace jlv {

std::optional<color_mode>
color_mode_from_name(std::string_view name)
{
    if (name == "auto") {
        return color_mode::auto_detect;
    }
    if (name == "always") {
        return color_mode::always;
    }
    if (name == "never") {
        return color_mode::never;
    }

    return std::nullopt;
}

std::optional<fmt::terminal_color>
color_from_name(std::string_view name)
{
    static const struct {
        const char* name;
        fmt::terminal_color color;
    } COLORS[] = {
        {"black", fmt::terminal_color::black},
        {"red", fmt::terminal_color::red},
        {"green", fmt::terminal_color::green},
        {"yellow", fmt::terminal_color::yellow},
        {"blue", fmt::terminal_color::blue},
        {"magenta", fmt::terminal_color::magenta},
        {"cyan", fmt::terminal_color::cyan},
        {"white", fmt::terminal_color::white},
    };

    for (const auto& entry : COLORS) {
        if (name == entry.name) {
            return entry.color;
        }
    }

    return std::nullopt;
}

bool
should_colorize(color_mode mode, int fd)
{
    switch (mode) {
        case color_mode::always:
            return true;
        case color_mode::never:
            return false;
        case color_mode::auto_detect:
            break;
    }

    if (getenv("NO_COLOR") != nullptr) {
        return false;
    }
    if (getenv("YES_COLOR") != nullptr) {
        return true;
    }

    return isatty(fd);
}

fmt::text_style
level_style(log_level_t level)
{
    switch (level) {
        case LEVEL_TRACE:
            return fmt::text_style{fmt::emphasis::faint};
        case LEVEL_DEBUG:
            return fmt::fg(fmt::terminal_color::blue);
        case LEVEL_INFO:
            return fmt::fg(fmt::terminal_color::green);
        case LEVEL_WARNING:
            return fmt::fg(fmt::terminal_color::yellow);
        case LEVEL_ERROR:
            return fmt::fg(fmt::terminal_color::red);
        case LEVEL_FATAL:
        case LEVEL__MAX:
            break;
    }

    return fmt::fg(fmt::terminal_color::red) | fmt::emphasis::bold;
}

std::string
line_style::paint_level(log_level_t level) const
{
    return this->paint(level_style(level), level_names[level]);
}

std::string
line_style::paint(const fmt::text_style& style, std::string_view text) const
{
    if (!this->ls_enabled || text.empty()) {
        return std::string(text);
    }

    return fmt::format(style, FMT_STRING("{}"), text);
}

}  // namespace jlv
