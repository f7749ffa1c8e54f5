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
 * @file line_style.hh
 */

#ifndef jlv_line_style_hh
#define jlv_line_style_hh

#include <optional>
#include <string>
#include <string_view>

#include "base/log_level_enum.hh"
#include "fmt/color.h"

namespace jlv {

enum class color_mode {
    auto_detect,
    always,
    never,
};

std::optional<color_mode> color_mode_from_name(std::string_view name);

/** @return The terminal color with the given lower-case name. */
std::optional<fmt::terminal_color> color_from_name(std::string_view name);

/**
 * Decide whether output to the given descriptor should be colorized.  In
 * auto mode, NO_COLOR in the environment turns color off, YES_COLOR turns
 * it on and, otherwise, color is used only for a terminal.
 */
bool should_colorize(color_mode mode, int fd);

fmt::text_style level_style(log_level_t level);

/**
 * The styles applied to the parts of a rendered line.  Built once at
 * startup and shared by every render.
 */
class line_style {
public:
    line_style() = default;

    line_style(bool enabled,
               fmt::terminal_color key_color,
               fmt::terminal_color value_color)
        : ls_enabled(enabled), ls_key_style(fmt::fg(key_color)),
          ls_value_style(fmt::fg(value_color))
    {
    }

    bool is_enabled() const { return this->ls_enabled; }

    /** @return The level's display name, colored for its severity. */
    std::string paint_level(log_level_t level) const;

    std::string paint_key(std::string_view text) const
    {
        return this->paint(this->ls_key_style, text);
    }

    std::string paint_value(std::string_view text) const
    {
        return this->paint(this->ls_value_style, text);
    }

    std::string paint_dim(std::string_view text) const
    {
        return this->paint(fmt::emphasis::faint, text);
    }

    std::string paint(const fmt::text_style& style,
                      std::string_view text) const;

private:
    bool ls_enabled{false};
    fmt::text_style ls_key_style{fmt::fg(fmt::terminal_color::magenta)};
    fmt::text_style ls_value_style{fmt::fg(fmt::terminal_color::cyan)};
};

}  // namespace jlv

#endif
