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
 * @file line_source.hh
 */

#ifndef jlv_line_source_hh
#define jlv_line_source_hh

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "base/auto_fd.hh"
#include "result.h"

namespace jlv {

/**
 * Interface for something that produces lines of text one at a time.
 */
class line_source {
public:
    virtual ~line_source() = default;

    /**
     * @return The next line without its terminator, std::nullopt when there
     *   are no more lines, or a description of the I/O error.
     */
    virtual Result<std::optional<std::string>, std::string> next_line() = 0;

    virtual const std::string& get_name() const = 0;
};

/**
 * Remove a trailing LF or CRLF from a line that was read with its
 * terminator.
 */
void strip_line_ending(std::string& line);

/**
 * A line source that reads a descriptor until end-of-file.  A last line
 * without a terminator is still returned.
 */
class fd_line_source : public line_source {
public:
    static constexpr size_t READ_SIZE = 64 * 1024;

    fd_line_source(auto_fd fd, std::string name)
        : ls_fd(std::move(fd)), ls_name(std::move(name))
    {
    }

    static Result<std::unique_ptr<fd_line_source>, std::string> open(
        const std::filesystem::path& path);

    static std::unique_ptr<fd_line_source> for_stdin();

    Result<std::optional<std::string>, std::string> next_line() override;

    const std::string& get_name() const override { return this->ls_name; }

private:
    auto_fd ls_fd;
    std::string ls_name;
    std::string ls_buffer;
    size_t ls_start{0};
    bool ls_eof{false};
};

}  // namespace jlv

#endif
