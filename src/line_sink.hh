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
 * @file line_sink.hh
 */

#ifndef jlv_line_sink_hh
#define jlv_line_sink_hh

#include <filesystem>
#include <memory>
#include <string_view>

#include <stdio.h>

#include "base/auto_fd.hh"
#include "base/auto_mem.hh"
#include "pipeline_error.hh"
#include "result.h"

namespace jlv {

/**
 * Destination for rendered lines.
 */
class line_sink {
public:
    virtual ~line_sink() = default;

    /** Write the text followed by a newline. */
    virtual Result<void, pipeline_error> write_line(std::string_view line)
        = 0;

    /** Flush anything that is still buffered. */
    virtual Result<void, pipeline_error> close() { return Ok(); }
};

/**
 * Writes each line to a descriptor as soon as it is rendered.  A closed
 * pipe on the other end is reported as a broken_pipe error.
 */
class fd_line_sink : public line_sink {
public:
    explicit fd_line_sink(auto_fd fd) : ls_fd(std::move(fd)) {}

    static std::unique_ptr<fd_line_sink> for_stdout();

    Result<void, pipeline_error> write_line(std::string_view line) override;

private:
    auto_fd ls_fd;
    std::string ls_line;
};

/**
 * Writes lines to a file through stdio buffering.
 */
class file_line_sink : public line_sink {
public:
    static Result<std::unique_ptr<file_line_sink>, pipeline_error> create(
        const std::filesystem::path& path);

    explicit file_line_sink(auto_mem<FILE> file, std::string name)
        : ls_file(std::move(file)), ls_name(std::move(name))
    {
    }

    Result<void, pipeline_error> write_line(std::string_view line) override;

    Result<void, pipeline_error> close() override;

private:
    Result<void, pipeline_error> check_error(int errnum) const;

    auto_mem<FILE> ls_file;
    std::string ls_name;
};

}  // namespace jlv

#endif
