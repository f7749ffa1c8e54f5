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
 * @file line_sink.cc
 */

#include <errno.h>
#include <string.h>
#include <unistd.h>

#include "line_sink.hh"

#include "base/jlv_log.hh"
#include "config.h"
#include "fmt/format.h"

namespace jlv {

std::unique_ptr<fd_line_sink>
fd_line_sink::for_stdout()
{
    return std::make_unique<fd_line_sink>(auto_fd(STDOUT_FILENO));
}

Result<void, pipeline_error>
fd_line_sink::write_line(std::string_view line)
{
    this->ls_line.assign(line.data(), line.size());
    this->ls_line.push_back('\n');

    auto write_res = this->ls_fd.write_fully(this->ls_line);
    if (write_res.isErr()) {
        auto errnum = write_res.unwrapErr();

        if (errnum == EPIPE) {
            log_info("output pipe was closed");
            return Err(pipeline_error::broken_pipe());
        }
        return Err(pipeline_error::io(strerror(errnum)));
    }

    return Ok();
}

Result<std::unique_ptr<file_line_sink>, pipeline_error>
file_line_sink::create(const std::filesystem::path& path)
{
    auto_mem<FILE> file(fclose);

    file = fopen(path.c_str(), "we");
    if (file.empty()) {
        return Err(pipeline_error::io(fmt::format(
            FMT_STRING("Failed to open: {} -- {}"), path.string(), strerror(errno))));
    }

    log_info("writing output to: %s", path.c_str());
    return Ok(std::make_unique<file_line_sink>(std::move(file), path.string()));
}

Result<void, pipeline_error>
file_line_sink::check_error(int errnum) const
{
    if (errnum == EPIPE) {
        return Err(pipeline_error::broken_pipe());
    }

    return Err(pipeline_error::io(fmt::format(
        FMT_STRING("unable to write to {} -- {}"), this->ls_name, strerror(errnum))));
}

Result<void, pipeline_error>
file_line_sink::write_line(std::string_view line)
{
    if (fwrite(line.data(), 1, line.size(), this->ls_file.in()) != line.size()
        || fputc('\n', this->ls_file.in()) == EOF)
    {
        return this->check_error(errno);
    }

    return Ok();
}

Result<void, pipeline_error>
file_line_sink::close()
{
    if (this->ls_file.empty()) {
        return Ok();
    }

    auto rc = fclose(this->ls_file.release());
    if (rc != 0) {
        return this->check_error(errno);
    }

    return Ok();
}

}  // namespace jlv
