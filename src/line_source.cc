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
 * @file line_source.cc
 */

#include <errno.h>
#include <string.h>
#include <unistd.h>

#include "line_source.hh"

#include "base/fs_util.hh"
#include "base/jlv_log.hh"
#include "config.h"
#include "fmt/format.h"

namespace jlv {

void
strip_line_ending(std::string& line)
{
    if (!line.empty() && line.back() == '\n') {
        line.pop_back();
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
    }
}

Result<std::unique_ptr<fd_line_source>, std::string>
fd_line_source::open(const std::filesystem::path& path)
{
    auto fd = TRY(filesystem::open_file(path, O_RDONLY));

    log_info("opened input file: %s (fd=%d)", path.c_str(), fd.get());
    return Ok(std::make_unique<fd_line_source>(std::move(fd), path.string()));
}

std::unique_ptr<fd_line_source>
fd_line_source::for_stdin()
{
    return std::make_unique<fd_line_source>(auto_fd(STDIN_FILENO), "<stdin>");
}

Result<std::optional<std::string>, std::string>
fd_line_source::next_line()
{
    while (true) {
        auto eol = this->ls_buffer.find('\n', this->ls_start);

        if (eol != std::string::npos) {
            auto retval = this->ls_buffer.substr(this->ls_start,
                                                 eol - this->ls_start + 1);

            this->ls_start = eol + 1;
            strip_line_ending(retval);
            return Ok(std::make_optional(std::move(retval)));
        }

        if (this->ls_eof) {
            if (this->ls_start >= this->ls_buffer.size()) {
                return Ok(std::optional<std::string>());
            }

            auto retval = this->ls_buffer.substr(this->ls_start);

            this->ls_buffer.clear();
            this->ls_start = 0;
            return Ok(std::make_optional(std::move(retval)));
        }

        if (this->ls_start > 0) {
            this->ls_buffer.erase(0, this->ls_start);
            this->ls_start = 0;
        }

        auto old_size = this->ls_buffer.size();
        this->ls_buffer.resize(old_size + READ_SIZE);
        auto rc = read(
            this->ls_fd.get(), &this->ls_buffer[old_size], READ_SIZE);
        if (rc < 0) {
            auto errnum = errno;

            this->ls_buffer.resize(old_size);
            if (errnum == EINTR) {
                continue;
            }
            return Err(fmt::format(FMT_STRING("unable to read {} -- {}"),
                                   this->ls_name,
                                   strerror(errnum)));
        }

        this->ls_buffer.resize(old_size + rc);
        if (rc == 0) {
            log_debug("end of input: %s", this->ls_name.c_str());
            this->ls_eof = true;
        }
    }
}

}  // namespace jlv
