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
 * @file follow_source.cc
 */

#include <thread>

#include <errno.h>
#include <string.h>
#include <unistd.h>

#include "follow_source.hh"

#include "base/fs_util.hh"
#include "base/jlv_log.hh"
#include "config.h"
#include "fmt/format.h"

namespace jlv {

stat_rotation_detector::stat_rotation_detector(stat_fd_func_t stat_func)
    : srd_stat(std::move(stat_func))
{
}

Result<void, std::string>
stat_rotation_detector::track(int fd)
{
    auto st = TRY(this->srd_stat(fd));

    this->srd_identity = std::make_pair(st.st_dev, st.st_ino);
    return Ok();
}

Result<bool, std::string>
stat_rotation_detector::is_rotated(int fd, off_t offset)
{
    auto st = TRY(this->srd_stat(fd));

    if (this->srd_identity
        && this->srd_identity.value() != std::make_pair(st.st_dev, st.st_ino))
    {
        return Ok(true);
    }

    return Ok(st.st_size < offset);
}

Result<bool, std::string>
length_rotation_detector::is_rotated(int fd, off_t offset)
{
    auto len = TRY(filesystem::probe_length(fd));

    return Ok(len < offset);
}

Result<std::unique_ptr<follow_source>, std::string>
follow_source::open(const std::filesystem::path& path, follow_options opts)
{
    auto fd = TRY(filesystem::open_file(path, O_RDONLY));

    log_info("following file: %s (fd=%d)", path.c_str(), fd.get());
    return Ok(
        std::make_unique<follow_source>(path, std::move(fd), std::move(opts)));
}

follow_source::follow_source(std::filesystem::path path,
                             auto_fd fd,
                             follow_options opts)
    : fs_path(std::move(path)), fs_name(fs_path.string()), fs_fd(std::move(fd)),
      fs_options(std::move(opts))
{
    stat_fd_func_t stat_func = this->fs_options.fo_stat_fd;

    if (!stat_func) {
        stat_func = [](int fd) { return filesystem::stat_fd(fd); };
    }
    this->fs_detector
        = std::make_unique<stat_rotation_detector>(std::move(stat_func));

    auto track_res = this->fs_detector->track(this->fs_fd.get());
    if (track_res.isErr()) {
        this->identity_failed(track_res.unwrapErr());
    }
}

bool
follow_source::identity_failed(const std::string& msg)
{
    this->fs_identity_failures += 1;
    log_debug("unable to get identity of %s (%zu) -- %s",
              this->fs_name.c_str(),
              this->fs_identity_failures,
              msg.c_str());

    if (this->fs_warned
        || this->fs_identity_failures < this->fs_options.fo_failure_threshold)
    {
        return false;
    }

    this->fs_warned = true;
    this->fs_detector = std::make_unique<length_rotation_detector>();
    log_warning("falling back to length checks for rotation of %s",
                this->fs_name.c_str());
    fmt::print(stderr,
               FMT_STRING("warning: unable to determine the identity of {}, "
                          "rotation will be detected by length only\n"),
               this->fs_name);
    return true;
}

void
follow_source::reopen()
{
    auto open_res = filesystem::open_file(this->fs_path, O_RDONLY);
    if (open_res.isErr()) {
        log_debug("unable to reopen, continuing with the old descriptor -- %s",
                  open_res.unwrapErr().c_str());
        return;
    }

    auto fd = open_res.unwrap();
    auto rotated = false;
    auto rot_res = this->fs_detector->is_rotated(fd.get(), this->fs_offset);
    if (rot_res.isOk()) {
        rotated = rot_res.unwrap();
        if (!this->fs_warned) {
            this->fs_identity_failures = 0;
        }
    } else {
        if (!this->identity_failed(rot_res.unwrapErr())) {
            return;
        }

        auto probe_res
            = this->fs_detector->is_rotated(fd.get(), this->fs_offset);
        if (probe_res.isErr()) {
            log_error("unable to check %s for rotation -- %s",
                      this->fs_name.c_str(),
                      probe_res.unwrapErr().c_str());
            return;
        }
        rotated = probe_res.unwrap();
    }

    if (rotated) {
        log_info("file was rotated or truncated: %s (offset=%lld)",
                 this->fs_name.c_str(),
                 (long long) this->fs_offset);
        if (lseek(fd.get(), 0, SEEK_SET) == -1) {
            log_error("unable to rewind %s -- %s",
                      this->fs_name.c_str(),
                      strerror(errno));
            return;
        }
        this->fs_offset = 0;
        this->fs_partial.clear();

        auto track_res = this->fs_detector->track(fd.get());
        if (track_res.isErr()) {
            this->identity_failed(track_res.unwrapErr());
        }
    } else if (lseek(fd.get(), this->fs_offset, SEEK_SET) == -1) {
        log_error("unable to seek %s to %lld -- %s",
                  this->fs_name.c_str(),
                  (long long) this->fs_offset,
                  strerror(errno));
        return;
    }

    this->fs_fd = std::move(fd);
}

Result<std::optional<std::string>, std::string>
follow_source::next_line()
{
    char buffer[16 * 1024];

    while (true) {
        auto eol = this->fs_partial.find('\n');

        if (eol != std::string::npos) {
            auto retval = this->fs_partial.substr(0, eol + 1);

            this->fs_partial.erase(0, eol + 1);
            strip_line_ending(retval);
            return Ok(std::make_optional(std::move(retval)));
        }

        auto rc = read(this->fs_fd.get(), buffer, sizeof(buffer));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err(fmt::format(FMT_STRING("unable to read {} -- {}"),
                                   this->fs_name,
                                   strerror(errno)));
        }
        if (rc > 0) {
            this->fs_partial.append(buffer, rc);
            this->fs_offset += rc;
            continue;
        }

        if (this->fs_options.fo_stop && this->fs_options.fo_stop()) {
            log_debug("stopped following: %s", this->fs_name.c_str());
            return Ok(std::optional<std::string>());
        }

        std::this_thread::sleep_for(this->fs_options.fo_backoff);
        this->reopen();
    }
}

}  // namespace jlv
