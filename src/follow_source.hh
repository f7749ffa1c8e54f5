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
 * @file follow_source.hh
 */

#ifndef jlv_follow_source_hh
#define jlv_follow_source_hh

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <sys/stat.h>
#include <sys/types.h>

#include "base/auto_fd.hh"
#include "line_source.hh"
#include "result.h"

namespace jlv {

/**
 * Strategy for deciding whether a freshly re-opened path refers to a
 * different file than the one that has been read so far.
 */
class rotation_detector {
public:
    virtual ~rotation_detector() = default;

    virtual const char* get_name() const = 0;

    /**
     * Remember the file behind the given descriptor as the one being read.
     */
    virtual Result<void, std::string> track(int fd) = 0;

    /**
     * @param fd The newly opened descriptor for the path.
     * @param offset How far the previous file was read.
     * @return True if reading should restart from the beginning of fd.
     */
    virtual Result<bool, std::string> is_rotated(int fd, off_t offset) = 0;
};

using stat_fd_func_t
    = std::function<Result<struct stat, std::string>(int fd)>;

/**
 * Compares the device and inode of the file, and treats a file that is
 * shorter than the read offset as truncated.
 */
class stat_rotation_detector : public rotation_detector {
public:
    explicit stat_rotation_detector(stat_fd_func_t stat_func);

    const char* get_name() const override { return "stat"; }

    Result<void, std::string> track(int fd) override;

    Result<bool, std::string> is_rotated(int fd, off_t offset) override;

private:
    stat_fd_func_t srd_stat;
    std::optional<std::pair<dev_t, ino_t>> srd_identity;
};

/**
 * For systems where the file identity cannot be determined, only a file
 * that became shorter than the read offset is detected.
 */
class length_rotation_detector : public rotation_detector {
public:
    const char* get_name() const override { return "length-probe"; }

    Result<void, std::string> track(int fd) override { return Ok(); }

    Result<bool, std::string> is_rotated(int fd, off_t offset) override;
};

struct follow_options {
    std::chrono::milliseconds fo_backoff{200};
    /** Consecutive identity failures before switching to length probes. */
    size_t fo_failure_threshold{5};
    /** Checked when the end of the file is reached, true ends the follow. */
    std::function<bool()> fo_stop;
    /** Used to get the identity of a file, fstat(2) when unset. */
    stat_fd_func_t fo_stat_fd;
};

/**
 * A line source that tails a file like "tail -F".  Lines that have not
 * been terminated yet are held back until the rest arrives.  At the end of
 * the file, the path is re-opened after a short wait so that a rotated or
 * truncated file is picked up from its beginning.
 */
class follow_source : public line_source {
public:
    static Result<std::unique_ptr<follow_source>, std::string> open(
        const std::filesystem::path& path, follow_options opts = {});

    follow_source(std::filesystem::path path,
                  auto_fd fd,
                  follow_options opts);

    Result<std::optional<std::string>, std::string> next_line() override;

    const std::string& get_name() const override { return this->fs_name; }

    /** @return The name of the rotation strategy in use. */
    const char* get_detector_name() const
    {
        return this->fs_detector->get_name();
    }

    off_t get_offset() const { return this->fs_offset; }

private:
    void reopen();

    /** @return True if the detector was switched to length probes. */
    bool identity_failed(const std::string& msg);

    std::filesystem::path fs_path;
    std::string fs_name;
    auto_fd fs_fd;
    follow_options fs_options;
    std::unique_ptr<rotation_detector> fs_detector;
    off_t fs_offset{0};
    /** Bytes read past the last line that was returned. */
    std::string fs_partial;
    size_t fs_identity_failures{0};
    bool fs_warned{false};
};

}  // namespace jlv

#endif
