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
 * @file test_line_source.cc
 */

#include <filesystem>
#include <fstream>

#include <unistd.h>

#include "base/fs_util.hh"
#include "config.h"
#include "doctest/doctest.h"
#include "follow_source.hh"
#include "line_source.hh"

using namespace jlv;

static std::filesystem::path
test_path(const char* name)
{
    return std::filesystem::temp_directory_path()
        / (std::string("jlv-") + name + "-" + std::to_string(getpid()));
}

static void
write_file(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);

    out << content;
}

static void
append_file(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary | std::ios::app);

    out << content;
}

static std::string
next(line_source& src)
{
    auto res = src.next_line();

    REQUIRE(res.isOk());
    auto line = res.unwrap();
    REQUIRE(line.has_value());
    return line.value();
}

static bool
at_end(line_source& src)
{
    auto res = src.next_line();

    REQUIRE(res.isOk());
    return !res.unwrap().has_value();
}

TEST_CASE("fd_line_source")
{
    auto path = test_path("lines");

    write_file(path, "first\r\nsecond\n\nlast");

    auto open_res = fd_line_source::open(path);
    REQUIRE(open_res.isOk());
    auto src = open_res.unwrap();

    CHECK(next(*src) == "first");
    CHECK(next(*src) == "second");
    CHECK(next(*src) == "");
    CHECK(next(*src) == "last");
    CHECK(at_end(*src));
    CHECK(at_end(*src));

    std::filesystem::remove(path);
}

TEST_CASE("fd_line_source-empty")
{
    auto path = test_path("empty");

    write_file(path, "");

    auto src = fd_line_source::open(path).unwrap();
    CHECK(at_end(*src));

    std::filesystem::remove(path);
}

TEST_CASE("fd_line_source-long-lines")
{
    auto path = test_path("long");
    std::string long_line(fd_line_source::READ_SIZE * 2 + 17, 'x');

    write_file(path, long_line + "\nshort\n");

    auto src = fd_line_source::open(path).unwrap();
    CHECK(next(*src) == long_line);
    CHECK(next(*src) == "short");
    CHECK(at_end(*src));

    std::filesystem::remove(path);
}

TEST_CASE("fd_line_source-missing")
{
    auto open_res = fd_line_source::open("/non-existent/input.log");

    REQUIRE(open_res.isErr());
    CHECK(open_res.unwrapErr().find("/non-existent/input.log")
          != std::string::npos);
}

TEST_CASE("strip_line_ending")
{
    std::string line = "abc\r\n";

    strip_line_ending(line);
    CHECK(line == "abc");

    line = "abc\r";
    strip_line_ending(line);
    CHECK(line == "abc\r");
}

static follow_options
fast_follow(std::function<bool(int)> on_eof)
{
    follow_options retval;
    auto count = std::make_shared<int>(0);

    retval.fo_backoff = std::chrono::milliseconds(1);
    retval.fo_stop = [on_eof, count]() { return on_eof((*count)++); };

    return retval;
}

TEST_CASE("follow_source-partial-lines")
{
    auto path = test_path("follow-partial");

    write_file(path, "first\npart");

    auto opts = fast_follow([&path](int eof_count) {
        switch (eof_count) {
            case 0:
                return false;
            case 1:
                append_file(path, "ial");
                return false;
            case 2:
                append_file(path, "\nnext\n");
                return false;
            default:
                return true;
        }
    });
    auto src = follow_source::open(path, opts).unwrap();

    CHECK(next(*src) == "first");
    CHECK(next(*src) == "partial");
    CHECK(next(*src) == "next");
    CHECK(at_end(*src));
    CHECK(src->get_detector_name() == std::string("stat"));

    std::filesystem::remove(path);
}

TEST_CASE("follow_source-rotation")
{
    auto path = test_path("follow-rotate");
    auto rotated = test_path("follow-rotate-new");

    write_file(path, "old line\nunfinished");

    auto opts = fast_follow([&path, &rotated](int eof_count) {
        if (eof_count == 0) {
            write_file(rotated, "fresh\n");
            std::filesystem::rename(rotated, path);
            return false;
        }
        return true;
    });
    auto src = follow_source::open(path, opts).unwrap();

    CHECK(next(*src) == "old line");
    CHECK(next(*src) == "fresh");
    CHECK(at_end(*src));
    CHECK(src->get_offset() == 6);

    std::filesystem::remove(path);
}

TEST_CASE("follow_source-truncation")
{
    auto path = test_path("follow-truncate");

    write_file(path, "a long first line\n");

    auto opts = fast_follow([&path](int eof_count) {
        if (eof_count == 0) {
            write_file(path, "short\n");
            return false;
        }
        return true;
    });
    auto src = follow_source::open(path, opts).unwrap();

    CHECK(next(*src) == "a long first line");
    CHECK(next(*src) == "short");
    CHECK(at_end(*src));

    std::filesystem::remove(path);
}

TEST_CASE("follow_source-reopen-failure")
{
    auto path = test_path("follow-missing");

    write_file(path, "one\n");

    auto opts = fast_follow([&path](int eof_count) {
        switch (eof_count) {
            case 0:
                std::filesystem::remove(path);
                return false;
            case 1:
                write_file(path, "two\n");
                return false;
            default:
                return true;
        }
    });
    auto src = follow_source::open(path, opts).unwrap();

    CHECK(next(*src) == "one");
    CHECK(next(*src) == "two");
    CHECK(at_end(*src));

    std::filesystem::remove(path);
}

TEST_CASE("follow_source-length-probe-fallback")
{
    auto path = test_path("follow-probe");

    write_file(path, "0123456789\n");

    auto opts = fast_follow([&path](int eof_count) {
        if (eof_count == 0) {
            write_file(path, "ab\n");
            return false;
        }
        return true;
    });
    opts.fo_failure_threshold = 2;
    opts.fo_stat_fd = [](int fd) -> Result<struct stat, std::string> {
        return Err(std::string("identity unavailable"));
    };
    auto src = follow_source::open(path, opts).unwrap();

    CHECK(src->get_detector_name() == std::string("stat"));
    CHECK(next(*src) == "0123456789");
    CHECK(next(*src) == "ab");
    CHECK(src->get_detector_name() == std::string("length-probe"));
    CHECK(at_end(*src));

    std::filesystem::remove(path);
}

TEST_CASE("rotation_detector")
{
    auto path = test_path("detector");

    write_file(path, "0123456789");

    auto fd = jlv::filesystem::open_file(path, O_RDONLY).unwrap();
    stat_rotation_detector srd(
        [](int fd) { return jlv::filesystem::stat_fd(fd); });
    length_rotation_detector lrd;

    REQUIRE(srd.track(fd.get()).isOk());
    CHECK_FALSE(srd.is_rotated(fd.get(), 10).unwrap());
    CHECK(srd.is_rotated(fd.get(), 11).unwrap());
    CHECK_FALSE(lrd.is_rotated(fd.get(), 5).unwrap());
    CHECK(lrd.is_rotated(fd.get(), 20).unwrap());

    std::filesystem::remove(path);
}
