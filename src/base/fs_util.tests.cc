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
 * @file fs_util.tests.cc
 */

#include <filesystem>
#include <fstream>

#include "base/fs_util.hh"

#include "config.h"
#include "doctest/doctest.h"

TEST_CASE("fs_util::open_file")
{
    auto open_res
        = jlv::filesystem::open_file("/non-existent/file.json", O_RDONLY);

    REQUIRE(open_res.isErr());
    CHECK(open_res.unwrapErr().find("/non-existent/file.json")
          != std::string::npos);
}

TEST_CASE("fs_util::probe_length")
{
    auto path = std::filesystem::temp_directory_path() / "jlv-probe.txt";

    {
        std::ofstream out(path);

        out << "0123456789";
    }

    auto open_res = jlv::filesystem::open_file(path, O_RDONLY);
    REQUIRE(open_res.isOk());

    auto fd = open_res.unwrap();
    auto len_res = jlv::filesystem::probe_length(fd.get());
    REQUIRE(len_res.isOk());
    CHECK(len_res.unwrap() == 10);

    auto stat_res = jlv::filesystem::stat_fd(fd.get());
    REQUIRE(stat_res.isOk());
    CHECK(stat_res.unwrap().st_size == 10);

    std::filesystem::remove(path);
}
