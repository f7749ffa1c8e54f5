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
 * @file jlv_log.cc
 */

#include <fcntl.h>
#include <signal.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>

#include <cstdlib>
#include <mutex>

#include "jlv_log.hh"

#include <sys/param.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/utsname.h>

#include "config.h"

static constexpr size_t MAX_LOG_LINE_SIZE = 2 * 1024;

std::optional<FILE*> jlv_log_file;
jlv_log_level_t jlv_log_level = jlv_log_level_t::DEBUG;

// NOTE: This mutex is leaked so that it is not destroyed during exit.
// Otherwise, any attempts to log will fail.
static std::mutex*
jlv_log_mutex()
{
    static auto* retval = new std::mutex();

    return retval;
}

static const char* LEVEL_NAMES[] = {
    "T",
    "D",
    "I",
    "W",
    "E",
};

bool
log_open_path(const std::string& path)
{
    std::lock_guard<std::mutex> log_lock(*jlv_log_mutex());

    if (jlv_log_file) {
        fclose(jlv_log_file.value());
        jlv_log_file = std::nullopt;
    }

    if (path.empty()) {
        return true;
    }

    auto* file = fopen(path.c_str(), "ae");
    if (file == nullptr) {
        return false;
    }

    fcntl(fileno(file), F_SETFD, FD_CLOEXEC);
    jlv_log_file = file;
    return true;
}

void
log_argv(int argc, char* argv[])
{
    const char* log_path = getenv("JLV_LOG_PATH");

    if (log_path != nullptr) {
        log_open_path(log_path);
    }

    log_info("argv[%d] =", argc);
    for (int lpc = 0; lpc < argc; lpc++) {
        log_info("    [%d] = %s", lpc, argv[lpc]);
    }
}

static const char*
env_or_unset(const char* name)
{
    const char* retval = getenv(name);

    return retval == nullptr ? "<unset>" : retval;
}

void
log_host_info()
{
    char cwd[MAXPATHLEN];
    struct utsname un;

    uname(&un);

    log_info("uname:");
    log_info("  sysname=%s", un.sysname);
    log_info("  nodename=%s", un.nodename);
    log_info("  machine=%s", un.machine);
    log_info("  release=%s", un.release);
    log_info("  version=%s", un.version);
    log_info("Environment:");
    log_info("  LANG=%s", env_or_unset("LANG"));
    log_info("  TERM=%s", env_or_unset("TERM"));
    log_info("  TZ=%s", env_or_unset("TZ"));
    log_info("  NO_COLOR=%s", env_or_unset("NO_COLOR"));
    log_info("  YES_COLOR=%s", env_or_unset("YES_COLOR"));
    log_info("Process:");
    log_info("  pid=%d", getpid());
    log_info("  ppid=%d", getppid());
    log_info("  uid=%d", getuid());
    log_info("  euid=%d", geteuid());
    if (getcwd(cwd, sizeof(cwd)) == nullptr) {
        log_info("  ERROR: getcwd failed");
    } else {
        log_info("  cwd=%s", cwd);
    }
    log_info("Executable:");
    log_info("  version=%s", VCS_PACKAGE_STRING);
}

void
log_msg(jlv_log_level_t level,
        const char* src_file,
        int line_number,
        const char* fmt,
        ...)
{
    struct timeval curr_time;
    struct tm localtm;
    char line[MAX_LOG_LINE_SIZE];
    ssize_t prefix_size;
    va_list args;
    ssize_t rc;

    if (level < jlv_log_level || !jlv_log_file) {
        return;
    }

    std::lock_guard<std::mutex> log_lock(*jlv_log_mutex());

    {
        // get the base name of the file.  NB: can't use basename() since it
        // can modify its argument
        const char* last_slash = src_file;

        for (int lpc = 0; src_file[lpc]; lpc++) {
            if (src_file[lpc] == '/' || src_file[lpc] == '\\') {
                last_slash = &src_file[lpc + 1];
            }
        }

        src_file = last_slash;
    }

    va_start(args, fmt);
    gettimeofday(&curr_time, nullptr);
    localtime_r(&curr_time.tv_sec, &localtm);
    auto gmtoff = std::abs(localtm.tm_gmtoff) / 60;
    prefix_size = snprintf(line,
                           MAX_LOG_LINE_SIZE,
                           "%4d-%02d-%02dT%02d:%02d:%02d.%03d%c%02d:%02d %s %s:%d ",
                           localtm.tm_year + 1900,
                           localtm.tm_mon + 1,
                           localtm.tm_mday,
                           localtm.tm_hour,
                           localtm.tm_min,
                           localtm.tm_sec,
                           (int) (curr_time.tv_usec / 1000),
                           localtm.tm_gmtoff < 0 ? '-' : '+',
                           (int) gmtoff / 60,
                           (int) gmtoff % 60,
                           LEVEL_NAMES[static_cast<uint32_t>(level)],
                           src_file,
                           line_number);
    rc = vsnprintf(
        &line[prefix_size], MAX_LOG_LINE_SIZE - prefix_size, fmt, args);
    if (rc >= (ssize_t) (MAX_LOG_LINE_SIZE - prefix_size)) {
        rc = MAX_LOG_LINE_SIZE - prefix_size - 1;
    }
    line[prefix_size + rc] = '\n';
    fwrite(line, 1, prefix_size + rc + 1, jlv_log_file.value());
    fflush(jlv_log_file.value());
    va_end(args);
}

void
log_abort()
{
    raise(SIGABRT);
    _exit(1);
}
