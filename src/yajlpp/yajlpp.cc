/**
 * Copyright (c) 2015, Timothy Stack
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
 * @file yajlpp.cc
 */

#include <ctype.h>

#include "yajlpp.hh"

std::string
yajlpp_gen::to_string() const
{
    const unsigned char* buf;
    size_t len;

    yajl_gen_get_buf(this->yg_handle.in(), &buf, &len);

    return std::string((const char*) buf, len);
}

namespace yajlpp {

auto_mem<yajl_handle_t>
alloc_handle(const yajl_callbacks* cb, void* cu)
{
    auto_mem<yajl_handle_t> retval(yajl_free);

    retval = yajl_alloc(cb, nullptr, cu);

    return retval;
}

std::string
get_error(yajl_handle handle, yajl_status status)
{
    switch (status) {
        case yajl_status_ok:
            return std::string();
        case yajl_status_client_canceled:
            return "parse canceled";
        case yajl_status_error: {
            auto* msg = yajl_get_error(handle, 0, nullptr, 0);
            auto retval = std::string((const char*) msg);

            yajl_free_error(handle, msg);
            while (!retval.empty() && isspace(retval.back())) {
                retval.pop_back();
            }
            return retval;
        }
    }

    return "unknown parse status";
}

}  // namespace yajlpp
