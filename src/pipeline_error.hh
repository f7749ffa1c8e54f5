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
 * @file pipeline_error.hh
 */

#ifndef jlv_pipeline_error_hh
#define jlv_pipeline_error_hh

#include <string>

namespace jlv {

/**
 * An error that ends a run.
 */
struct pipeline_error {
    enum class kind_t {
        io,
        parse,
        timezone,
        /** The reader of the output went away, which is not a failure. */
        broken_pipe,
    };

    static pipeline_error io(std::string msg)
    {
        return pipeline_error{kind_t::io, std::move(msg)};
    }

    static pipeline_error parse(std::string msg)
    {
        return pipeline_error{kind_t::parse, std::move(msg)};
    }

    static pipeline_error timezone(std::string msg)
    {
        return pipeline_error{kind_t::timezone, std::move(msg)};
    }

    static pipeline_error broken_pipe()
    {
        return pipeline_error{kind_t::broken_pipe, "Broken pipe"};
    }

    /** @return The message prefixed with the kind of error. */
    std::string to_string() const
    {
        switch (this->pe_kind) {
            case kind_t::parse:
                return "Parse error: " + this->pe_message;
            case kind_t::timezone:
                return "Timezone error: " + this->pe_message;
            case kind_t::io:
            case kind_t::broken_pipe:
                break;
        }

        return "I/O error: " + this->pe_message;
    }

    kind_t pe_kind;
    std::string pe_message;
};

}  // namespace jlv

#endif
