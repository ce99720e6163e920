/*
 * Copyright (c) 2015-2018, Intel Corporation
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 *  * Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *  * Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *  * Neither the name of Intel Corporation nor the names of its contributors
 *    may be used to endorse or promote products derived from this software
 *    without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

/** \file
 * \brief RegexObject: a pattern that is compiled the first time it is
 * searched with.
 */

#ifndef REGEX_OBJECT_H
#define REGEX_OBJECT_H

#include "grey.h"
#include "regex_source.h"
#include "result/regex_result.h"
#include "lzscommon.h"

#include <memory>
#include <mutex>

#include <boost/core/noncopyable.hpp>

namespace lzs {

class CompiledRegex;
class RegexCompiler;

class RegexObject : boost::noncopyable {
public:
    RegexObject(RegexSource source_in,
                std::shared_ptr<const RegexCompiler> compiler_in,
                const Grey &grey_in = Grey());
    ~RegexObject();

    const RegexSource &getSource() const { return source; }

    /** \brief Returns the compiled regex, compiling it on first use. Throws
     * CompileError if the pattern cannot be compiled; a later call tries
     * again. */
    std::shared_ptr<CompiledRegex> getCompiledRegex();

    /** \brief Installs an already compiled regex, replacing any earlier
     * one. */
    void setCompiledRegex(std::shared_ptr<CompiledRegex> compiled_in);

    /** \brief Compiles if necessary, then searches; see
     * CompiledRegex::search(). */
    RegexResult search(const u8 *buf, size_t len, s64a from_index);

private:
    const RegexSource source;
    const std::shared_ptr<const RegexCompiler> compiler;
    const Grey grey;

    std::mutex lock;
    std::shared_ptr<CompiledRegex> compiled; //!< guarded by lock
};

} // namespace lzs

#endif
