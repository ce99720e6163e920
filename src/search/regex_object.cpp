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

#include "regex_object.h"
#include "compiled_regex.h"
#include "regex_compiler.h"
#include "util/compile_error.h"

#include <utility>

using namespace std;

namespace lzs {

RegexObject::RegexObject(RegexSource source_in,
                         shared_ptr<const RegexCompiler> compiler_in,
                         const Grey &grey_in)
    : source(move(source_in)), compiler(move(compiler_in)), grey(grey_in) {}

RegexObject::~RegexObject() {}

shared_ptr<CompiledRegex> RegexObject::getCompiledRegex() {
    lock_guard<mutex> guard(lock);
    if (compiled) {
        return compiled;
    }

    if (!compiler) {
        throw CompileError("No compiler available for pattern /"
                           + source.pattern + "/.");
    }

    DEBUG_PRINTF("compiling /%s/ on first use\n", source.pattern.c_str());
    auto automata = compiler->compile(source);
    if (!automata) {
        throw CompileError("Compiler produced no automata for pattern /"
                           + source.pattern + "/.");
    }
    compiled = make_shared<CompiledRegex>(source, move(automata), compiler,
                                          grey);
    return compiled;
}

void RegexObject::setCompiledRegex(shared_ptr<CompiledRegex> compiled_in) {
    lock_guard<mutex> guard(lock);
    compiled = move(compiled_in);
}

RegexResult RegexObject::search(const u8 *buf, size_t len, s64a from_index) {
    return getCompiledRegex()->search(buf, len, from_index);
}

} // namespace lzs
