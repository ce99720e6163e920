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

#include "test_util.h"
#include "grey.h"
#include "lzs_internal.h"
#include "search/automata.h"
#include "search/regex_object.h"
#include "internal/test_automata.h"
#include "gtest/gtest.h"

#include <memory>
#include <vector>

using namespace std;
using namespace lzs;

lzs_regex_t *makeAbcRegex(const Grey &grey) {
    auto compiler = make_shared<FixedCompiler>(abcLazyAutomata(), abcEager());
    return wrapRegexObject(make_shared<RegexObject>(RegexSource("a(b)?c", 0),
                                                    compiler, grey));
}

lzs_regex_t *makeAbcRegex() {
    return makeAbcRegex(Grey());
}

lzs_regex_t *makeTraceRegex() {
    auto automata = make_shared<CompiledAutomata>(acOrBcForward(),
                                                  acOrBcTraceBackward(false),
                                                  nullptr, acOrBcPrecalc(),
                                                  0);
    auto compiler = make_shared<FixedCompiler>(automata, nullptr);
    return wrapRegexObject(make_shared<RegexObject>(
        RegexSource("(?:(a)|(b))c", 0), compiler));
}

lzs_regex_t *makeUncompilableRegex() {
    auto compiler = make_shared<FixedCompiler>(abcLazyAutomata(), nullptr);
    compiler->fail_compile = true;
    return wrapRegexObject(make_shared<RegexObject>(RegexSource("a(?<", 0),
                                                    compiler));
}

lzs_regex_t *makeCrashingCompilerRegex() {
    auto compiler = make_shared<FixedCompiler>(abcLazyAutomata(), nullptr);
    compiler->crash_compile = true;
    return wrapRegexObject(make_shared<RegexObject>(RegexSource("a(b)?c", 0),
                                                    compiler));
}

lzs_regex_t *makeFailingDeferredRegex() {
    auto automata = make_shared<CompiledAutomata>(
        abcForward(), make_shared<FailingAutomaton>(abcBackward()),
        make_shared<FailingAutomaton>(abcCaptureGroups()),
        vector<PrecalculatedResultFactory>(), 0);
    auto compiler = make_shared<FixedCompiler>(automata, nullptr);
    return wrapRegexObject(make_shared<RegexObject>(RegexSource("a(b)?c", 0),
                                                    compiler));
}

lzs_result_t *searchOrFail(lzs_regex_t *regex, const string &data,
                           unsigned from) {
    lzs_result_t *result = nullptr;
    lzs_error_t err = lzs_search(regex, data.c_str(), data.size(), from,
                                 &result);
    EXPECT_EQ(LZS_SUCCESS, err);
    EXPECT_TRUE(result != nullptr);
    return result;
}
