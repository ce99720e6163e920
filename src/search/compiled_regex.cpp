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

#include "compiled_regex.h"
#include "automata.h"
#include "grey.h"
#include "match_profile.h"
#include "regex_compiler.h"
#include "util/compile_error.h"
#include "util/contract_error.h"

#include <string>
#include <utility>

using namespace std;

namespace lzs {

RegexCompiler::~RegexCompiler() {}

CompiledRegex::CompiledRegex(RegexSource source_in,
                             shared_ptr<const CompiledAutomata> automata_in,
                             shared_ptr<const RegexCompiler> compiler_in,
                             const Grey &grey)
    : source(move(source_in)), automata(move(automata_in)),
      compiler(move(compiler_in)), profile(make_shared<MatchProfile>(grey)),
      profile_searches(grey.profileSearches),
      allow_eager(grey.allowEagerMatching), lazy(automata, profile),
      state(STRATEGY_LAZY) {
    assert(automata);
}

CompiledRegex::~CompiledRegex() {}

RegexResult CompiledRegex::search(const u8 *buf, size_t len,
                                  s64a from_index) {
    if (from_index < 0 || from_index > (s64a)len) {
        throw OutOfRangeError("Search index " + to_string(from_index)
                              + " is outside the input of length "
                              + to_string(len) + ".");
    }

    if (strategyState() == STRATEGY_EAGER) {
        assert(eager);
        return eager->run(buf, len, from_index);
    }

    RegexResult rv = lazy.run(buf, len, from_index);
    if (profile_searches && strategyState() == STRATEGY_LAZY) {
        profileSearch(rv);
    }
    return rv;
}

void CompiledRegex::profileSearch(const RegexResult &rv) {
    if (profile->atEvaluationTripPoint() &&
        profile->shouldUseEagerMatching()) {
        switchToEager();
    }
    profile->incCalls();
    if (rv.isMatch()) {
        profile->incMatches();
    }
}

void CompiledRegex::switchToEager() {
    lock_guard<mutex> guard(switch_lock);
    if (state.load(memory_order_relaxed) != STRATEGY_LAZY) {
        return; // another search got here first
    }

    shared_ptr<const Automaton> executor;
    if (allow_eager && compiler) {
        try {
            executor = compiler->compileEager(source);
        } catch (const CompileError &e) {
            DEBUG_PRINTF("eager compile failed: %s\n", e.reason.c_str());
        }
    }

    if (!executor || !executor->numCaptureGroups()) {
        DEBUG_PRINTF("eager matching unavailable for /%s/\n",
                     source.pattern.c_str());
        state.store(STRATEGY_EAGER_UNAVAILABLE, memory_order_release);
        return;
    }

    DEBUG_PRINTF("switching /%s/ to eager matching\n",
                 source.pattern.c_str());
    eager.reset(new EagerSearch(move(executor)));
    state.store(STRATEGY_EAGER, memory_order_release);
}

} // namespace lzs
