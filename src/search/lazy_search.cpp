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

#include "lazy_search.h"
#include "automata.h"
#include "match_profile.h"
#include "util/contract_error.h"

#include <utility>

using namespace std;

namespace lzs {

LazySearch::LazySearch(shared_ptr<const CompiledAutomata> automata_in,
                       shared_ptr<MatchProfile> profile_in)
    : automata(move(automata_in)), profile(move(profile_in)) {
    assert(automata);
}

DeferredScan LazySearch::bind(const u8 *buf, size_t len,
                              s64a from_index) const {
    return DeferredScan(automata, profile, buf, len, from_index);
}

RegexResult LazySearch::run(const u8 *buf, size_t len,
                            s64a from_index) const {
    const Automaton *backward = automata->backward.get();
    if (backward && backward->isAnchored()) {
        return executeBackwardAnchored(buf, len, from_index);
    }
    return executeForward(buf, len, from_index);
}

RegexResult LazySearch::executeForward(const u8 *buf, size_t len,
                                       s64a from_index) const {
    const Automaton &forward = *automata->forward;
    MatchOutcome mo = forward.execute(buf, len, from_index, from_index,
                                      (s64a)len);
    if (!mo.matched()) {
        return RegexResult::noMatch();
    }

    const s64a end = mo.value;
    assert(end >= from_index && end <= (s64a)len);

    if (automata->singlePreCalcResult()) {
        DEBUG_PRINTF("single precalculated result, end %lld\n", end);
        return automata->precalc[0].createFromEnd(end);
    }

    if (automata->precalc.empty() && !automata->capture_groups) {
        if (end == from_index) { // zero-length match
            return RegexResult::single(end, end);
        }
        if (forward.isAnchored() || automata->isSticky()) {
            return RegexResult::single(from_index, end);
        }
        DEBUG_PRINTF("start deferred, end %lld\n", end);
        return RegexResult::singleLazyStart(bind(buf, len, from_index), end);
    }

    if (!automata->precalc.empty()) {
        DEBUG_PRINTF("trace finder, end %lld\n", end);
        return RegexResult::traceFinder(bind(buf, len, from_index), end);
    }

    if (forward.isAnchored()
        || (automata->isSticky() && !forward.prefixLength())) {
        DEBUG_PRINTF("groups deferred, match [%lld, %lld)\n", from_index,
                     end);
        return RegexResult::lazyCaptureGroups(bind(buf, len, from_index),
                                              from_index, end);
    }

    DEBUG_PRINTF("start and groups deferred, end %lld\n", end);
    return RegexResult::lazyCaptureGroups(bind(buf, len, from_index), end);
}

RegexResult LazySearch::executeBackwardAnchored(const u8 *buf, size_t len,
                                                s64a from_index) const {
    const s64a input_len = (s64a)len;
    s64a floor = backwardScanFloor(from_index,
                                   automata->forward->prefixLength());
    MatchOutcome mo = automata->backward->execute(buf, len, 0, input_len - 1,
                                                  floor);
    if (!mo.matched()) {
        return RegexResult::noMatch();
    }

    if (automata->multiplePreCalcResults()) { // trace finder
        s64a idx = mo.value;
        if (idx < 0 || idx >= (s64a)automata->precalc.size()) {
            throw ContractError("Backward automaton reported an unknown "
                                "precalculated result.");
        }
        return automata->precalc[idx].createFromEnd(input_len);
    }

    const s64a start = mo.value + 1;
    DEBUG_PRINTF("anchored backward scan found start %lld\n", start);

    if (automata->singlePreCalcResult()) {
        return automata->precalc[0].createFromStart(start);
    }

    if (automata->capture_groups) {
        return RegexResult::lazyCaptureGroups(bind(buf, len, from_index),
                                              start, input_len);
    }

    return RegexResult::single(start, input_len);
}

} // namespace lzs
