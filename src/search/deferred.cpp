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

#include "deferred.h"
#include "automata.h"
#include "match_profile.h"
#include "util/contract_error.h"

#include <utility>

using namespace std;

namespace lzs {

DeferredScan::DeferredScan(shared_ptr<const CompiledAutomata> automata_in,
                           shared_ptr<MatchProfile> profile_in,
                           const u8 *buf_in, size_t len_in,
                           s64a from_index_in)
    : automata_ptr(move(automata_in)), profile(move(profile_in)),
      buf(buf_in), len(len_in), from_index(from_index_in) {
    assert(automata_ptr);
}

s64a DeferredScan::runBackward(s64a end) const {
    const Automaton *backward = automata_ptr->backward.get();
    if (!backward) {
        throw ContractError("No backward automaton to find the match "
                            "start.");
    }

    s64a floor = backwardScanFloor(from_index,
                                   automata_ptr->forward->prefixLength());
    DEBUG_PRINTF("backward scan from %lld down to %lld\n", end - 1, floor);
    MatchOutcome mo = backward->execute(buf, len, 0, end - 1, floor);
    if (!mo.matched()) {
        throw ContractError("Backward automaton rejected a forward match.");
    }
    return mo.value;
}

s64a DeferredScan::findStart(s64a end) const {
    s64a start = runBackward(end) + 1;
    assert(start <= end);
    return start;
}

u32 DeferredScan::findTraceIndex(s64a end) const {
    s64a idx = runBackward(end);
    if (idx < 0 || idx >= (s64a)automata_ptr->precalc.size()) {
        throw ContractError("Backward automaton reported an unknown "
                            "precalculated result.");
    }
    return (u32)idx;
}

vector<s64a> DeferredScan::captureGroups(s64a start, s64a end) const {
    const Automaton *cg = automata_ptr->capture_groups.get();
    if (!cg) {
        throw ContractError("No capture group automaton to resolve groups.");
    }

    if (profile) {
        profile->incCaptureGroupAccesses();
    }

    DEBUG_PRINTF("capture group scan over [%lld, %lld)\n", start, end);
    MatchOutcome mo = cg->execute(buf, len, from_index, start, end);
    if (mo.type != MatchOutcome::GROUPS) {
        throw ContractError("Capture group automaton rejected a known "
                            "match.");
    }
    assert(mo.offsets.size() == automata_ptr->numGroups() * 2);
    return move(mo.offsets);
}

} // namespace lzs
