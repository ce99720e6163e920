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

#include "automata.h"
#include "lzs_common.h"
#include "util/contract_error.h"

#include <utility>

using namespace std;

namespace lzs {

CompiledAutomata::CompiledAutomata(shared_ptr<const Automaton> forward_in,
                                   shared_ptr<const Automaton> backward_in,
                                   shared_ptr<const Automaton> capture_groups_in,
                                   vector<PrecalculatedResultFactory> precalc_in,
                                   u32 flags_in)
    : forward(move(forward_in)), backward(move(backward_in)),
      capture_groups(move(capture_groups_in)), precalc(move(precalc_in)),
      flags(flags_in) {
    if (!forward) {
        throw ContractError("A forward automaton is required.");
    }

    if (backward && backward->numCaptureGroups()) {
        throw ContractError("The backward automaton must report offsets.");
    }

    if (capture_groups && !capture_groups->numCaptureGroups()) {
        throw ContractError("The capture group automaton must report "
                            "groups.");
    }

    for (const auto &f : precalc) {
        if (f.numGroups() != precalc.front().numGroups() ||
            (capture_groups &&
             f.numGroups() != capture_groups->numCaptureGroups())) {
            throw ContractError("Precalculated results disagree on the "
                                "number of groups.");
        }
    }

    if (backward) {
        return;
    }

    /* Without a backward automaton, every forward search must be able to
     * place the match start without one. */
    bool start_known = forward->isAnchored() || isSticky();
    bool needs_backward;
    if (singlePreCalcResult()) {
        needs_backward = false;
    } else if (multiplePreCalcResults()) {
        needs_backward = true;
    } else if (!capture_groups) {
        needs_backward = !start_known;
    } else {
        needs_backward = !forward->isAnchored()
                      && !(isSticky() && !forward->prefixLength());
    }

    if (needs_backward) {
        throw ContractError("A backward automaton is required to find the "
                            "start of a match.");
    }
}

bool CompiledAutomata::isSticky() const {
    return flags & LZS_FLAG_STICKY;
}

u32 CompiledAutomata::numGroups() const {
    if (!precalc.empty()) {
        return precalc.front().numGroups();
    }
    if (capture_groups) {
        return capture_groups->numCaptureGroups();
    }
    return 1;
}

} // namespace lzs
