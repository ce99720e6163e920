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

#include "dfa_exec.h"

using namespace std;

namespace lzs {

DfaExecutor::DfaExecutor(const raw_dfa &raw, const dfa_props &props_in)
    : props(props_in), alpha_size(raw.alpha_size), remap(raw.alpha_remap),
      accepts(raw.states.size()), start_anchored(raw.start_anchored),
      start_floating(raw.start_floating) {
    checkRawDfa(raw);

    succ_table.reserve(raw.states.size() * alpha_size);
    reports.reserve(raw.states.size());
    for (size_t i = 0; i < raw.states.size(); i++) {
        const dstate &ds = raw.states[i];
        succ_table.insert(succ_table.end(), ds.next.begin(), ds.next.end());
        accepts.set(i, ds.accept);
        reports.push_back(ds.report);
    }

    DEBUG_PRINTF("built %s dfa: %zu states, alpha %hu, anchored %d\n",
                 props.direction == SCAN_FORWARD ? "forward" : "backward",
                 raw.states.size(), alpha_size, (int)props.anchored);
}

DfaExecutor::~DfaExecutor() {}

MatchOutcome DfaExecutor::scanForward(const u8 *buf, s64a start_index,
                                      s64a max_index) const {
    s64a idx = start_index;
    dstate_id_t s = idx == 0 ? start_anchored : start_floating;
    if (s == DEAD_STATE) {
        return MatchOutcome::noMatch();
    }

    bool found = accepts.test(s);
    s64a rv = found ? resultFor(s, idx) : 0;

    while (idx < max_index) {
        s = next(s, buf[idx]);
        idx++;
        if (s == DEAD_STATE) {
            break;
        }
        if (accepts.test(s)) {
            found = true;
            rv = resultFor(s, idx);
        }
    }

    if (!found) {
        DEBUG_PRINTF("no match in [%lld, %lld)\n", start_index, max_index);
        return MatchOutcome::noMatch();
    }

    DEBUG_PRINTF("match result %lld\n", rv);
    return MatchOutcome::offset(rv);
}

MatchOutcome DfaExecutor::scanBackward(const u8 *buf, size_t len,
                                       s64a start_index,
                                       s64a max_index) const {
    s64a idx = start_index;
    dstate_id_t s = idx == (s64a)len - 1 ? start_anchored : start_floating;
    if (s == DEAD_STATE) {
        return MatchOutcome::noMatch();
    }

    bool found = accepts.test(s);
    s64a rv = found ? resultFor(s, idx) : 0;

    while (idx > max_index) {
        s = next(s, buf[idx]);
        idx--;
        if (s == DEAD_STATE) {
            break;
        }
        if (accepts.test(s)) {
            found = true;
            rv = resultFor(s, idx);
        }
    }

    if (!found) {
        DEBUG_PRINTF("no match in (%lld, %lld]\n", max_index, start_index);
        return MatchOutcome::noMatch();
    }

    DEBUG_PRINTF("match result %lld\n", rv);
    return MatchOutcome::offset(rv);
}

MatchOutcome DfaExecutor::execute(const u8 *buf, size_t len,
                                  UNUSED s64a from_index, s64a start_index,
                                  s64a max_index) const {
    assert(buf || !len);
    if (props.direction == SCAN_FORWARD) {
        assert(start_index >= 0 && start_index <= max_index);
        assert(max_index <= (s64a)len);
        return scanForward(buf, start_index, max_index);
    }

    assert(max_index >= -1 && max_index <= start_index);
    assert(start_index < (s64a)len);
    return scanBackward(buf, len, start_index, max_index);
}

} // namespace lzs
