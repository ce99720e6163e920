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

#include "tagged_exec.h"
#include "util/compile_error.h"

using namespace std;

namespace lzs {

TaggedDfaExecutor::TaggedDfaExecutor(const raw_tagged_dfa &raw,
                                     const dfa_props &props_in)
    : props(props_in), num_groups(raw.num_groups), alpha_size(raw.alpha_size),
      remap(raw.alpha_remap), accepts(raw.states.size()),
      start_anchored(raw.start_anchored), start_floating(raw.start_floating) {
    checkRawTaggedDfa(raw);

    if (props.direction != SCAN_FORWARD || props.report_result) {
        throw CompileError("Tagged DFA must be a forward position scan.");
    }

    const size_t num_states = raw.states.size();
    succ_table.reserve(num_states * alpha_size);
    tran_ops.reserve(num_states * alpha_size);
    accept_ops.reserve(num_states);

    for (size_t i = 0; i < num_states; i++) {
        const dstate &ds = raw.states[i];
        const dstate_tags &dt = raw.state_tags[i];
        for (u32 sym = 0; sym < alpha_size; sym++) {
            succ_table.push_back(ds.next[sym]);
            tran_ops.push_back(appendOps(dt.tran[sym]));
        }
        accept_ops.push_back(appendOps(dt.accept));
        accepts.set(i, ds.accept);
    }

    DEBUG_PRINTF("built tagged dfa: %zu states, %u groups, %zu tag ops\n",
                 num_states, num_groups, ops.size());
}

TaggedDfaExecutor::~TaggedDfaExecutor() {}

TaggedDfaExecutor::op_range TaggedDfaExecutor::appendOps(
        const tag_op_list &list) {
    op_range r;
    r.begin = ops.size();
    ops.insert(ops.end(), list.begin(), list.end());
    r.end = ops.size();
    return r;
}

void TaggedDfaExecutor::applyOps(op_range r, s64a idx,
                                 vector<s64a> &regs) const {
    for (u32 i = r.begin; i < r.end; i++) {
        const tag_op &op = ops[i];
        assert(op.reg < regs.size());
        regs[op.reg] = op.clear ? GROUP_UNSET : idx;
    }
}

MatchOutcome TaggedDfaExecutor::execute(const u8 *buf, size_t len,
                                        UNUSED s64a from_index,
                                        s64a start_index,
                                        s64a max_index) const {
    assert(buf || !len);
    assert(start_index >= 0 && start_index <= max_index);
    assert(max_index <= (s64a)len);

    s64a idx = start_index;
    dstate_id_t s = idx == 0 ? start_anchored : start_floating;
    if (s == DEAD_STATE) {
        return MatchOutcome::noMatch();
    }

    vector<s64a> regs(num_groups * 2, GROUP_UNSET);
    vector<s64a> last;

    if (accepts.test(s)) {
        last = regs;
        applyOps(accept_ops[s], idx, last);
    }

    while (idx < max_index) {
        size_t t = (size_t)s * alpha_size + remap[buf[idx]];
        applyOps(tran_ops[t], idx, regs);
        s = succ_table[t];
        idx++;
        if (s == DEAD_STATE) {
            break;
        }
        if (accepts.test(s)) {
            last = regs;
            applyOps(accept_ops[s], idx, last);
        }
    }

    if (last.empty()) {
        DEBUG_PRINTF("no match in [%lld, %lld)\n", start_index, max_index);
        return MatchOutcome::noMatch();
    }

    DEBUG_PRINTF("match [%lld, %lld)\n", last[0], last[1]);
    return MatchOutcome::groups(move(last));
}

} // namespace lzs
