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

#include "rdfa.h"

#include "util/compile_error.h"

#include <string>

using namespace std;

namespace lzs {

raw_dfa::raw_dfa(u16 alpha_size_in) : alpha_size(alpha_size_in) {
    alpha_remap.fill(0);
    states.push_back(dstate(alpha_size)); /* dead state */
}

// prevent weak vtables
raw_dfa::~raw_dfa() {}

dstate_id_t raw_dfa::addState(void) {
    states.push_back(dstate(alpha_size));
    return states.size() - 1;
}

raw_tagged_dfa::~raw_tagged_dfa() {}

dstate_id_t raw_tagged_dfa::addState(void) {
    dstate_id_t id = raw_dfa::addState();
    state_tags.push_back(dstate_tags(alpha_size));
    assert(state_tags.size() == states.size());
    return id;
}

static
void checkTagList(const tag_op_list &ops, u32 num_regs) {
    for (const auto &op : ops) {
        if (op.reg >= num_regs) {
            throw CompileError("Tag operation refers to register "
                               + to_string(op.reg) + " beyond the register "
                               "file.");
        }
    }
}

void checkRawDfa(const raw_dfa &raw) {
    if (!raw.alpha_size) {
        throw CompileError("DFA has an empty alphabet.");
    }

    if (raw.states.empty() || raw.states.size() > 0x10000) {
        throw CompileError("DFA has an unsupported number of states.");
    }

    for (u32 c = 0; c < N_CHARS; c++) {
        if (raw.alpha_remap[c] >= raw.alpha_size) {
            throw CompileError("DFA remaps a symbol outside its alphabet.");
        }
    }

    const size_t num_states = raw.states.size();
    if (raw.start_anchored >= num_states || raw.start_floating >= num_states) {
        throw CompileError("DFA start state does not exist.");
    }

    for (size_t i = 0; i < num_states; i++) {
        const dstate &ds = raw.states[i];
        if (ds.next.size() != raw.alpha_size) {
            throw CompileError("DFA state " + to_string(i)
                               + " has a malformed transition row.");
        }
        for (const dstate_id_t succ : ds.next) {
            if (succ >= num_states) {
                throw CompileError("DFA state " + to_string(i)
                                   + " has a successor that does not exist.");
            }
        }
    }

    const dstate &dead = raw.states[DEAD_STATE];
    if (dead.accept) {
        throw CompileError("DFA dead state must not accept.");
    }
    for (const dstate_id_t succ : dead.next) {
        if (succ != DEAD_STATE) {
            throw CompileError("DFA dead state must not have successors.");
        }
    }
}

void checkRawTaggedDfa(const raw_tagged_dfa &raw) {
    checkRawDfa(raw);

    if (!raw.num_groups) {
        throw CompileError("Tagged DFA must track at least the whole match.");
    }

    if (raw.state_tags.size() != raw.states.size()) {
        throw CompileError("Tagged DFA tag table does not match its states.");
    }

    const u32 num_regs = raw.num_groups * 2;
    for (const auto &st : raw.state_tags) {
        if (st.tran.size() != raw.alpha_size) {
            throw CompileError("Tagged DFA has a malformed tag row.");
        }
        for (const auto &ops : st.tran) {
            checkTagList(ops, num_regs);
        }
        checkTagList(st.accept, num_regs);
    }
}

} // namespace lzs
