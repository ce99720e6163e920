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

#include "test_automata.h"
#include "lzs_common.h"
#include "util/compile_error.h"

using namespace std;

namespace lzs {

void setAlphabet(raw_dfa &raw, const string &chars) {
    assert(raw.alpha_size == chars.size() + 1);
    raw.alpha_remap.fill(0);
    for (size_t i = 0; i < chars.size(); i++) {
        raw.alpha_remap[(u8)chars[i]] = i + 1;
    }
}

void addEdge(raw_dfa &raw, dstate_id_t from, char c, dstate_id_t to) {
    raw.states[from].next[raw.alpha_remap[(u8)c]] = to;
}

void addDefaultEdge(raw_dfa &raw, dstate_id_t from, dstate_id_t to) {
    for (auto &succ : raw.states[from].next) {
        if (succ == DEAD_STATE) {
            succ = to;
        }
    }
}

void addTaggedEdge(raw_tagged_dfa &raw, dstate_id_t from, char c,
                   dstate_id_t to, const vector<tag_op> &ops) {
    addEdge(raw, from, c, to);
    tag_op_list &tags = raw.state_tags[from].tran[raw.alpha_remap[(u8)c]];
    tags.insert(tags.end(), ops.begin(), ops.end());
}

static
dfa_props backwardProps(bool anchored = false) {
    dfa_props props;
    props.direction = SCAN_BACKWARD;
    props.anchored = anchored;
    return props;
}

shared_ptr<const Automaton> abcForward(bool floating) {
    raw_dfa raw(4);
    setAlphabet(raw, "abc");
    dstate_id_t s = raw.addState();
    dstate_id_t a = raw.addState();
    dstate_id_t b = raw.addState();
    dstate_id_t c = raw.addState();
    addEdge(raw, s, 'a', a);
    addEdge(raw, a, 'b', b);
    addEdge(raw, a, 'c', c);
    addEdge(raw, b, 'c', c);
    if (floating) {
        addEdge(raw, a, 'a', a);
        addEdge(raw, b, 'a', a);
        addDefaultEdge(raw, s, s);
        addDefaultEdge(raw, a, s);
        addDefaultEdge(raw, b, s);
    }
    raw.states[c].accept = true;
    raw.start_anchored = s;
    raw.start_floating = s;
    return make_shared<DfaExecutor>(raw, dfa_props());
}

shared_ptr<const Automaton> abcBackward() {
    raw_dfa raw(4);
    setAlphabet(raw, "abc");
    dstate_id_t r0 = raw.addState();
    dstate_id_t r1 = raw.addState();
    dstate_id_t r2 = raw.addState();
    dstate_id_t r3 = raw.addState();
    addEdge(raw, r0, 'c', r1);
    addEdge(raw, r1, 'b', r2);
    addEdge(raw, r1, 'a', r3);
    addEdge(raw, r2, 'a', r3);
    raw.states[r3].accept = true;
    raw.start_anchored = r0;
    raw.start_floating = r0;
    return make_shared<DfaExecutor>(raw, backwardProps());
}

shared_ptr<const Automaton> abcCaptureGroups() {
    raw_tagged_dfa raw(4, 2);
    setAlphabet(raw, "abc");
    dstate_id_t s = raw.addState();
    dstate_id_t a = raw.addState();
    dstate_id_t b = raw.addState();
    dstate_id_t c = raw.addState();
    addTaggedEdge(raw, s, 'a', a, {tag_op(0, false)});
    addTaggedEdge(raw, a, 'b', b, {tag_op(2, false)});
    addTaggedEdge(raw, a, 'c', c, {});
    addTaggedEdge(raw, b, 'c', c, {tag_op(3, false)});
    raw.states[c].accept = true;
    raw.state_tags[c].accept.push_back(tag_op(1, false));
    raw.start_anchored = s;
    raw.start_floating = s;
    return make_shared<TaggedDfaExecutor>(raw, dfa_props());
}

shared_ptr<const Automaton> abcEager() {
    const vector<tag_op> restart = {tag_op(0, false), tag_op(2, true),
                                    tag_op(3, true)};
    raw_tagged_dfa raw(4, 2);
    setAlphabet(raw, "abc");
    dstate_id_t s = raw.addState();
    dstate_id_t a = raw.addState();
    dstate_id_t b = raw.addState();
    dstate_id_t c = raw.addState();
    addTaggedEdge(raw, s, 'a', a, restart);
    addTaggedEdge(raw, a, 'a', a, restart);
    addTaggedEdge(raw, a, 'b', b, {tag_op(2, false)});
    addTaggedEdge(raw, a, 'c', c, {});
    addTaggedEdge(raw, b, 'a', a, restart);
    addTaggedEdge(raw, b, 'c', c, {tag_op(3, false)});
    addDefaultEdge(raw, s, s);
    addDefaultEdge(raw, a, s);
    addDefaultEdge(raw, b, s);
    raw.states[c].accept = true;
    raw.state_tags[c].accept.push_back(tag_op(1, false));
    raw.start_anchored = s;
    raw.start_floating = s;
    return make_shared<TaggedDfaExecutor>(raw, dfa_props());
}

shared_ptr<const CompiledAutomata> abcLazyAutomata(u32 flags) {
    bool sticky = flags & LZS_FLAG_STICKY;
    return make_shared<CompiledAutomata>(abcForward(!sticky), abcBackward(),
                                         abcCaptureGroups(),
                                         vector<PrecalculatedResultFactory>(),
                                         flags);
}

shared_ptr<const Automaton> anchoredAbcForward() {
    raw_dfa raw(4);
    setAlphabet(raw, "abc");
    dstate_id_t s0 = raw.addState();
    dstate_id_t s1 = raw.addState();
    dstate_id_t s2 = raw.addState();
    dstate_id_t s3 = raw.addState();
    addEdge(raw, s0, 'a', s1);
    addEdge(raw, s1, 'b', s2);
    addEdge(raw, s2, 'c', s3);
    raw.states[s3].accept = true;
    raw.start_anchored = s0;
    raw.start_floating = s0;

    dfa_props props;
    props.anchored = true;
    return make_shared<DfaExecutor>(raw, props);
}

shared_ptr<const Automaton> bcForward() {
    raw_dfa raw(3);
    setAlphabet(raw, "bc");
    dstate_id_t s = raw.addState();
    dstate_id_t b = raw.addState();
    dstate_id_t c = raw.addState();
    addEdge(raw, s, 'b', b);
    addEdge(raw, b, 'b', b);
    addEdge(raw, b, 'c', c);
    addDefaultEdge(raw, s, s);
    addDefaultEdge(raw, b, s);
    raw.states[c].accept = true;
    raw.start_anchored = s;
    raw.start_floating = s;
    return make_shared<DfaExecutor>(raw, dfa_props());
}

shared_ptr<const Automaton> bcEndBackward() {
    raw_dfa raw(3);
    setAlphabet(raw, "bc");
    dstate_id_t r0 = raw.addState();
    dstate_id_t r1 = raw.addState();
    dstate_id_t r2 = raw.addState();
    addEdge(raw, r0, 'c', r1);
    addEdge(raw, r1, 'b', r2);
    raw.states[r2].accept = true;
    raw.start_anchored = r0;
    raw.start_floating = DEAD_STATE; // only matches at the end of input
    return make_shared<DfaExecutor>(raw, backwardProps(true));
}

shared_ptr<const Automaton> acOrBcForward() {
    raw_dfa raw(4);
    setAlphabet(raw, "abc");
    dstate_id_t s = raw.addState();
    dstate_id_t a = raw.addState();
    dstate_id_t c = raw.addState();
    addEdge(raw, s, 'a', a);
    addEdge(raw, s, 'b', a);
    addEdge(raw, a, 'a', a);
    addEdge(raw, a, 'b', a);
    addEdge(raw, a, 'c', c);
    addDefaultEdge(raw, s, s);
    addDefaultEdge(raw, a, s);
    raw.states[c].accept = true;
    raw.start_anchored = s;
    raw.start_floating = s;
    return make_shared<DfaExecutor>(raw, dfa_props());
}

shared_ptr<const Automaton> acOrBcTraceBackward(bool anchored) {
    raw_dfa raw(4);
    setAlphabet(raw, "abc");
    dstate_id_t r0 = raw.addState();
    dstate_id_t r1 = raw.addState();
    dstate_id_t x0 = raw.addState();
    dstate_id_t x1 = raw.addState();
    addEdge(raw, r0, 'c', r1);
    addEdge(raw, r1, 'a', x0);
    addEdge(raw, r1, 'b', x1);
    raw.states[x0].accept = true;
    raw.states[x0].report = 0;
    raw.states[x1].accept = true;
    raw.states[x1].report = 1;
    raw.start_anchored = r0;
    raw.start_floating = anchored ? DEAD_STATE : r0;

    dfa_props props = backwardProps(anchored);
    props.report_result = true;
    return make_shared<DfaExecutor>(raw, props);
}

vector<PrecalculatedResultFactory> acOrBcPrecalc() {
    vector<PrecalculatedResultFactory> rv;
    rv.push_back(PrecalculatedResultFactory({0, 2, 0, 1, GROUP_UNSET,
                                             GROUP_UNSET}, 2));
    rv.push_back(PrecalculatedResultFactory({0, 2, GROUP_UNSET, GROUP_UNSET,
                                             0, 1}, 2));
    return rv;
}

shared_ptr<const Automaton> acOrBcEager() {
    const vector<tag_op> restart_a = {tag_op(0, false), tag_op(2, false),
                                      tag_op(3, true), tag_op(4, true),
                                      tag_op(5, true)};
    const vector<tag_op> restart_b = {tag_op(0, false), tag_op(2, true),
                                      tag_op(3, true), tag_op(4, false),
                                      tag_op(5, true)};
    raw_tagged_dfa raw(4, 3);
    setAlphabet(raw, "abc");
    dstate_id_t s = raw.addState();
    dstate_id_t a = raw.addState();
    dstate_id_t b = raw.addState();
    dstate_id_t c = raw.addState();
    for (dstate_id_t from : {s, a, b}) {
        addTaggedEdge(raw, from, 'a', a, restart_a);
        addTaggedEdge(raw, from, 'b', b, restart_b);
    }
    addTaggedEdge(raw, a, 'c', c, {tag_op(3, false)});
    addTaggedEdge(raw, b, 'c', c, {tag_op(5, false)});
    addDefaultEdge(raw, s, s);
    addDefaultEdge(raw, a, s);
    addDefaultEdge(raw, b, s);
    raw.states[c].accept = true;
    raw.state_tags[c].accept.push_back(tag_op(1, false));
    raw.start_anchored = s;
    raw.start_floating = s;
    return make_shared<TaggedDfaExecutor>(raw, dfa_props());
}

shared_ptr<const Automaton> xStarForward() {
    raw_dfa raw(2);
    setAlphabet(raw, "x");
    dstate_id_t s = raw.addState();
    addEdge(raw, s, 'x', s);
    raw.states[s].accept = true;
    raw.start_anchored = s;
    raw.start_floating = s;
    return make_shared<DfaExecutor>(raw, dfa_props());
}

shared_ptr<const Automaton> xStarBackward() {
    raw_dfa raw(2);
    setAlphabet(raw, "x");
    dstate_id_t r = raw.addState();
    addEdge(raw, r, 'x', r);
    raw.states[r].accept = true;
    raw.start_anchored = r;
    raw.start_floating = r;
    return make_shared<DfaExecutor>(raw, backwardProps());
}

shared_ptr<const CompiledAutomata>
FixedCompiler::compile(const RegexSource &source) const {
    compile_calls++;
    if (crash_compile) {
        throw std::runtime_error("compiler crashed");
    }
    if (fail_compile) {
        throw CompileError("Pattern /" + source.pattern
                           + "/ is not supported.");
    }
    return lazy;
}

shared_ptr<const Automaton>
FixedCompiler::compileEager(const RegexSource &source) const {
    eager_calls++;
    if (fail_eager) {
        throw CompileError("Pattern /" + source.pattern
                           + "/ has no eager automaton.");
    }
    return eager;
}

} // namespace lzs
