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

#include "dfa/rdfa.h"
#include "dfa/dfa_exec.h"
#include "dfa/tagged_exec.h"
#include "util/compile_error.h"
#include "test_automata.h"
#include "gtest/gtest.h"

using namespace std;
using namespace lzs;

TEST(rdfa, ctor) {
    raw_dfa raw(3);
    ASSERT_EQ(1U, raw.states.size()); // dead state only
    EXPECT_EQ(DEAD_STATE, raw.start_anchored);
    EXPECT_EQ(DEAD_STATE, raw.start_floating);
    EXPECT_FALSE(raw.states[DEAD_STATE].accept);
    EXPECT_EQ(3U, raw.states[DEAD_STATE].next.size());

    dstate_id_t s = raw.addState();
    EXPECT_EQ(1U, s);
    for (const auto &succ : raw.states[s].next) {
        EXPECT_EQ(DEAD_STATE, succ);
    }

    ASSERT_NO_THROW(checkRawDfa(raw));
}

TEST(rdfa, tagged_states_stay_parallel) {
    raw_tagged_dfa raw(2, 3);
    EXPECT_EQ(raw.states.size(), raw.state_tags.size());
    raw.addState();
    raw.addState();
    EXPECT_EQ(3U, raw.states.size());
    EXPECT_EQ(raw.states.size(), raw.state_tags.size());
    EXPECT_EQ(2U, raw.state_tags[2].tran.size());
    ASSERT_NO_THROW(checkRawTaggedDfa(raw));
}

TEST(rdfa, empty_alphabet) {
    raw_dfa raw(0);
    ASSERT_THROW(checkRawDfa(raw), CompileError);
}

TEST(rdfa, remap_outside_alphabet) {
    raw_dfa raw(2);
    raw.alpha_remap['q'] = 2;
    ASSERT_THROW(checkRawDfa(raw), CompileError);
}

TEST(rdfa, missing_start_state) {
    raw_dfa raw(2);
    raw.addState();
    raw.start_floating = 2;
    ASSERT_THROW(checkRawDfa(raw), CompileError);
}

TEST(rdfa, missing_successor) {
    raw_dfa raw(2);
    dstate_id_t s = raw.addState();
    raw.states[s].next[1] = 7;
    ASSERT_THROW(checkRawDfa(raw), CompileError);
}

TEST(rdfa, short_transition_row) {
    raw_dfa raw(2);
    dstate_id_t s = raw.addState();
    raw.states[s].next.pop_back();
    ASSERT_THROW(checkRawDfa(raw), CompileError);
}

TEST(rdfa, live_dead_state) {
    raw_dfa raw(2);
    dstate_id_t s = raw.addState();
    raw.states[DEAD_STATE].next[0] = s;
    ASSERT_THROW(checkRawDfa(raw), CompileError);

    raw_dfa raw2(2);
    raw2.states[DEAD_STATE].accept = true;
    ASSERT_THROW(checkRawDfa(raw2), CompileError);
}

TEST(rdfa, executor_rejects_malformed) {
    raw_dfa raw(2);
    raw.start_anchored = 5;
    ASSERT_THROW(DfaExecutor(raw, dfa_props()), CompileError);
}

TEST(rdfa, tagged_no_groups) {
    raw_tagged_dfa raw(2, 0);
    ASSERT_THROW(checkRawTaggedDfa(raw), CompileError);
}

TEST(rdfa, tagged_register_out_of_range) {
    raw_tagged_dfa raw(2, 1);
    setAlphabet(raw, "a");
    dstate_id_t s = raw.addState();
    addTaggedEdge(raw, s, 'a', s, {tag_op(2, false)});
    ASSERT_THROW(checkRawTaggedDfa(raw), CompileError);

    raw_tagged_dfa raw2(2, 1);
    dstate_id_t s2 = raw2.addState();
    raw2.state_tags[s2].accept.push_back(tag_op(5, true));
    ASSERT_THROW(checkRawTaggedDfa(raw2), CompileError);
}

TEST(rdfa, tagged_table_mismatch) {
    raw_tagged_dfa raw(2, 1);
    raw.raw_dfa::addState(); // bypasses the tag table
    ASSERT_THROW(checkRawTaggedDfa(raw), CompileError);
}
