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

#include "dfa/dfa_exec.h"
#include "test_automata.h"
#include "gtest/gtest.h"

#include <string>

using namespace std;
using namespace lzs;

static
MatchOutcome runForward(const Automaton &dfa, const string &s, s64a from) {
    return dfa.execute(bytes(s), s.size(), from, from, s.size());
}

static
MatchOutcome runBackward(const Automaton &dfa, const string &s, s64a end,
                         s64a floor) {
    return dfa.execute(bytes(s), s.size(), 0, end - 1, floor);
}

TEST(dfa_exec, props) {
    auto fwd = abcForward();
    EXPECT_FALSE(fwd->isAnchored());
    EXPECT_EQ(0U, fwd->prefixLength());
    EXPECT_EQ(0U, fwd->numCaptureGroups());

    auto anchored = anchoredAbcForward();
    EXPECT_TRUE(anchored->isAnchored());

    dfa_props props;
    props.direction = SCAN_BACKWARD;
    props.prefix_len = 2;
    DfaExecutor rev(raw_dfa(1), props);
    EXPECT_EQ(SCAN_BACKWARD, rev.direction());
    EXPECT_EQ(2U, rev.prefixLength());
}

TEST(dfa_exec, forward_finds_end) {
    auto fwd = abcForward();

    MatchOutcome mo = runForward(*fwd, "abc", 0);
    ASSERT_EQ(MatchOutcome::OFFSET, mo.type);
    EXPECT_EQ(3, mo.value);

    mo = runForward(*fwd, "xxacyy", 0);
    ASSERT_TRUE(mo.matched());
    EXPECT_EQ(4, mo.value);

    mo = runForward(*fwd, "abac", 0);
    ASSERT_TRUE(mo.matched());
    EXPECT_EQ(4, mo.value);
}

TEST(dfa_exec, forward_no_match) {
    auto fwd = abcForward();
    EXPECT_FALSE(runForward(*fwd, "", 0).matched());
    EXPECT_FALSE(runForward(*fwd, "abbc", 0).matched());
    EXPECT_FALSE(runForward(*fwd, "ab", 0).matched());

    // the match lies before the start index
    EXPECT_FALSE(runForward(*fwd, "abc", 1).matched());
}

TEST(dfa_exec, forward_stops_at_max_index) {
    auto fwd = abcForward();
    const string s = "xabc";
    EXPECT_FALSE(fwd->execute(bytes(s), s.size(), 0, 0, 3).matched());

    MatchOutcome mo = fwd->execute(bytes(s), s.size(), 0, 0, 4);
    ASSERT_TRUE(mo.matched());
    EXPECT_EQ(4, mo.value);
}

TEST(dfa_exec, forward_start_states) {
    // anchored start is only used at index 0
    raw_dfa raw(2);
    setAlphabet(raw, "a");
    dstate_id_t s = raw.addState();
    dstate_id_t t = raw.addState();
    addEdge(raw, s, 'a', t);
    raw.states[t].accept = true;
    raw.start_anchored = s;
    raw.start_floating = DEAD_STATE;
    DfaExecutor dfa(raw, dfa_props());

    const string in = "aa";
    MatchOutcome mo = dfa.execute(bytes(in), in.size(), 0, 0, in.size());
    ASSERT_TRUE(mo.matched());
    EXPECT_EQ(1, mo.value);
    EXPECT_FALSE(dfa.execute(bytes(in), in.size(), 1, 1, in.size()).matched());
}

TEST(dfa_exec, forward_empty_match) {
    auto fwd = xStarForward();

    MatchOutcome mo = runForward(*fwd, "abc", 1);
    ASSERT_TRUE(mo.matched());
    EXPECT_EQ(1, mo.value);

    mo = runForward(*fwd, "xxa", 0);
    ASSERT_TRUE(mo.matched());
    EXPECT_EQ(2, mo.value); // longest

    mo = runForward(*fwd, "", 0);
    ASSERT_TRUE(mo.matched());
    EXPECT_EQ(0, mo.value);
}

TEST(dfa_exec, backward_finds_start) {
    auto rev = abcBackward();

    // the reported value is one before the match start
    MatchOutcome mo = runBackward(*rev, "abc", 3, -1);
    ASSERT_EQ(MatchOutcome::OFFSET, mo.type);
    EXPECT_EQ(-1, mo.value);

    mo = runBackward(*rev, "xabc", 4, -1);
    ASSERT_TRUE(mo.matched());
    EXPECT_EQ(0, mo.value);

    mo = runBackward(*rev, "abac", 4, -1);
    ASSERT_TRUE(mo.matched());
    EXPECT_EQ(1, mo.value);
}

TEST(dfa_exec, backward_respects_floor) {
    auto rev = abcBackward();
    // "abc" ends at 4 but may not reach below index 2
    EXPECT_FALSE(runBackward(*rev, "xabc", 4, 2).matched());

    MatchOutcome mo = runBackward(*rev, "xabc", 4, 0);
    ASSERT_TRUE(mo.matched());
    EXPECT_EQ(0, mo.value);
}

TEST(dfa_exec, backward_anchored_start) {
    auto rev = bcEndBackward();
    EXPECT_TRUE(rev->isAnchored());

    MatchOutcome mo = runBackward(*rev, "abc", 3, -1);
    ASSERT_TRUE(mo.matched());
    EXPECT_EQ(0, mo.value);

    // only the last index uses the anchored start state
    EXPECT_FALSE(runBackward(*rev, "abcx", 3, -1).matched());
    EXPECT_FALSE(runBackward(*rev, "", 0, -1).matched());
}

TEST(dfa_exec, report_mode) {
    auto rev = acOrBcTraceBackward(false);

    MatchOutcome mo = runBackward(*rev, "zac", 3, -1);
    ASSERT_TRUE(mo.matched());
    EXPECT_EQ(0, mo.value);

    mo = runBackward(*rev, "zbc", 3, -1);
    ASSERT_TRUE(mo.matched());
    EXPECT_EQ(1, mo.value);

    EXPECT_FALSE(runBackward(*rev, "zcc", 3, -1).matched());
}
