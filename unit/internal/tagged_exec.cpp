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

#include "dfa/tagged_exec.h"
#include "util/compile_error.h"
#include "test_automata.h"
#include "gtest/gtest.h"

#include <string>
#include <vector>

using namespace std;
using namespace lzs;

static
MatchOutcome runGroups(const Automaton &dfa, const string &s, s64a start,
                       s64a end) {
    return dfa.execute(bytes(s), s.size(), start, start, end);
}

TEST(tagged_exec, props) {
    auto cg = abcCaptureGroups();
    EXPECT_EQ(2U, cg->numCaptureGroups());
    EXPECT_FALSE(cg->isAnchored());
    EXPECT_EQ(0U, cg->prefixLength());
}

TEST(tagged_exec, rejects_backward) {
    raw_tagged_dfa raw(1, 1);
    dfa_props props;
    props.direction = SCAN_BACKWARD;
    ASSERT_THROW(TaggedDfaExecutor(raw, props), CompileError);

    dfa_props report;
    report.report_result = true;
    ASSERT_THROW(TaggedDfaExecutor(raw, report), CompileError);
}

TEST(tagged_exec, group_present) {
    auto cg = abcCaptureGroups();
    MatchOutcome mo = runGroups(*cg, "abc", 0, 3);
    ASSERT_EQ(MatchOutcome::GROUPS, mo.type);
    EXPECT_EQ(vector<s64a>({0, 3, 1, 2}), mo.offsets);

    mo = runGroups(*cg, "xabc", 1, 4);
    ASSERT_EQ(MatchOutcome::GROUPS, mo.type);
    EXPECT_EQ(vector<s64a>({1, 4, 2, 3}), mo.offsets);
}

TEST(tagged_exec, group_absent) {
    auto cg = abcCaptureGroups();
    MatchOutcome mo = runGroups(*cg, "ac", 0, 2);
    ASSERT_EQ(MatchOutcome::GROUPS, mo.type);
    EXPECT_EQ(vector<s64a>({0, 2, GROUP_UNSET, GROUP_UNSET}), mo.offsets);
}

TEST(tagged_exec, no_match) {
    auto cg = abcCaptureGroups();
    EXPECT_EQ(MatchOutcome::NO_MATCH, runGroups(*cg, "abbc", 0, 4).type);
    EXPECT_EQ(MatchOutcome::NO_MATCH, runGroups(*cg, "abc", 0, 2).type);
}

TEST(tagged_exec, searching_restarts_clear_groups) {
    auto eager = abcEager();

    MatchOutcome mo = runGroups(*eager, "abac", 0, 4);
    ASSERT_EQ(MatchOutcome::GROUPS, mo.type);
    EXPECT_EQ(vector<s64a>({2, 4, GROUP_UNSET, GROUP_UNSET}), mo.offsets);

    mo = runGroups(*eager, "zzabcab", 0, 7);
    ASSERT_EQ(MatchOutcome::GROUPS, mo.type);
    EXPECT_EQ(vector<s64a>({2, 5, 3, 4}), mo.offsets);

    mo = runGroups(*eager, "zzabcab", 3, 7);
    EXPECT_EQ(MatchOutcome::NO_MATCH, mo.type);
}

TEST(tagged_exec, accept_at_start) {
    // (x*) accepts the empty string before consuming anything
    raw_tagged_dfa raw(2, 2);
    setAlphabet(raw, "x");
    dstate_id_t s = raw.addState();
    dstate_id_t t = raw.addState();
    addTaggedEdge(raw, s, 'x', t, {});
    addTaggedEdge(raw, t, 'x', t, {});
    raw.states[s].accept = true;
    raw.states[t].accept = true;
    raw.state_tags[s].accept.push_back(tag_op(0, false));
    raw.state_tags[s].accept.push_back(tag_op(1, false));
    raw.state_tags[s].accept.push_back(tag_op(2, false));
    raw.state_tags[s].accept.push_back(tag_op(3, false));
    raw.state_tags[s].tran[1].push_back(tag_op(0, false));
    raw.state_tags[s].tran[1].push_back(tag_op(2, false));
    raw.state_tags[t].accept.push_back(tag_op(1, false));
    raw.state_tags[t].accept.push_back(tag_op(3, false));
    raw.start_anchored = s;
    raw.start_floating = s;
    TaggedDfaExecutor dfa(raw, dfa_props());

    MatchOutcome mo = runGroups(dfa, "yy", 1, 2);
    ASSERT_EQ(MatchOutcome::GROUPS, mo.type);
    EXPECT_EQ(vector<s64a>({1, 1, 1, 1}), mo.offsets);

    mo = runGroups(dfa, "axx", 1, 3);
    ASSERT_EQ(MatchOutcome::GROUPS, mo.type);
    EXPECT_EQ(vector<s64a>({1, 3, 1, 3}), mo.offsets);
}
