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

#include "search/lazy_search.h"
#include "search/automata.h"
#include "search/match_profile.h"
#include "grey.h"
#include "lzs_common.h"
#include "util/contract_error.h"
#include "test_automata.h"
#include "gtest/gtest.h"

#include <memory>
#include <string>
#include <vector>

using namespace std;
using namespace lzs;

namespace {

/** Counts the scans a lazy search makes over one set of automata. */
class LazySearchTest : public testing::Test {
protected:
    void build(shared_ptr<const Automaton> fwd,
               shared_ptr<const Automaton> back,
               shared_ptr<const Automaton> groups,
               vector<PrecalculatedResultFactory> precalc, u32 flags = 0) {
        forward = make_shared<CountingAutomaton>(fwd);
        if (back) {
            backward = make_shared<CountingAutomaton>(back);
        }
        if (groups) {
            cg = make_shared<CountingAutomaton>(groups);
        }
        automata = make_shared<CompiledAutomata>(forward, backward, cg,
                                                 move(precalc), flags);
        profile = make_shared<MatchProfile>(Grey());
        search.reset(new LazySearch(automata, profile));
    }

    RegexResult run(const string &s, s64a from) {
        input = s;
        return search->run(bytes(input), input.size(), from);
    }

    u32 backwardScans() const {
        return backward ? backward->executions() : 0;
    }

    u32 groupScans() const { return cg ? cg->executions() : 0; }

    string input;
    shared_ptr<CountingAutomaton> forward;
    shared_ptr<CountingAutomaton> backward;
    shared_ptr<CountingAutomaton> cg;
    shared_ptr<const CompiledAutomata> automata;
    shared_ptr<MatchProfile> profile;
    unique_ptr<LazySearch> search;
};

} // namespace

TEST_F(LazySearchTest, NoMatchScansForwardOnly) {
    build(abcForward(), abcBackward(), abcCaptureGroups(), {});
    RegexResult r = run("xyzzy", 0);
    EXPECT_FALSE(r.isMatch());
    EXPECT_EQ(1U, forward->executions());
    EXPECT_EQ(0U, backwardScans());
    EXPECT_EQ(0U, groupScans());
}

TEST_F(LazySearchTest, GroupsDeferred) {
    build(abcForward(), abcBackward(), abcCaptureGroups(), {});
    RegexResult r = run("ac", 0);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(RegexResult::LAZY_CAPTURE_GROUPS, r.kind());
    EXPECT_EQ(2, r.end());
    EXPECT_EQ(0U, backwardScans());
    EXPECT_EQ(0U, groupScans());

    EXPECT_EQ(0, r.start());
    EXPECT_EQ(1U, backwardScans());
    EXPECT_EQ(0U, groupScans());

    EXPECT_EQ(GROUP_UNSET, r.groupStart(1));
    EXPECT_EQ(GROUP_UNSET, r.groupEnd(1));
    EXPECT_EQ(1U, groupScans());
}

TEST_F(LazySearchTest, GroupsResolved) {
    build(abcForward(), abcBackward(), abcCaptureGroups(), {});
    RegexResult r = run("xabc", 0);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(4, r.end());
    EXPECT_EQ(2, r.groupStart(1));
    EXPECT_EQ(3, r.groupEnd(1));

    r = run("abac", 0);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(2, r.start());
    EXPECT_EQ(4, r.end());
    EXPECT_EQ(GROUP_UNSET, r.groupStart(1));
}

TEST_F(LazySearchTest, BackwardScanStopsAtSearchStart) {
    build(abcForward(), abcBackward(), abcCaptureGroups(), {});
    RegexResult r = run("aabcac", 4);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(4, r.start());
    EXPECT_EQ(6, r.end());
    EXPECT_EQ(GROUP_UNSET, r.groupStart(1));
}

TEST_F(LazySearchTest, AnchoredForwardKnowsStart) {
    build(anchoredAbcForward(), nullptr, nullptr, {});
    RegexResult r = run("xabc", 1);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(RegexResult::SINGLE, r.kind());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(4, r.end());

    EXPECT_FALSE(run("xabc", 0).isMatch());
}

TEST_F(LazySearchTest, AnchoredForwardGroupsDeferred) {
    build(anchoredAbcForward(), nullptr, abcCaptureGroups(), {});
    RegexResult r = run("xabc", 1);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(RegexResult::LAZY_CAPTURE_GROUPS, r.kind());
    EXPECT_TRUE(r.startResolved());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(0U, groupScans());
    EXPECT_EQ(2, r.groupStart(1));
    EXPECT_EQ(3, r.groupEnd(1));
    EXPECT_EQ(1U, groupScans());
}

TEST_F(LazySearchTest, StickyKnowsStart) {
    build(abcForward(false), nullptr, nullptr, {}, LZS_FLAG_STICKY);
    RegexResult r = run("xabc", 1);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(RegexResult::SINGLE, r.kind());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(4, r.end());

    // sticky searches do not skip ahead
    EXPECT_FALSE(run("xabc", 0).isMatch());
}

TEST_F(LazySearchTest, StickyGroupsSkipBackwardScan) {
    build(abcForward(false), abcBackward(), abcCaptureGroups(), {},
          LZS_FLAG_STICKY);
    RegexResult r = run("xxabc", 2);
    ASSERT_TRUE(r.isMatch());
    EXPECT_TRUE(r.startResolved());
    EXPECT_EQ(2, r.start());
    EXPECT_EQ(3, r.groupStart(1));
    EXPECT_EQ(4, r.groupEnd(1));
    EXPECT_EQ(0U, backwardScans());
}

TEST_F(LazySearchTest, LazyStart) {
    build(abcForward(), abcBackward(), nullptr, {});
    RegexResult r = run("zzabc", 0);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(RegexResult::SINGLE_LAZY_START, r.kind());
    EXPECT_EQ(5, r.end());
    EXPECT_EQ(0U, backwardScans());
    EXPECT_EQ(2, r.start());
    EXPECT_EQ(1U, backwardScans());
}

TEST_F(LazySearchTest, EmptyMatch) {
    build(xStarForward(), xStarBackward(), nullptr, {});
    RegexResult r = run("abc", 1);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(RegexResult::SINGLE, r.kind());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(1, r.end());
    EXPECT_EQ(0U, backwardScans());

    r = run("abc", 3);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(3, r.start());
    EXPECT_EQ(3, r.end());

    r = run("axxb", 1);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(RegexResult::SINGLE_LAZY_START, r.kind());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(3, r.end());
}

TEST_F(LazySearchTest, SinglePrecalculatedResult) {
    vector<PrecalculatedResultFactory> precalc;
    precalc.push_back(PrecalculatedResultFactory({0, 3, 0, 1}, 3));
    build(abcForward(), nullptr, nullptr, move(precalc));

    RegexResult r = run("xxabc", 0);
    ASSERT_TRUE(r.isMatch());
    EXPECT_TRUE(r.startResolved());
    EXPECT_TRUE(r.groupsResolved());
    EXPECT_EQ(2, r.start());
    EXPECT_EQ(5, r.end());
    EXPECT_EQ(2, r.groupStart(1));
    EXPECT_EQ(3, r.groupEnd(1));
}

TEST_F(LazySearchTest, TraceFinder) {
    build(acOrBcForward(), acOrBcTraceBackward(false), nullptr,
          acOrBcPrecalc());

    RegexResult r = run("zbc", 0);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(RegexResult::TRACE_FINDER, r.kind());
    EXPECT_EQ(0U, backwardScans());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(3, r.end());
    EXPECT_EQ(GROUP_UNSET, r.groupStart(1));
    EXPECT_EQ(1, r.groupStart(2));
    EXPECT_EQ(2, r.groupEnd(2));
    EXPECT_EQ(1U, backwardScans());

    r = run("xacb", 0);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(1, r.groupStart(1));
    EXPECT_EQ(2, r.groupEnd(1));
    EXPECT_EQ(GROUP_UNSET, r.groupStart(2));
}

TEST_F(LazySearchTest, BackwardAnchored) {
    build(bcForward(), bcEndBackward(), nullptr, {});

    RegexResult r = run("abc", 0);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(RegexResult::SINGLE, r.kind());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(3, r.end());
    EXPECT_EQ(0U, forward->executions());
    EXPECT_EQ(1U, backwardScans());

    // the match may not begin before the search start
    EXPECT_FALSE(run("abc", 2).isMatch());
    EXPECT_FALSE(run("abcx", 0).isMatch());
    EXPECT_FALSE(run("", 0).isMatch());
}

TEST_F(LazySearchTest, BackwardAnchoredGroups) {
    // (b)c$, with groups found by a forward scan over the known match
    raw_tagged_dfa raw(3, 2);
    setAlphabet(raw, "bc");
    dstate_id_t s = raw.addState();
    dstate_id_t b = raw.addState();
    dstate_id_t c = raw.addState();
    addTaggedEdge(raw, s, 'b', b, {tag_op(0, false), tag_op(2, false)});
    addTaggedEdge(raw, b, 'c', c, {tag_op(3, false)});
    raw.states[c].accept = true;
    raw.state_tags[c].accept.push_back(tag_op(1, false));
    raw.start_anchored = s;
    raw.start_floating = s;
    auto groups = make_shared<TaggedDfaExecutor>(raw, dfa_props());

    build(bcForward(), bcEndBackward(), groups, {});
    RegexResult r = run("abc", 0);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(RegexResult::LAZY_CAPTURE_GROUPS, r.kind());
    EXPECT_TRUE(r.startResolved());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(0U, groupScans());
    EXPECT_EQ(1, r.groupStart(1));
    EXPECT_EQ(2, r.groupEnd(1));
    EXPECT_EQ(1U, groupScans());
}

TEST_F(LazySearchTest, BackwardAnchoredSinglePrecalculatedResult) {
    vector<PrecalculatedResultFactory> precalc;
    precalc.push_back(PrecalculatedResultFactory({0, 2, 0, 1}, 2));
    build(bcForward(), bcEndBackward(), nullptr, move(precalc));

    RegexResult r = run("abc", 0);
    ASSERT_TRUE(r.isMatch());
    EXPECT_TRUE(r.groupsResolved());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(3, r.end());
    EXPECT_EQ(1, r.groupStart(1));
    EXPECT_EQ(2, r.groupEnd(1));
}

TEST_F(LazySearchTest, BackwardAnchoredTraceFinder) {
    build(acOrBcForward(), acOrBcTraceBackward(true), nullptr,
          acOrBcPrecalc());

    RegexResult r = run("zbc", 0);
    ASSERT_TRUE(r.isMatch());
    EXPECT_TRUE(r.groupsResolved());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(3, r.end());
    EXPECT_EQ(GROUP_UNSET, r.groupStart(1));
    EXPECT_EQ(1, r.groupStart(2));
    EXPECT_EQ(2, r.groupEnd(2));
    EXPECT_EQ(0U, forward->executions());

    EXPECT_FALSE(run("zbcz", 0).isMatch());
}

TEST_F(LazySearchTest, UnknownTraceIndex) {
    // report values beyond the precalculated results
    raw_dfa raw(2);
    setAlphabet(raw, "c");
    dstate_id_t r0 = raw.addState();
    dstate_id_t r1 = raw.addState();
    addEdge(raw, r0, 'c', r1);
    raw.states[r1].accept = true;
    raw.states[r1].report = 7;
    raw.start_anchored = r0;
    raw.start_floating = DEAD_STATE;
    dfa_props props;
    props.direction = SCAN_BACKWARD;
    props.anchored = true;
    props.report_result = true;
    auto back = make_shared<DfaExecutor>(raw, props);

    vector<PrecalculatedResultFactory> precalc;
    precalc.push_back(PrecalculatedResultFactory({0, 1}, 1));
    precalc.push_back(PrecalculatedResultFactory({0, 1}, 1));
    build(acOrBcForward(), back, nullptr, move(precalc));
    EXPECT_THROW(run("c", 0), ContractError);
}

TEST(automata, requires_forward) {
    EXPECT_THROW(CompiledAutomata(nullptr, abcBackward(), nullptr, {}, 0),
                 ContractError);
}

TEST(automata, requires_backward_for_start) {
    EXPECT_THROW(CompiledAutomata(abcForward(), nullptr, nullptr, {}, 0),
                 ContractError);
    EXPECT_THROW(CompiledAutomata(abcForward(), nullptr, abcCaptureGroups(),
                                  {}, 0),
                 ContractError);
    EXPECT_THROW(CompiledAutomata(acOrBcForward(), nullptr, nullptr,
                                  acOrBcPrecalc(), 0),
                 ContractError);

    EXPECT_NO_THROW(CompiledAutomata(anchoredAbcForward(), nullptr, nullptr,
                                     {}, 0));
    EXPECT_NO_THROW(CompiledAutomata(abcForward(), nullptr, nullptr, {},
                                     LZS_FLAG_STICKY));
}

TEST(automata, automaton_roles) {
    // backward automata report offsets, capture group automata report groups
    EXPECT_THROW(CompiledAutomata(abcForward(), abcCaptureGroups(), nullptr,
                                  {}, 0),
                 ContractError);
    EXPECT_THROW(CompiledAutomata(abcForward(), abcBackward(), abcBackward(),
                                  {}, 0),
                 ContractError);
}

TEST(automata, group_counts) {
    CompiledAutomata plain(abcForward(), abcBackward(), nullptr, {}, 0);
    EXPECT_EQ(1U, plain.numGroups());
    EXPECT_FALSE(plain.isSticky());
    EXPECT_FALSE(plain.singlePreCalcResult());
    EXPECT_FALSE(plain.multiplePreCalcResults());

    CompiledAutomata groups(abcForward(), abcBackward(), abcCaptureGroups(),
                            {}, LZS_FLAG_STICKY | LZS_FLAG_CASELESS);
    EXPECT_EQ(2U, groups.numGroups());
    EXPECT_TRUE(groups.isSticky());

    CompiledAutomata trace(acOrBcForward(), acOrBcTraceBackward(false),
                           nullptr, acOrBcPrecalc(), 0);
    EXPECT_EQ(3U, trace.numGroups());
    EXPECT_TRUE(trace.multiplePreCalcResults());

    vector<PrecalculatedResultFactory> mixed = acOrBcPrecalc();
    mixed.push_back(PrecalculatedResultFactory({0, 2}, 2));
    EXPECT_THROW(CompiledAutomata(acOrBcForward(), acOrBcTraceBackward(false),
                                  nullptr, mixed, 0),
                 ContractError);
}
