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

#include "result/regex_result.h"
#include "search/automata.h"
#include "search/deferred.h"
#include "search/match_profile.h"
#include "grey.h"
#include "util/contract_error.h"
#include "test_automata.h"
#include "gtest/gtest.h"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace std;
using namespace lzs;

namespace {

/** a(b)?c automata with every scan counted. */
struct CountedAbc {
    CountedAbc()
        : backward(make_shared<CountingAutomaton>(abcBackward())),
          cg(make_shared<CountingAutomaton>(abcCaptureGroups())),
          automata(make_shared<CompiledAutomata>(abcForward(), backward, cg,
                                                 vector<PrecalculatedResultFactory>(),
                                                 0)),
          profile(make_shared<MatchProfile>(Grey())) {}

    DeferredScan bind(const string &s, s64a from) const {
        return DeferredScan(automata, profile, bytes(s), s.size(), from);
    }

    shared_ptr<CountingAutomaton> backward;
    shared_ptr<CountingAutomaton> cg;
    shared_ptr<const CompiledAutomata> automata;
    shared_ptr<MatchProfile> profile;
};

} // namespace

static
string str(const RegexResult &r) {
    ostringstream oss;
    oss << r;
    return oss.str();
}

TEST(regex_result, no_match) {
    RegexResult r = RegexResult::noMatch();
    EXPECT_EQ(RegexResult::NO_MATCH, r.kind());
    EXPECT_FALSE(r.isMatch());
    EXPECT_EQ(0U, r.numGroups());
    EXPECT_THROW(r.start(), NoMatchError);
    EXPECT_THROW(r.end(), NoMatchError);
    EXPECT_THROW(r.groupStart(0), NoMatchError);
    EXPECT_THROW(r.groupEnd(0), NoMatchError);
    EXPECT_EQ("no_match", str(r));
}

TEST(regex_result, single) {
    RegexResult r = RegexResult::single(1, 4);
    EXPECT_EQ(RegexResult::SINGLE, r.kind());
    EXPECT_TRUE(r.isMatch());
    EXPECT_TRUE(r.startResolved());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(4, r.end());
    EXPECT_EQ(1U, r.numGroups());
    EXPECT_EQ(1, r.groupStart(0));
    EXPECT_EQ(4, r.groupEnd(0));
    EXPECT_THROW(r.groupStart(1), OutOfRangeError);
    EXPECT_EQ("single[1,4)", str(r));
}

TEST(regex_result, single_empty) {
    RegexResult r = RegexResult::single(2, 2);
    EXPECT_EQ(2, r.start());
    EXPECT_EQ(2, r.end());
}

TEST(regex_result, lazy_start_resolves_once) {
    CountedAbc abc;
    const string s = "xxabc";
    RegexResult r = RegexResult::singleLazyStart(abc.bind(s, 0), 5);
    EXPECT_EQ(RegexResult::SINGLE_LAZY_START, r.kind());
    EXPECT_FALSE(r.startResolved());
    EXPECT_EQ(5, r.end());
    EXPECT_EQ(1U, r.numGroups());
    EXPECT_EQ("single_lazy_start[?,5)", str(r));
    EXPECT_EQ(0U, abc.backward->executions());

    EXPECT_EQ(2, r.start());
    EXPECT_TRUE(r.startResolved());
    EXPECT_EQ(2, r.groupStart(0));
    EXPECT_EQ(5, r.groupEnd(0));
    EXPECT_EQ(2, r.start());
    EXPECT_EQ(1U, abc.backward->executions());
    EXPECT_EQ("single_lazy_start[2,5)", str(r));
}

TEST(regex_result, lazy_groups_known_start) {
    CountedAbc abc;
    const string s = "abc";
    RegexResult r = RegexResult::lazyCaptureGroups(abc.bind(s, 0), 0, 3);
    EXPECT_EQ(RegexResult::LAZY_CAPTURE_GROUPS, r.kind());
    EXPECT_TRUE(r.startResolved());
    EXPECT_FALSE(r.groupsResolved());
    EXPECT_EQ(0, r.start());
    EXPECT_EQ(3, r.end());
    EXPECT_EQ(2U, r.numGroups());
    EXPECT_EQ(0U, abc.cg->executions());
    EXPECT_EQ(0U, abc.profile->captureGroupAccesses());

    EXPECT_EQ(1, r.groupStart(1));
    EXPECT_EQ(2, r.groupEnd(1));
    EXPECT_TRUE(r.groupsResolved());
    EXPECT_EQ(0, r.groupStart(0));
    EXPECT_EQ(3, r.groupEnd(0));

    EXPECT_EQ(0U, abc.backward->executions());
    EXPECT_EQ(1U, abc.cg->executions());
    EXPECT_EQ(1U, abc.profile->captureGroupAccesses());
}

TEST(regex_result, lazy_groups_unknown_start) {
    CountedAbc abc;
    const string s = "abac";
    RegexResult r = RegexResult::lazyCaptureGroups(abc.bind(s, 0), 4);
    EXPECT_FALSE(r.startResolved());
    EXPECT_EQ("lazy_capture_groups[?,4)", str(r));

    // reading a group resolves the start first
    EXPECT_EQ(GROUP_UNSET, r.groupStart(1));
    EXPECT_EQ(GROUP_UNSET, r.groupEnd(1));
    EXPECT_TRUE(r.startResolved());
    EXPECT_EQ(2, r.start());
    EXPECT_EQ(1U, abc.backward->executions());
    EXPECT_EQ(1U, abc.cg->executions());
}

TEST(regex_result, lazy_groups_start_only) {
    CountedAbc abc;
    const string s = "abac";
    RegexResult r = RegexResult::lazyCaptureGroups(abc.bind(s, 0), 4);
    EXPECT_EQ(2, r.start());
    EXPECT_FALSE(r.groupsResolved());
    EXPECT_EQ(0U, abc.cg->executions());
}

TEST(regex_result, group_out_of_range) {
    CountedAbc abc;
    const string s = "abc";
    RegexResult r = RegexResult::lazyCaptureGroups(abc.bind(s, 0), 0, 3);
    EXPECT_THROW(r.groupStart(2), OutOfRangeError);
    EXPECT_THROW(r.groupEnd(7), OutOfRangeError);
    EXPECT_EQ(0U, abc.cg->executions());
}

TEST(regex_result, resolved_groups) {
    RegexResult r = RegexResult::captureGroups({1, 4, 2, 3});
    EXPECT_EQ(RegexResult::LAZY_CAPTURE_GROUPS, r.kind());
    EXPECT_TRUE(r.startResolved());
    EXPECT_TRUE(r.groupsResolved());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(4, r.end());
    EXPECT_EQ(2U, r.numGroups());
    EXPECT_EQ(2, r.groupStart(1));
    EXPECT_EQ(3, r.groupEnd(1));
    EXPECT_EQ("lazy_capture_groups[1,4)", str(r));
}

TEST(regex_result, trace_finder) {
    auto backward = make_shared<CountingAutomaton>(acOrBcTraceBackward(false));
    auto automata = make_shared<CompiledAutomata>(acOrBcForward(), backward,
                                                  nullptr, acOrBcPrecalc(),
                                                  0);
    const string s = "zbc";
    RegexResult r = RegexResult::traceFinder(
        DeferredScan(automata, nullptr, bytes(s), s.size(), 0), 3);
    EXPECT_EQ(RegexResult::TRACE_FINDER, r.kind());
    EXPECT_EQ(3U, r.numGroups());
    EXPECT_EQ(3, r.end());
    EXPECT_FALSE(r.startResolved());
    EXPECT_EQ(0U, backward->executions());

    EXPECT_EQ(1, r.start());
    EXPECT_EQ(GROUP_UNSET, r.groupStart(1));
    EXPECT_EQ(GROUP_UNSET, r.groupEnd(1));
    EXPECT_EQ(1, r.groupStart(2));
    EXPECT_EQ(2, r.groupEnd(2));
    EXPECT_EQ(1U, backward->executions());
}

TEST(regex_result, inconsistent_automata) {
    CountedAbc abc;
    // no a(b)?c ends at 2 in this input
    const string s = "xyz";
    RegexResult r = RegexResult::lazyCaptureGroups(abc.bind(s, 0), 2);
    EXPECT_THROW(r.start(), ContractError);
}
