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

#include "search/eager_search.h"
#include "search/lazy_search.h"
#include "search/automata.h"
#include "search/match_profile.h"
#include "grey.h"
#include "test_automata.h"
#include "gtest/gtest.h"

#include <memory>
#include <string>
#include <vector>

using namespace std;
using namespace lzs;

static
vector<s64a> allGroups(const RegexResult &r) {
    vector<s64a> rv;
    for (u32 i = 0; i < r.numGroups(); i++) {
        rv.push_back(r.groupStart(i));
        rv.push_back(r.groupEnd(i));
    }
    return rv;
}

TEST(eager_search, resolved_on_return) {
    EagerSearch eager(abcEager());
    const string s = "xabc";
    RegexResult r = eager.run(bytes(s), s.size(), 0);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(RegexResult::LAZY_CAPTURE_GROUPS, r.kind());
    EXPECT_TRUE(r.startResolved());
    EXPECT_TRUE(r.groupsResolved());
    EXPECT_EQ(vector<s64a>({1, 4, 2, 3}), allGroups(r));
}

TEST(eager_search, no_match) {
    EagerSearch eager(abcEager());
    const string s = "abbc";
    EXPECT_FALSE(eager.run(bytes(s), s.size(), 0).isMatch());

    const string t = "abc";
    EXPECT_FALSE(eager.run(bytes(t), t.size(), 1).isMatch());
    EXPECT_FALSE(eager.run(bytes(t), t.size(), 3).isMatch());
}

class EagerMatchesLazy : public testing::TestWithParam<const char *> {};

TEST_P(EagerMatchesLazy, AllStartIndices) {
    const string input(GetParam());
    auto automata = abcLazyAutomata();
    LazySearch lazy(automata, make_shared<MatchProfile>(Grey()));
    EagerSearch eager(abcEager());

    for (s64a from = 0; from <= (s64a)input.size(); from++) {
        SCOPED_TRACE(from);
        RegexResult l = lazy.run(bytes(input), input.size(), from);
        RegexResult e = eager.run(bytes(input), input.size(), from);
        ASSERT_EQ(l.isMatch(), e.isMatch());
        if (!l.isMatch()) {
            continue;
        }
        EXPECT_EQ(allGroups(l), allGroups(e));
    }
}

static const char *inputs[] = {
    "", "ac", "abc", "xabc", "abac", "abbc", "zzz", "aabcac", "acabcxac",
    "ab", "cba", "abcabc",
};

INSTANTIATE_TEST_CASE_P(eager_search, EagerMatchesLazy,
                        testing::ValuesIn(inputs));

/* The precalculated result picked by the backward trace scan must describe
 * the same groups a full capture group scan finds. */
class TraceFinderMatchesGroups : public testing::TestWithParam<const char *> {};

TEST_P(TraceFinderMatchesGroups, AllStartIndices) {
    const string input(GetParam());
    auto automata = make_shared<CompiledAutomata>(acOrBcForward(),
                                                  acOrBcTraceBackward(false),
                                                  nullptr, acOrBcPrecalc(),
                                                  0);
    LazySearch lazy(automata, make_shared<MatchProfile>(Grey()));
    EagerSearch eager(acOrBcEager());

    for (s64a from = 0; from <= (s64a)input.size(); from++) {
        SCOPED_TRACE(from);
        RegexResult l = lazy.run(bytes(input), input.size(), from);
        RegexResult e = eager.run(bytes(input), input.size(), from);
        ASSERT_EQ(l.isMatch(), e.isMatch());
        if (!l.isMatch()) {
            continue;
        }
        EXPECT_EQ(RegexResult::TRACE_FINDER, l.kind());
        ASSERT_EQ(3U, l.numGroups());
        EXPECT_EQ(allGroups(e), allGroups(l));
    }
}

static const char *trace_inputs[] = {
    "", "ac", "bc", "zbc", "xacb", "abc", "bac", "aac", "bbc", "c", "ab",
    "acbc", "zzbcac", "abab", "cbcac",
};

INSTANTIATE_TEST_CASE_P(eager_search, TraceFinderMatchesGroups,
                        testing::ValuesIn(trace_inputs));
