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

#include "search/compiled_regex.h"
#include "search/automata.h"
#include "search/match_profile.h"
#include "grey.h"
#include "util/contract_error.h"
#include "test_automata.h"
#include "gtest/gtest.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace std;
using namespace lzs;

static
Grey eagerAsap() {
    Grey g;
    g.eagerEvaluationTripPoint = 1;
    g.eagerMinCalls = 1;
    g.eagerMinMatchPercent = 0;
    g.eagerMinGroupAccessPercent = 0;
    return g;
}

static
shared_ptr<FixedCompiler> abcCompiler() {
    return make_shared<FixedCompiler>(abcLazyAutomata(), abcEager());
}

static
unique_ptr<CompiledRegex> makeRegex(shared_ptr<const RegexCompiler> compiler,
                                    const Grey &g) {
    return unique_ptr<CompiledRegex>(
        new CompiledRegex(RegexSource("a(b)?c", 0), abcLazyAutomata(),
                          move(compiler), g));
}

static
void checkAbc(const RegexResult &r) {
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(4, r.end());
    ASSERT_EQ(2U, r.numGroups());
    EXPECT_EQ(2, r.groupStart(1));
    EXPECT_EQ(3, r.groupEnd(1));
}

TEST(compiled_regex, accessors) {
    auto cr = makeRegex(abcCompiler(), Grey());
    EXPECT_EQ("a(b)?c", cr->getSource().pattern);
    EXPECT_EQ(0U, cr->getSource().flags);
    EXPECT_EQ(2U, cr->getAutomata().numGroups());
    EXPECT_EQ(STRATEGY_LAZY, cr->strategyState());
    EXPECT_EQ(0U, cr->getProfile().calls());
}

TEST(compiled_regex, search_index_range) {
    auto cr = makeRegex(abcCompiler(), Grey());
    const string s = "abc";
    EXPECT_THROW(cr->search(bytes(s), s.size(), -1), OutOfRangeError);
    EXPECT_THROW(cr->search(bytes(s), s.size(), 4), OutOfRangeError);
    EXPECT_FALSE(cr->search(bytes(s), s.size(), 3).isMatch());
    EXPECT_EQ(1U, cr->getProfile().calls());
}

TEST(compiled_regex, profiles_lazy_searches) {
    auto cr = makeRegex(abcCompiler(), Grey());
    const string hit = "xabc";
    const string miss = "xyz";

    checkAbc(cr->search(bytes(hit), hit.size(), 0));
    EXPECT_FALSE(cr->search(bytes(miss), miss.size(), 0).isMatch());
    RegexResult r = cr->search(bytes(hit), hit.size(), 0);
    EXPECT_EQ(4, r.end());

    EXPECT_EQ(3U, cr->getProfile().calls());
    EXPECT_EQ(2U, cr->getProfile().matches());
    EXPECT_EQ(1U, cr->getProfile().captureGroupAccesses());
    EXPECT_EQ(STRATEGY_LAZY, cr->strategyState());
}

TEST(compiled_regex, switches_at_trip_point) {
    auto compiler = abcCompiler();
    auto cr = makeRegex(compiler, Grey());
    const string s = "xabc";

    for (u32 i = 0; i < 800; i++) {
        checkAbc(cr->search(bytes(s), s.size(), 0));
    }
    EXPECT_EQ(STRATEGY_LAZY, cr->strategyState());
    EXPECT_EQ(0U, compiler->eager_calls.load());

    // the 801st search evaluates the profile
    RegexResult r = cr->search(bytes(s), s.size(), 0);
    EXPECT_FALSE(r.groupsResolved());
    EXPECT_EQ(STRATEGY_EAGER, cr->strategyState());
    EXPECT_EQ(1U, compiler->eager_calls.load());
    checkAbc(r);

    r = cr->search(bytes(s), s.size(), 0);
    EXPECT_TRUE(r.groupsResolved());
    checkAbc(r);

    // eager searches are not profiled
    EXPECT_EQ(801U, cr->getProfile().calls());
}

TEST(compiled_regex, stays_lazy_without_group_access) {
    auto compiler = abcCompiler();
    auto cr = makeRegex(compiler, Grey());
    const string s = "xabc";

    for (u32 i = 0; i < 1700; i++) {
        RegexResult r = cr->search(bytes(s), s.size(), 0);
        ASSERT_EQ(4, r.end());
    }
    EXPECT_EQ(STRATEGY_LAZY, cr->strategyState());
    EXPECT_EQ(0U, compiler->eager_calls.load());
    EXPECT_EQ(1700U, cr->getProfile().calls());
}

TEST(compiled_regex, stays_lazy_with_few_matches) {
    auto cr = makeRegex(abcCompiler(), Grey());
    const string s = "xyz";
    for (u32 i = 0; i < 1700; i++) {
        ASSERT_FALSE(cr->search(bytes(s), s.size(), 0).isMatch());
    }
    EXPECT_EQ(STRATEGY_LAZY, cr->strategyState());
}

TEST(compiled_regex, eager_results_match_lazy) {
    auto lazy = makeRegex(abcCompiler(), Grey());
    auto eager = makeRegex(abcCompiler(), eagerAsap());
    const string s = "aabcacabc";

    for (u32 i = 0; i < 2; i++) {
        eager->search(bytes(s), s.size(), 0);
    }
    ASSERT_EQ(STRATEGY_EAGER, eager->strategyState());

    for (s64a from = 0; from <= (s64a)s.size(); from++) {
        RegexResult l = lazy->search(bytes(s), s.size(), from);
        RegexResult e = eager->search(bytes(s), s.size(), from);
        ASSERT_EQ(l.isMatch(), e.isMatch());
        if (!l.isMatch()) {
            continue;
        }
        EXPECT_EQ(l.start(), e.start());
        EXPECT_EQ(l.end(), e.end());
        EXPECT_EQ(l.groupStart(1), e.groupStart(1));
        EXPECT_EQ(l.groupEnd(1), e.groupEnd(1));
    }
}

TEST(compiled_regex, zero_trip_point) {
    Grey g;
    g.eagerEvaluationTripPoint = 0;
    auto lazy = makeRegex(abcCompiler(), g);
    const string s = "xabc";
    for (u32 i = 0; i < 3; i++) {
        checkAbc(lazy->search(bytes(s), s.size(), 0));
    }
    EXPECT_EQ(STRATEGY_LAZY, lazy->strategyState());
    EXPECT_EQ(3U, lazy->getProfile().calls());

    g = eagerAsap();
    g.eagerEvaluationTripPoint = 0;
    auto eager = makeRegex(abcCompiler(), g);
    for (u32 i = 0; i < 3; i++) {
        checkAbc(eager->search(bytes(s), s.size(), 0));
    }
    EXPECT_EQ(STRATEGY_EAGER, eager->strategyState());
}

static
void checkSameResult(const RegexResult &a, const RegexResult &b) {
    ASSERT_EQ(a.isMatch(), b.isMatch());
    if (!a.isMatch()) {
        return;
    }
    EXPECT_EQ(a.start(), b.start());
    EXPECT_EQ(a.end(), b.end());
    ASSERT_EQ(a.numGroups(), b.numGroups());
    for (u32 i = 0; i < a.numGroups(); i++) {
        EXPECT_EQ(a.groupStart(i), b.groupStart(i));
        EXPECT_EQ(a.groupEnd(i), b.groupEnd(i));
    }
}

TEST(compiled_regex, repeated_search_is_deterministic) {
    auto lazy = makeRegex(abcCompiler(), Grey());
    auto eager = makeRegex(abcCompiler(), eagerAsap());
    const string warm = "abc";
    for (u32 i = 0; i < 2; i++) {
        eager->search(bytes(warm), warm.size(), 0);
    }
    ASSERT_EQ(STRATEGY_EAGER, eager->strategyState());

    const vector<string> inputs = {"xabc", "abac", "aabcac", "zzz", "ac"};
    for (const auto &s : inputs) {
        for (s64a from = 0; from <= (s64a)s.size(); from++) {
            SCOPED_TRACE(s + " from " + to_string(from));
            for (CompiledRegex *cr : {lazy.get(), eager.get()}) {
                RegexResult first = cr->search(bytes(s), s.size(), from);
                RegexResult second = cr->search(bytes(s), s.size(), from);
                checkSameResult(first, second);
            }
        }
    }
}

TEST(compiled_regex, profiling_disabled) {
    Grey g = eagerAsap();
    g.profileSearches = false;
    auto compiler = abcCompiler();
    auto cr = makeRegex(compiler, g);
    const string s = "xabc";
    for (u32 i = 0; i < 10; i++) {
        checkAbc(cr->search(bytes(s), s.size(), 0));
    }
    EXPECT_EQ(STRATEGY_LAZY, cr->strategyState());
    EXPECT_EQ(0U, cr->getProfile().calls());
    EXPECT_EQ(0U, compiler->eager_calls.load());
}

TEST(compiled_regex, eager_disallowed) {
    Grey g = eagerAsap();
    g.allowEagerMatching = false;
    auto compiler = abcCompiler();
    auto cr = makeRegex(compiler, g);
    const string s = "xabc";
    for (u32 i = 0; i < 5; i++) {
        checkAbc(cr->search(bytes(s), s.size(), 0));
    }
    EXPECT_EQ(STRATEGY_EAGER_UNAVAILABLE, cr->strategyState());
    EXPECT_EQ(0U, compiler->eager_calls.load());
}

TEST(compiled_regex, eager_unavailable) {
    auto compiler = make_shared<FixedCompiler>(abcLazyAutomata(), nullptr);
    auto cr = makeRegex(compiler, eagerAsap());
    const string s = "xabc";
    for (u32 i = 0; i < 5; i++) {
        checkAbc(cr->search(bytes(s), s.size(), 0));
    }
    EXPECT_EQ(STRATEGY_EAGER_UNAVAILABLE, cr->strategyState());
    EXPECT_EQ(1U, compiler->eager_calls.load());

    // profiling stops once the decision is final
    EXPECT_EQ(2U, cr->getProfile().calls());
}

TEST(compiled_regex, eager_compile_fails) {
    auto compiler = abcCompiler();
    compiler->fail_eager = true;
    auto cr = makeRegex(compiler, eagerAsap());
    const string s = "xabc";
    for (u32 i = 0; i < 3; i++) {
        checkAbc(cr->search(bytes(s), s.size(), 0));
    }
    EXPECT_EQ(STRATEGY_EAGER_UNAVAILABLE, cr->strategyState());
    EXPECT_EQ(1U, compiler->eager_calls.load());
}

TEST(compiled_regex, eager_automaton_without_groups) {
    auto compiler = make_shared<FixedCompiler>(abcLazyAutomata(),
                                               abcForward());
    auto cr = makeRegex(compiler, eagerAsap());
    const string s = "xabc";
    for (u32 i = 0; i < 3; i++) {
        checkAbc(cr->search(bytes(s), s.size(), 0));
    }
    EXPECT_EQ(STRATEGY_EAGER_UNAVAILABLE, cr->strategyState());
}

TEST(compiled_regex, no_compiler) {
    auto cr = makeRegex(nullptr, eagerAsap());
    const string s = "xabc";
    for (u32 i = 0; i < 3; i++) {
        checkAbc(cr->search(bytes(s), s.size(), 0));
    }
    EXPECT_EQ(STRATEGY_EAGER_UNAVAILABLE, cr->strategyState());
}

TEST(compiled_regex, concurrent_switch) {
    auto compiler = abcCompiler();
    auto cr = makeRegex(compiler, eagerAsap());
    const string s = "xabc";
    atomic<u32> failures(0);

    vector<thread> threads;
    for (u32 t = 0; t < 8; t++) {
        threads.emplace_back([&] {
            for (u32 i = 0; i < 200; i++) {
                RegexResult r = cr->search(bytes(s), s.size(), 0);
                if (!r.isMatch() || r.start() != 1 || r.end() != 4
                    || r.groupStart(1) != 2 || r.groupEnd(1) != 3) {
                    failures++;
                }
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    EXPECT_EQ(0U, failures.load());
    EXPECT_EQ(STRATEGY_EAGER, cr->strategyState());
    EXPECT_EQ(1U, compiler->eager_calls.load());
}
