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

#include "search/match_profile.h"
#include "grey.h"
#include "gtest/gtest.h"

#include <thread>
#include <vector>

using namespace std;
using namespace lzs;

static
void record(MatchProfile &p, u32 calls, u32 matches, u32 accesses) {
    for (u32 i = 0; i < calls; i++) {
        p.incCalls();
    }
    for (u32 i = 0; i < matches; i++) {
        p.incMatches();
    }
    for (u32 i = 0; i < accesses; i++) {
        p.incCaptureGroupAccesses();
    }
}

TEST(match_profile, counters) {
    MatchProfile p{Grey()};
    EXPECT_EQ(0U, p.calls());
    EXPECT_EQ(0U, p.matches());
    EXPECT_EQ(0U, p.captureGroupAccesses());

    record(p, 3, 2, 1);
    EXPECT_EQ(3U, p.calls());
    EXPECT_EQ(2U, p.matches());
    EXPECT_EQ(1U, p.captureGroupAccesses());
}

TEST(match_profile, trip_point) {
    Grey g;
    g.eagerEvaluationTripPoint = 4;
    MatchProfile p(g);

    EXPECT_FALSE(p.atEvaluationTripPoint()); // no calls yet
    for (u32 i = 1; i <= 12; i++) {
        p.incCalls();
        EXPECT_EQ(i % 4 == 0, p.atEvaluationTripPoint());
    }
}

TEST(match_profile, zero_trip_point) {
    Grey g;
    g.eagerEvaluationTripPoint = 0;
    MatchProfile p(g);

    EXPECT_FALSE(p.atEvaluationTripPoint());
    for (u32 i = 0; i < 3; i++) {
        p.incCalls();
        EXPECT_TRUE(p.atEvaluationTripPoint());
    }
}

TEST(match_profile, default_trip_point) {
    MatchProfile p{Grey()};
    record(p, 799, 0, 0);
    EXPECT_FALSE(p.atEvaluationTripPoint());
    p.incCalls();
    EXPECT_TRUE(p.atEvaluationTripPoint());
}

TEST(match_profile, heuristic_needs_call_volume) {
    MatchProfile p{Grey()};
    record(p, 799, 799, 799);
    EXPECT_FALSE(p.shouldUseEagerMatching());
    record(p, 1, 1, 1);
    EXPECT_TRUE(p.shouldUseEagerMatching());
}

TEST(match_profile, heuristic_needs_matches) {
    MatchProfile p{Grey()};
    record(p, 1000, 499, 499);
    EXPECT_FALSE(p.shouldUseEagerMatching());
    record(p, 0, 1, 1);
    EXPECT_TRUE(p.shouldUseEagerMatching()); // exactly half
}

TEST(match_profile, heuristic_needs_group_accesses) {
    MatchProfile p{Grey()};
    record(p, 1000, 1000, 499);
    EXPECT_FALSE(p.shouldUseEagerMatching());
    record(p, 0, 0, 1);
    EXPECT_TRUE(p.shouldUseEagerMatching());
}

TEST(match_profile, tuned_thresholds) {
    Grey g;
    g.eagerMinCalls = 1;
    g.eagerMinMatchPercent = 0;
    g.eagerMinGroupAccessPercent = 0;
    MatchProfile p(g);
    EXPECT_FALSE(p.shouldUseEagerMatching());
    p.incCalls();
    EXPECT_TRUE(p.shouldUseEagerMatching());
}

TEST(match_profile, concurrent_updates) {
    MatchProfile p{Grey()};
    vector<thread> threads;
    for (u32 t = 0; t < 4; t++) {
        threads.emplace_back([&p] { record(p, 1000, 500, 250); });
    }
    for (auto &t : threads) {
        t.join();
    }
    EXPECT_EQ(4000U, p.calls());
    EXPECT_EQ(2000U, p.matches());
    EXPECT_EQ(1000U, p.captureGroupAccesses());
}
