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

#include "grey.h"
#include "gtest/gtest.h"

using namespace std;
using namespace lzs;

TEST(grey, defaults) {
    Grey g;
    EXPECT_TRUE(g.profileSearches);
    EXPECT_TRUE(g.allowEagerMatching);
    EXPECT_EQ(800U, g.eagerEvaluationTripPoint);
    EXPECT_EQ(800U, g.eagerMinCalls);
    EXPECT_EQ(50U, g.eagerMinMatchPercent);
    EXPECT_EQ(50U, g.eagerMinGroupAccessPercent);
}

#ifndef RELEASE_BUILD

TEST(grey, overrides) {
    Grey g;
    applyGreyOverrides(&g, "eagerMinCalls:10;profileSearches:0");
    EXPECT_EQ(10U, g.eagerMinCalls);
    EXPECT_FALSE(g.profileSearches);
    EXPECT_TRUE(g.allowEagerMatching);
    EXPECT_EQ(800U, g.eagerEvaluationTripPoint);
}

TEST(grey, force_lazy) {
    Grey g;
    applyGreyOverrides(&g, "forceLazy:1");
    EXPECT_FALSE(g.profileSearches);
    EXPECT_FALSE(g.allowEagerMatching);
}

TEST(grey, eager_asap) {
    Grey g;
    applyGreyOverrides(&g, "profileSearches:0;eagerAsap:1");
    EXPECT_TRUE(g.profileSearches);
    EXPECT_TRUE(g.allowEagerMatching);
    EXPECT_EQ(1U, g.eagerEvaluationTripPoint);
    EXPECT_EQ(1U, g.eagerMinCalls);
    EXPECT_EQ(0U, g.eagerMinMatchPercent);
    EXPECT_EQ(0U, g.eagerMinGroupAccessPercent);
}

TEST(grey, bad_key) {
    Grey g;
    EXPECT_EXIT(applyGreyOverrides(&g, "noSuchKnob:1"),
                testing::ExitedWithCode(1), "");
}

TEST(grey, zero_trip_point) {
    Grey g;
    EXPECT_EXIT(applyGreyOverrides(&g, "eagerEvaluationTripPoint:0"),
                testing::ExitedWithCode(1), "");
}

#endif
