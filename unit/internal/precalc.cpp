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

#include "result/precalc.h"
#include "result/regex_result.h"
#include "util/compile_error.h"
#include "test_automata.h"
#include "gtest/gtest.h"

#include <vector>

using namespace std;
using namespace lzs;

TEST(precalc, whole_match_only) {
    PrecalculatedResultFactory f({0, 3}, 3);
    EXPECT_EQ(1U, f.numGroups());
    EXPECT_EQ(3U, f.length());

    RegexResult r = f.createFromStart(5);
    EXPECT_EQ(RegexResult::SINGLE, r.kind());
    EXPECT_EQ(5, r.start());
    EXPECT_EQ(8, r.end());
    EXPECT_EQ(1U, r.numGroups());

    r = f.createFromEnd(8);
    EXPECT_EQ(5, r.start());
    EXPECT_EQ(8, r.end());
}

TEST(precalc, shifts_groups) {
    PrecalculatedResultFactory f({0, 3, 1, 2}, 3);
    EXPECT_EQ(2U, f.numGroups());

    RegexResult r = f.createFromStart(1);
    EXPECT_EQ(RegexResult::LAZY_CAPTURE_GROUPS, r.kind());
    EXPECT_TRUE(r.startResolved());
    EXPECT_TRUE(r.groupsResolved());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(4, r.end());
    EXPECT_EQ(2, r.groupStart(1));
    EXPECT_EQ(3, r.groupEnd(1));
}

TEST(precalc, unset_groups_stay_unset) {
    auto factories = acOrBcPrecalc();
    RegexResult r = factories[1].createFromEnd(3);
    ASSERT_EQ(3U, r.numGroups());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(3, r.end());
    EXPECT_EQ(GROUP_UNSET, r.groupStart(1));
    EXPECT_EQ(GROUP_UNSET, r.groupEnd(1));
    EXPECT_EQ(1, r.groupStart(2));
    EXPECT_EQ(2, r.groupEnd(2));
}

TEST(precalc, empty_match) {
    PrecalculatedResultFactory f({0, 0, 0, 0}, 0);
    RegexResult r = f.createFromEnd(4);
    EXPECT_EQ(4, r.start());
    EXPECT_EQ(4, r.end());
    EXPECT_EQ(4, r.groupStart(1));
    EXPECT_EQ(4, r.groupEnd(1));
}

TEST(precalc, malformed_templates) {
    EXPECT_THROW((PrecalculatedResultFactory({}, 0)), CompileError);
    EXPECT_THROW((PrecalculatedResultFactory({0, 3, 1}, 3)), CompileError);
    EXPECT_THROW((PrecalculatedResultFactory({1, 3}, 3)), CompileError);
    EXPECT_THROW((PrecalculatedResultFactory({0, 2}, 3)), CompileError);
    EXPECT_THROW((PrecalculatedResultFactory({0, 3, 2, 1}, 3)), CompileError);
    EXPECT_THROW((PrecalculatedResultFactory({0, 3, 1, 4}, 3)), CompileError);
    EXPECT_THROW((PrecalculatedResultFactory({0, 3, -2, 1}, 3)), CompileError);
}
