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

#include "gtest/gtest.h"
#include "lzs.h"
#include "grey.h"
#include "test_util.h"

#include <string>
#include <vector>

using namespace std;

namespace {

struct GroupRecord {
    GroupRecord(long long f, long long t) : from(f), to(t) {}
    bool operator==(const GroupRecord &o) const {
        return from == o.from && to == o.to;
    }
    long long from;
    long long to;
};

std::ostream &operator<<(std::ostream &o, const GroupRecord &g) {
    return o << "(" << g.from << "," << g.to << ")";
}

vector<GroupRecord> groups(const lzs_result_t *result) {
    vector<GroupRecord> rv;
    unsigned count = 0;
    EXPECT_EQ(LZS_SUCCESS, lzs_result_group_count(result, &count));
    for (unsigned i = 0; i < count; i++) {
        long long from, to;
        EXPECT_EQ(LZS_SUCCESS, lzs_result_group(result, i, &from, &to));
        rv.push_back(GroupRecord(from, to));
    }
    return rv;
}

} // namespace

TEST(LazyscanSearch, Match) {
    lzs_regex_t *regex = makeAbcRegex();
    ASSERT_TRUE(regex != nullptr);
    const string data = "xxabcx";
    lzs_result_t *result = searchOrFail(regex, data, 0);
    ASSERT_TRUE(result != nullptr);

    int matched = 0;
    ASSERT_EQ(LZS_SUCCESS, lzs_result_is_match(result, &matched));
    ASSERT_EQ(1, matched);

    unsigned long long start = 0, end = 0;
    EXPECT_EQ(LZS_SUCCESS, lzs_result_start(result, &start));
    EXPECT_EQ(LZS_SUCCESS, lzs_result_end(result, &end));
    EXPECT_EQ(2U, start);
    EXPECT_EQ(5U, end);

    vector<GroupRecord> expected = {GroupRecord(2, 5), GroupRecord(3, 4)};
    EXPECT_EQ(expected, groups(result));

    lzs_free_result(result);
    lzs_free_regex(regex);
}

TEST(LazyscanSearch, UnsetGroup) {
    lzs_regex_t *regex = makeAbcRegex();
    ASSERT_TRUE(regex != nullptr);
    const string data = "abac";
    lzs_result_t *result = searchOrFail(regex, data, 0);
    ASSERT_TRUE(result != nullptr);

    vector<GroupRecord> expected = {GroupRecord(2, 4), GroupRecord(-1, -1)};
    EXPECT_EQ(expected, groups(result));

    lzs_free_result(result);
    lzs_free_regex(regex);
}

TEST(LazyscanSearch, Iterate) {
    lzs_regex_t *regex = makeAbcRegex();
    ASSERT_TRUE(regex != nullptr);
    const string data = "ac abc zz abbc ac";

    vector<GroupRecord> found;
    unsigned from = 0;
    while (from <= data.size()) {
        lzs_result_t *result = searchOrFail(regex, data, from);
        ASSERT_TRUE(result != nullptr);
        int matched = 0;
        ASSERT_EQ(LZS_SUCCESS, lzs_result_is_match(result, &matched));
        if (!matched) {
            lzs_free_result(result);
            break;
        }
        unsigned long long start, end;
        ASSERT_EQ(LZS_SUCCESS, lzs_result_start(result, &start));
        ASSERT_EQ(LZS_SUCCESS, lzs_result_end(result, &end));
        found.push_back(GroupRecord(start, end));
        from = end;
        lzs_free_result(result);
    }

    vector<GroupRecord> expected = {GroupRecord(0, 2), GroupRecord(3, 6),
                                    GroupRecord(15, 17)};
    EXPECT_EQ(expected, found);
    lzs_free_regex(regex);
}

TEST(LazyscanSearch, TraceFinder) {
    lzs_regex_t *regex = makeTraceRegex();
    ASSERT_TRUE(regex != nullptr);
    const string data = "zzbc";
    lzs_result_t *result = searchOrFail(regex, data, 0);
    ASSERT_TRUE(result != nullptr);

    vector<GroupRecord> expected = {GroupRecord(2, 4), GroupRecord(-1, -1),
                                    GroupRecord(2, 3)};
    EXPECT_EQ(expected, groups(result));

    lzs_free_result(result);
    lzs_free_regex(regex);
}

TEST(LazyscanSearch, EagerSwitch) {
    lzs::Grey grey;
    grey.eagerEvaluationTripPoint = 1;
    grey.eagerMinCalls = 1;
    grey.eagerMinMatchPercent = 0;
    grey.eagerMinGroupAccessPercent = 0;
    lzs_regex_t *regex = makeAbcRegex(grey);
    ASSERT_TRUE(regex != nullptr);
    const string data = "xabc";

    // results are the same before and after the strategy changes
    vector<GroupRecord> expected = {GroupRecord(1, 4), GroupRecord(2, 3)};
    for (int i = 0; i < 5; i++) {
        lzs_result_t *result = searchOrFail(regex, data, 0);
        ASSERT_TRUE(result != nullptr);
        EXPECT_EQ(expected, groups(result));
        lzs_free_result(result);
    }
    lzs_free_regex(regex);
}

TEST(LazyscanSearch, ResultOutlivesRegex) {
    lzs_regex_t *regex = makeAbcRegex();
    ASSERT_TRUE(regex != nullptr);
    const string data = "zabc";
    lzs_result_t *result = searchOrFail(regex, data, 0);
    ASSERT_TRUE(result != nullptr);
    lzs_free_regex(regex);

    // deferred scans keep their automata alive
    vector<GroupRecord> expected = {GroupRecord(1, 4), GroupRecord(2, 3)};
    EXPECT_EQ(expected, groups(result));
    lzs_free_result(result);
}
