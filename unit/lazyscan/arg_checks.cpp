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
#include "test_util.h"

#include <string>

using namespace std;

// Check that lzs_version gives us a reasonable string back
TEST(LazyscanArgChecks, Version) {
    const char *version = lzs_version();
    ASSERT_TRUE(version != nullptr);
    ASSERT_TRUE(version[0] >= '0' && version[0] <= '9') << "First byte should be a digit.";
    ASSERT_EQ('.', version[1]) << "Second byte should be a dot.";
    const string numbers = to_string(LZS_MAJOR) + "." + to_string(LZS_MINOR)
                         + "." + to_string(LZS_PATCH) + " ";
    EXPECT_EQ(0U, string(version).find(numbers));
}

// lzs_search: NULL regex
TEST(LazyscanArgChecks, SearchNoRegex) {
    lzs_result_t *result = nullptr;
    lzs_error_t err = lzs_search(nullptr, "abc", 3, 0, &result);
    EXPECT_EQ(LZS_INVALID, err);
    EXPECT_TRUE(result == nullptr);
}

// lzs_search: NULL data with a non-zero length
TEST(LazyscanArgChecks, SearchNoData) {
    lzs_regex_t *regex = makeAbcRegex();
    ASSERT_TRUE(regex != nullptr);
    lzs_result_t *result = nullptr;
    lzs_error_t err = lzs_search(regex, nullptr, 3, 0, &result);
    EXPECT_EQ(LZS_INVALID, err);
    EXPECT_TRUE(result == nullptr);
    lzs_free_regex(regex);
}

// lzs_search: NULL result pointer
TEST(LazyscanArgChecks, SearchNoResult) {
    lzs_regex_t *regex = makeAbcRegex();
    ASSERT_TRUE(regex != nullptr);
    lzs_error_t err = lzs_search(regex, "abc", 3, 0, nullptr);
    EXPECT_EQ(LZS_INVALID, err);
    lzs_free_regex(regex);
}

// lzs_search: start index beyond the data
TEST(LazyscanArgChecks, SearchFromBeyondEnd) {
    lzs_regex_t *regex = makeAbcRegex();
    ASSERT_TRUE(regex != nullptr);
    lzs_result_t *result = nullptr;
    lzs_error_t err = lzs_search(regex, "abc", 3, 4, &result);
    EXPECT_EQ(LZS_INVALID, err);
    EXPECT_TRUE(result == nullptr);
    lzs_free_regex(regex);
}

// lzs_search: the start index may equal the length
TEST(LazyscanArgChecks, SearchFromEnd) {
    lzs_regex_t *regex = makeAbcRegex();
    ASSERT_TRUE(regex != nullptr);
    lzs_result_t *result = nullptr;
    lzs_error_t err = lzs_search(regex, "abc", 3, 3, &result);
    ASSERT_EQ(LZS_SUCCESS, err);
    int matched = -1;
    EXPECT_EQ(LZS_SUCCESS, lzs_result_is_match(result, &matched));
    EXPECT_EQ(0, matched);
    lzs_free_result(result);
    lzs_free_regex(regex);
}

// lzs_search: empty data is fine
TEST(LazyscanArgChecks, SearchEmpty) {
    lzs_regex_t *regex = makeAbcRegex();
    ASSERT_TRUE(regex != nullptr);
    lzs_result_t *result = nullptr;
    lzs_error_t err = lzs_search(regex, nullptr, 0, 0, &result);
    ASSERT_EQ(LZS_SUCCESS, err);
    ASSERT_TRUE(result != nullptr);
    lzs_free_result(result);
    lzs_free_regex(regex);
}

// lzs_search: the pattern fails to compile on first use
TEST(LazyscanArgChecks, SearchCompileFails) {
    lzs_regex_t *regex = makeUncompilableRegex();
    ASSERT_TRUE(regex != nullptr);
    lzs_result_t *result = nullptr;
    lzs_error_t err = lzs_search(regex, "abc", 3, 0, &result);
    EXPECT_EQ(LZS_COMPILER_ERROR, err);
    EXPECT_TRUE(result == nullptr);
    lzs_free_regex(regex);
}

// lzs_search: the compiler fails with an unexpected exception
TEST(LazyscanArgChecks, SearchCompilerCrashes) {
    lzs_regex_t *regex = makeCrashingCompilerRegex();
    ASSERT_TRUE(regex != nullptr);
    lzs_result_t *result = nullptr;
    lzs_error_t err = lzs_search(regex, "abc", 3, 0, &result);
    EXPECT_EQ(LZS_UNKNOWN_ERROR, err);
    EXPECT_TRUE(result == nullptr);
    lzs_free_regex(regex);
}

// accessors: resolving a deferred field fails with an unexpected exception
TEST(LazyscanArgChecks, AccessorsDeferredScanFails) {
    lzs_regex_t *regex = makeFailingDeferredRegex();
    ASSERT_TRUE(regex != nullptr);
    const string data = "xabc";
    lzs_result_t *result = searchOrFail(regex, data, 0);
    ASSERT_TRUE(result != nullptr);

    int matched = 0;
    EXPECT_EQ(LZS_SUCCESS, lzs_result_is_match(result, &matched));
    EXPECT_EQ(1, matched);

    unsigned long long offset = 0;
    EXPECT_EQ(LZS_SUCCESS, lzs_result_end(result, &offset));
    EXPECT_EQ(4U, offset);

    long long from, to;
    EXPECT_EQ(LZS_UNKNOWN_ERROR, lzs_result_start(result, &offset));
    EXPECT_EQ(LZS_UNKNOWN_ERROR, lzs_result_group(result, 1, &from, &to));
    lzs_free_result(result);
    lzs_free_regex(regex);
}

// free functions accept NULL
TEST(LazyscanArgChecks, FreeNull) {
    EXPECT_EQ(LZS_SUCCESS, lzs_free_result(nullptr));
    EXPECT_EQ(LZS_SUCCESS, lzs_free_regex(nullptr));
}

// accessors: NULL result or output pointers
TEST(LazyscanArgChecks, AccessorsNull) {
    int matched;
    unsigned long long offset;
    unsigned count;
    long long from, to;
    EXPECT_EQ(LZS_INVALID, lzs_result_is_match(nullptr, &matched));
    EXPECT_EQ(LZS_INVALID, lzs_result_start(nullptr, &offset));
    EXPECT_EQ(LZS_INVALID, lzs_result_end(nullptr, &offset));
    EXPECT_EQ(LZS_INVALID, lzs_result_group_count(nullptr, &count));
    EXPECT_EQ(LZS_INVALID, lzs_result_group(nullptr, 0, &from, &to));

    lzs_regex_t *regex = makeAbcRegex();
    ASSERT_TRUE(regex != nullptr);
    const string data = "abc";
    lzs_result_t *result = searchOrFail(regex, data, 0);
    ASSERT_TRUE(result != nullptr);
    EXPECT_EQ(LZS_INVALID, lzs_result_is_match(result, nullptr));
    EXPECT_EQ(LZS_INVALID, lzs_result_start(result, nullptr));
    EXPECT_EQ(LZS_INVALID, lzs_result_end(result, nullptr));
    EXPECT_EQ(LZS_INVALID, lzs_result_group_count(result, nullptr));
    EXPECT_EQ(LZS_INVALID, lzs_result_group(result, 0, nullptr, &to));
    EXPECT_EQ(LZS_INVALID, lzs_result_group(result, 0, &from, nullptr));
    lzs_free_result(result);
    lzs_free_regex(regex);
}

// accessors: positions of a failed search
TEST(LazyscanArgChecks, AccessorsNoMatch) {
    lzs_regex_t *regex = makeAbcRegex();
    ASSERT_TRUE(regex != nullptr);
    const string data = "xyz";
    lzs_result_t *result = searchOrFail(regex, data, 0);
    ASSERT_TRUE(result != nullptr);

    int matched = -1;
    EXPECT_EQ(LZS_SUCCESS, lzs_result_is_match(result, &matched));
    EXPECT_EQ(0, matched);

    unsigned count = 99;
    EXPECT_EQ(LZS_SUCCESS, lzs_result_group_count(result, &count));
    EXPECT_EQ(0U, count);

    unsigned long long offset;
    long long from, to;
    EXPECT_EQ(LZS_NO_MATCH, lzs_result_start(result, &offset));
    EXPECT_EQ(LZS_NO_MATCH, lzs_result_end(result, &offset));
    EXPECT_EQ(LZS_NO_MATCH, lzs_result_group(result, 0, &from, &to));
    lzs_free_result(result);
    lzs_free_regex(regex);
}

// accessors: group index out of range
TEST(LazyscanArgChecks, GroupOutOfRange) {
    lzs_regex_t *regex = makeAbcRegex();
    ASSERT_TRUE(regex != nullptr);
    const string data = "abc";
    lzs_result_t *result = searchOrFail(regex, data, 0);
    ASSERT_TRUE(result != nullptr);
    long long from = -7, to = -7;
    EXPECT_EQ(LZS_INVALID, lzs_result_group(result, 2, &from, &to));
    EXPECT_EQ(-7, from);
    EXPECT_EQ(-7, to);
    lzs_free_result(result);
    lzs_free_regex(regex);
}
