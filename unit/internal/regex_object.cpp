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

#include "search/regex_object.h"
#include "search/compiled_regex.h"
#include "search/match_profile.h"
#include "lzs_common.h"
#include "util/compile_error.h"
#include "test_automata.h"
#include "gtest/gtest.h"

#include <memory>
#include <string>

using namespace std;
using namespace lzs;

TEST(regex_object, compiles_on_first_use) {
    auto compiler = make_shared<FixedCompiler>(abcLazyAutomata(), abcEager());
    RegexObject ro(RegexSource("a(b)?c", LZS_FLAG_DOTALL), compiler);
    EXPECT_EQ("a(b)?c", ro.getSource().pattern);
    EXPECT_EQ(0U, compiler->compile_calls.load());

    const string s = "xabc";
    RegexResult r = ro.search(bytes(s), s.size(), 0);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(1, r.start());
    EXPECT_EQ(3, r.groupEnd(1));
    EXPECT_EQ(1U, compiler->compile_calls.load());

    ro.search(bytes(s), s.size(), 1);
    auto cr = ro.getCompiledRegex();
    EXPECT_EQ(1U, compiler->compile_calls.load());
    EXPECT_EQ(2U, cr->getProfile().calls());
    EXPECT_EQ((u32)LZS_FLAG_DOTALL, cr->getSource().flags);
}

TEST(regex_object, compile_failure_retried) {
    auto compiler = make_shared<FixedCompiler>(abcLazyAutomata(), abcEager());
    compiler->fail_compile = true;
    RegexObject ro(RegexSource("a(b)?c", 0), compiler);

    const string s = "abc";
    EXPECT_THROW(ro.search(bytes(s), s.size(), 0), CompileError);
    EXPECT_THROW(ro.getCompiledRegex(), CompileError);
    EXPECT_EQ(2U, compiler->compile_calls.load());

    compiler->fail_compile = false;
    EXPECT_TRUE(ro.search(bytes(s), s.size(), 0).isMatch());
    EXPECT_EQ(3U, compiler->compile_calls.load());
}

TEST(regex_object, no_automata) {
    auto compiler = make_shared<FixedCompiler>(nullptr, nullptr);
    RegexObject ro(RegexSource("a(b)?c", 0), compiler);
    EXPECT_THROW(ro.getCompiledRegex(), CompileError);

    RegexObject orphan(RegexSource("a(b)?c", 0), nullptr);
    EXPECT_THROW(orphan.getCompiledRegex(), CompileError);
}

TEST(regex_object, installed_regex) {
    RegexObject ro(RegexSource("a(b)?c", 0), nullptr);
    auto cr = make_shared<CompiledRegex>(RegexSource("a(b)?c", 0),
                                         abcLazyAutomata(), nullptr, Grey());
    ro.setCompiledRegex(cr);
    EXPECT_EQ(cr, ro.getCompiledRegex());

    const string s = "ac";
    RegexResult r = ro.search(bytes(s), s.size(), 0);
    ASSERT_TRUE(r.isMatch());
    EXPECT_EQ(0, r.start());
    EXPECT_EQ(2, r.end());
    EXPECT_EQ(1U, cr->getProfile().calls());
}

TEST(regex_object, grey_passed_on) {
    Grey g;
    g.profileSearches = false;
    auto compiler = make_shared<FixedCompiler>(abcLazyAutomata(), abcEager());
    RegexObject ro(RegexSource("a(b)?c", 0), compiler, g);

    const string s = "abc";
    ro.search(bytes(s), s.size(), 0);
    EXPECT_EQ(0U, ro.getCompiledRegex()->getProfile().calls());
}
