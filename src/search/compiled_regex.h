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

/** \file
 * \brief CompiledRegex: the top-level search entry for one compiled pattern.
 */

#ifndef COMPILED_REGEX_H
#define COMPILED_REGEX_H

#include "eager_search.h"
#include "lazy_search.h"
#include "regex_source.h"
#include "result/regex_result.h"
#include "lzscommon.h"

#include <atomic>
#include <memory>
#include <mutex>

#include <boost/core/noncopyable.hpp>

namespace lzs {

struct CompiledAutomata;
struct Grey;
class MatchProfile;
class RegexCompiler;

/** \brief Search strategy currently used by a CompiledRegex. LAZY moves to
 * one of the other two states at most once. */
enum StrategyState : u8 {
    STRATEGY_LAZY,
    STRATEGY_EAGER,
    STRATEGY_EAGER_UNAVAILABLE
};

/** \brief Owns the automata, profile and strategy slot of one pattern.
 *
 * search() may be called from several threads at once. */
class CompiledRegex : boost::noncopyable {
public:
    /** \a compiler is asked for an eager automaton if profiling calls for
     * one; it may be null, in which case eager matching is unavailable. */
    CompiledRegex(RegexSource source_in,
                  std::shared_ptr<const CompiledAutomata> automata_in,
                  std::shared_ptr<const RegexCompiler> compiler_in,
                  const Grey &grey);
    ~CompiledRegex();

    /** \brief Finds the first match at or after \a from_index.
     *
     * Throws OutOfRangeError if \a from_index lies outside [0, \a len]. The
     * buffer must outlive any deferred access on the returned result. */
    RegexResult search(const u8 *buf, size_t len, s64a from_index);

    StrategyState strategyState() const {
        return (StrategyState)state.load(std::memory_order_acquire);
    }

    const MatchProfile &getProfile() const { return *profile; }
    const RegexSource &getSource() const { return source; }
    const CompiledAutomata &getAutomata() const { return *automata; }

private:
    void profileSearch(const RegexResult &rv);
    void switchToEager();

    const RegexSource source;
    std::shared_ptr<const CompiledAutomata> automata;
    std::shared_ptr<const RegexCompiler> compiler;
    std::shared_ptr<MatchProfile> profile;

    const bool profile_searches;
    const bool allow_eager;

    LazySearch lazy;
    std::unique_ptr<const EagerSearch> eager; //!< published before state
    std::atomic<u8> state;
    std::mutex switch_lock;
};

} // namespace lzs

#endif
