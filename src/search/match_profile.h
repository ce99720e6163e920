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
 * \brief MatchProfile: per-regex counters that drive the lazy to eager
 * strategy switch.
 */

#ifndef MATCH_PROFILE_H
#define MATCH_PROFILE_H

#include "lzscommon.h"

#include <atomic>
#include <cstdint>

#include <boost/core/noncopyable.hpp>

namespace lzs {

struct Grey;

/** \brief Approximate usage counters for one compiled regex.
 *
 * Counters are relaxed atomics and updates from concurrent searches may be
 * reordered; the heuristic only needs the trend. */
class MatchProfile : boost::noncopyable {
public:
    explicit MatchProfile(const Grey &grey);

    void incCalls() { n_calls.fetch_add(1, std::memory_order_relaxed); }
    void incMatches() { n_matches.fetch_add(1, std::memory_order_relaxed); }

    /** \brief Records a lazy capture group resolution by a caller. */
    void incCaptureGroupAccesses() {
        n_group_accesses.fetch_add(1, std::memory_order_relaxed);
    }

    u64a calls() const { return n_calls.load(std::memory_order_relaxed); }
    u64a matches() const { return n_matches.load(std::memory_order_relaxed); }
    u64a captureGroupAccesses() const {
        return n_group_accesses.load(std::memory_order_relaxed);
    }

    /** \brief True once every eagerEvaluationTripPoint calls. A zero trip
     * point evaluates on every call. */
    bool atEvaluationTripPoint() const;

    /** \brief True if call volume, match ratio and capture group usage make
     * eager capture group matching the cheaper strategy. */
    bool shouldUseEagerMatching() const;

private:
    const u32 trip_point;
    const u32 min_calls;
    const u32 min_match_percent;
    const u32 min_group_access_percent;

    std::atomic<uint64_t> n_calls;
    std::atomic<uint64_t> n_matches;
    std::atomic<uint64_t> n_group_accesses;
};

} // namespace lzs

#endif
