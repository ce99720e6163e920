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

#include "match_profile.h"
#include "grey.h"

namespace lzs {

MatchProfile::MatchProfile(const Grey &grey)
    : trip_point(MAX(grey.eagerEvaluationTripPoint, 1U)),
      min_calls(grey.eagerMinCalls),
      min_match_percent(grey.eagerMinMatchPercent),
      min_group_access_percent(grey.eagerMinGroupAccessPercent),
      n_calls(0), n_matches(0), n_group_accesses(0) {}

bool MatchProfile::atEvaluationTripPoint() const {
    u64a c = calls();
    return c && c % trip_point == 0;
}

bool MatchProfile::shouldUseEagerMatching() const {
    u64a c = calls();
    u64a m = matches();
    u64a g = captureGroupAccesses();

    if (c < min_calls) {
        return false;
    }

    bool rv = m * 100 >= c * min_match_percent
           && g * 100 >= m * min_group_access_percent;
    DEBUG_PRINTF("calls %llu matches %llu group accesses %llu -> %d\n", c, m,
                 g, (int)rv);
    return rv;
}

} // namespace lzs
