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

#ifndef GREY_H
#define GREY_H

#include <string>

#include "lzscommon.h"

namespace lzs {

/** \brief Tuning knobs for the matching runtime.
 *
 * None of these affect match semantics; they only decide which strategy is
 * used to produce a result and when that decision is revisited. */
struct Grey {
    Grey(void);

    /** \brief Profile searches made with the lazy strategy. With profiling
     * off a compiled regex never leaves the lazy strategy. */
    bool profileSearches;

    /** \brief Allow a compiled regex to switch to eager capture group
     * matching. When off, the switch is recorded as unavailable. */
    bool allowEagerMatching;

    u32 eagerEvaluationTripPoint; //!< calls between heuristic evaluations
    u32 eagerMinCalls;            //!< min call volume before switching
    u32 eagerMinMatchPercent;     //!< min matches, as a percentage of calls
    u32 eagerMinGroupAccessPercent; //!< min group resolutions, as a
                                    //!< percentage of matches
};

#ifndef RELEASE_BUILD
void applyGreyOverrides(Grey *g, const std::string &overrides);
#endif

} // namespace lzs

#endif
