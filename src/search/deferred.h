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
 * \brief Deferred scans: the backward and capture group scans a lazy result
 * runs when a caller first asks for the values they produce.
 */

#ifndef DEFERRED_H
#define DEFERRED_H

#include "lzscommon.h"

#include <memory>
#include <vector>

namespace lzs {

struct CompiledAutomata;
class MatchProfile;

/** \brief Lowest index a backward scan for a search that began at
 * \a from_index may consume, exclusive. */
static really_inline
s64a backwardScanFloor(s64a from_index, u32 prefix_len) {
    return MAX((s64a)-1, from_index - 1 - (s64a)prefix_len);
}

/** \brief Binds the automata, input and search origin a lazy result needs
 * to finish its work later.
 *
 * The input buffer is not copied and must outlive the binding. */
class DeferredScan {
public:
    DeferredScan(std::shared_ptr<const CompiledAutomata> automata_in,
                 std::shared_ptr<MatchProfile> profile_in, const u8 *buf_in,
                 size_t len_in, s64a from_index_in);

    /** \brief Runs the backward automaton from just before \a end and
     * returns the start of the match. */
    s64a findStart(s64a end) const;

    /** \brief Runs the backward automaton from just before \a end and
     * returns the index of the precalculated result that applies. */
    u32 findTraceIndex(s64a end) const;

    /** \brief Runs the capture group automaton over [\a start, \a end) and
     * returns the group offsets. */
    std::vector<s64a> captureGroups(s64a start, s64a end) const;

    const CompiledAutomata &automata() const { return *automata_ptr; }
    s64a fromIndex() const { return from_index; }

private:
    s64a runBackward(s64a end) const;

    std::shared_ptr<const CompiledAutomata> automata_ptr;
    std::shared_ptr<MatchProfile> profile;
    const u8 *buf;
    size_t len;
    s64a from_index;
};

} // namespace lzs

#endif
