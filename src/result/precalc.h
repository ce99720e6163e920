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
 * \brief Precalculated ("trace finder") result factories.
 *
 * When the compiler proves that a pattern only has a small, fixed set of
 * capture group shapes, each of fixed length, it emits one factory per shape.
 * A factory turns either boundary of a match into the complete set of group
 * offsets without running a capture group automaton.
 */

#ifndef PRECALC_H
#define PRECALC_H

#include "lzscommon.h"

#include <vector>

namespace lzs {

class RegexResult;

class PrecalculatedResultFactory {
public:
    /** \a rel_offsets holds two entries per group, relative to the match
     * start, GROUP_UNSET for groups that do not participate; group 0 must
     * span [0, \a length]. Throws CompileError if the template is
     * malformed. */
    PrecalculatedResultFactory(std::vector<s64a> rel_offsets, u32 length);

    RegexResult createFromStart(s64a start) const;
    RegexResult createFromEnd(s64a end) const;

    u32 numGroups() const { return indices.size() / 2; }
    u32 length() const { return len; }

private:
    std::vector<s64a> indices;
    u32 len;
};

} // namespace lzs

#endif
