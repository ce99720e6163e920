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
 * \brief Automaton: the capability interface shared by all compiled
 * automata, and the outcome type of a single scan.
 */

#ifndef AUTOMATON_H
#define AUTOMATON_H

#include "lzscommon.h"

#include <utility>
#include <vector>

#include <boost/core/noncopyable.hpp>

namespace lzs {

/** \brief Offset reported for a capture group that did not participate in
 * the match. */
static constexpr s64a GROUP_UNSET = -1;

/** \brief Outcome of running one automaton over an input range. */
struct MatchOutcome {
    enum Type {
        NO_MATCH, //!< the automaton never accepted
        OFFSET,   //!< a single index or report value
        GROUPS    //!< capture group boundaries, two entries per group
    };

    static MatchOutcome noMatch() { return MatchOutcome(NO_MATCH, 0); }

    static MatchOutcome offset(s64a v) { return MatchOutcome(OFFSET, v); }

    static MatchOutcome groups(std::vector<s64a> g) {
        MatchOutcome mo(GROUPS, 0);
        mo.offsets = std::move(g);
        return mo;
    }

    bool matched() const { return type != NO_MATCH; }

    Type type;
    s64a value; //!< valid for OFFSET
    std::vector<s64a> offsets; //!< valid for GROUPS; GROUP_UNSET if absent

private:
    MatchOutcome(Type t, s64a v) : type(t), value(v) {}
};

/** \brief A compiled, immutable automaton.
 *
 * Implementations are pure functions of their tables and arguments, and may
 * be shared between threads. */
class Automaton : boost::noncopyable {
public:
    virtual ~Automaton();

    /** \brief Scan \a buf from \a start_index towards \a max_index.
     *
     * Forward automata stop before \a max_index; backward automata consume
     * indices down to, but excluding, \a max_index. \a from_index is the
     * index the enclosing search began at. */
    virtual MatchOutcome execute(const u8 *buf, size_t len, s64a from_index,
                                 s64a start_index, s64a max_index) const = 0;

    /** \brief True if matches can only begin (for backward automata: end) at
     * a fixed logical position. */
    virtual bool isAnchored() const = 0;

    /** \brief Number of lookbehind positions consumed before the semantic
     * input starts. */
    virtual u32 prefixLength() const = 0;

    /** \brief Number of capture groups reported, including group 0; zero for
     * automata that only report offsets. */
    virtual u32 numCaptureGroups() const = 0;
};

} // namespace lzs

#endif
