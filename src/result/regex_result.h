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
 * \brief RegexResult: the closed set of result shapes returned by a search.
 *
 * Lazy shapes carry a DeferredScan and resolve their start and capture
 * groups the first time a caller asks for them. Resolved values are cached,
 * so every accessor returns the same value on every call. A result has one
 * owner; it must not be accessed from several threads at once.
 */

#ifndef REGEX_RESULT_H
#define REGEX_RESULT_H

#include "search/deferred.h"
#include "lzscommon.h"

#include <iosfwd>
#include <memory>
#include <vector>

namespace lzs {

class RegexResult {
public:
    enum Kind {
        NO_MATCH,
        SINGLE,              //!< start and end known
        SINGLE_LAZY_START,   //!< end known, start by backward scan
        LAZY_CAPTURE_GROUPS, //!< end known, groups (and maybe start) deferred
        TRACE_FINDER         //!< end known, groups from a precalculated result
    };

    static RegexResult noMatch();
    static RegexResult single(s64a start, s64a end);
    static RegexResult singleLazyStart(DeferredScan scan, s64a end);

    /** \brief Capture groups deferred; the start is already known. */
    static RegexResult lazyCaptureGroups(DeferredScan scan, s64a start,
                                         s64a end);

    /** \brief Capture groups and start both deferred. */
    static RegexResult lazyCaptureGroups(DeferredScan scan, s64a end);

    /** \brief Fully resolved capture groups, two offsets per group. */
    static RegexResult captureGroups(std::vector<s64a> groups);

    static RegexResult traceFinder(DeferredScan scan, s64a end);

    Kind kind() const { return result_kind; }
    bool isMatch() const { return result_kind != NO_MATCH; }

    s64a start() const;
    s64a end() const;

    /** \brief Number of groups, including group 0 (the whole match). */
    u32 numGroups() const;

    s64a groupStart(u32 group) const;
    s64a groupEnd(u32 group) const;

    /** \brief True if the start is known without further scanning. */
    bool startResolved() const { return start_known; }

    /** \brief True if the groups are known without further scanning. */
    bool groupsResolved() const { return !groups.empty(); }

private:
    RegexResult(Kind k, s64a start_in, s64a end_in, bool start_known_in);

    void checkMatch() const;
    void checkGroup(u32 group) const;
    void resolveStart() const;
    void resolveGroups() const;
    s64a groupOffset(u32 idx) const;

    Kind result_kind;
    s64a end_offset;
    std::shared_ptr<const DeferredScan> scan;

    mutable s64a start_offset;
    mutable bool start_known;
    mutable std::vector<s64a> groups; //!< empty until resolved
};

std::ostream &operator<<(std::ostream &os, const RegexResult &r);

} // namespace lzs

#endif
