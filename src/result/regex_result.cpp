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

#include "regex_result.h"
#include "search/automata.h"
#include "util/contract_error.h"

#include <ostream>
#include <string>
#include <utility>

using namespace std;

namespace lzs {

RegexResult::RegexResult(Kind k, s64a start_in, s64a end_in,
                         bool start_known_in)
    : result_kind(k), end_offset(end_in), start_offset(start_in),
      start_known(start_known_in) {}

RegexResult RegexResult::noMatch() {
    return RegexResult(NO_MATCH, GROUP_UNSET, GROUP_UNSET, false);
}

RegexResult RegexResult::single(s64a start, s64a end) {
    assert(start >= 0 && start <= end);
    return RegexResult(SINGLE, start, end, true);
}

RegexResult RegexResult::singleLazyStart(DeferredScan scan, s64a end) {
    RegexResult rv(SINGLE_LAZY_START, GROUP_UNSET, end, false);
    rv.scan = make_shared<const DeferredScan>(move(scan));
    return rv;
}

RegexResult RegexResult::lazyCaptureGroups(DeferredScan scan, s64a start,
                                           s64a end) {
    assert(start >= 0 && start <= end);
    RegexResult rv(LAZY_CAPTURE_GROUPS, start, end, true);
    rv.scan = make_shared<const DeferredScan>(move(scan));
    return rv;
}

RegexResult RegexResult::lazyCaptureGroups(DeferredScan scan, s64a end) {
    RegexResult rv(LAZY_CAPTURE_GROUPS, GROUP_UNSET, end, false);
    rv.scan = make_shared<const DeferredScan>(move(scan));
    return rv;
}

RegexResult RegexResult::captureGroups(vector<s64a> groups_in) {
    assert(groups_in.size() >= 2 && groups_in.size() % 2 == 0);
    RegexResult rv(LAZY_CAPTURE_GROUPS, groups_in[0], groups_in[1], true);
    rv.groups = move(groups_in);
    return rv;
}

RegexResult RegexResult::traceFinder(DeferredScan scan, s64a end) {
    RegexResult rv(TRACE_FINDER, GROUP_UNSET, end, false);
    rv.scan = make_shared<const DeferredScan>(move(scan));
    return rv;
}

void RegexResult::checkMatch() const {
    if (result_kind == NO_MATCH) {
        throw NoMatchError();
    }
}

void RegexResult::checkGroup(u32 group) const {
    checkMatch();
    if (group >= numGroups()) {
        throw OutOfRangeError("Group " + to_string(group)
                              + " is out of range for a result with "
                              + to_string(numGroups()) + " groups.");
    }
}

void RegexResult::resolveStart() const {
    if (start_known) {
        return;
    }

    assert(scan);
    switch (result_kind) {
    case SINGLE_LAZY_START:
    case LAZY_CAPTURE_GROUPS:
        start_offset = scan->findStart(end_offset);
        break;
    case TRACE_FINDER:
        resolveGroups();
        start_offset = groups[0];
        break;
    default:
        assert(0);
        return;
    }

    DEBUG_PRINTF("resolved start %lld for end %lld\n", start_offset,
                 end_offset);
    start_known = true;
}

void RegexResult::resolveGroups() const {
    if (!groups.empty()) {
        return;
    }

    assert(scan);
    switch (result_kind) {
    case LAZY_CAPTURE_GROUPS:
        resolveStart();
        groups = scan->captureGroups(start_offset, end_offset);
        assert(groups[0] == start_offset && groups[1] == end_offset);
        break;
    case TRACE_FINDER: {
        u32 idx = scan->findTraceIndex(end_offset);
        DEBUG_PRINTF("trace finder picked result %u\n", idx);
        RegexResult rv = scan->automata().precalc[idx].createFromEnd(
                                                                end_offset);
        for (u32 i = 0; i < rv.numGroups(); i++) {
            groups.push_back(rv.groupStart(i));
            groups.push_back(rv.groupEnd(i));
        }
        break;
    }
    default:
        assert(0);
        break;
    }
}

s64a RegexResult::start() const {
    checkMatch();
    resolveStart();
    return start_offset;
}

s64a RegexResult::end() const {
    checkMatch();
    return end_offset;
}

u32 RegexResult::numGroups() const {
    switch (result_kind) {
    case NO_MATCH:
        return 0;
    case SINGLE:
    case SINGLE_LAZY_START:
        return 1;
    case LAZY_CAPTURE_GROUPS:
        if (!groups.empty()) {
            return groups.size() / 2;
        }
        /* fall through */
    case TRACE_FINDER:
        assert(scan);
        return scan->automata().numGroups();
    }
    assert(0);
    return 0;
}

s64a RegexResult::groupOffset(u32 idx) const {
    switch (result_kind) {
    case SINGLE:
    case SINGLE_LAZY_START:
        return idx == 0 ? start() : end_offset;
    case LAZY_CAPTURE_GROUPS:
    case TRACE_FINDER:
        resolveGroups();
        return groups[idx];
    case NO_MATCH:
        break;
    }
    assert(0);
    throw NoMatchError();
}

s64a RegexResult::groupStart(u32 group) const {
    checkGroup(group);
    return groupOffset(group * 2);
}

s64a RegexResult::groupEnd(u32 group) const {
    checkGroup(group);
    return groupOffset(group * 2 + 1);
}

static
const char *kindName(RegexResult::Kind k) {
    switch (k) {
    case RegexResult::NO_MATCH:
        return "no_match";
    case RegexResult::SINGLE:
        return "single";
    case RegexResult::SINGLE_LAZY_START:
        return "single_lazy_start";
    case RegexResult::LAZY_CAPTURE_GROUPS:
        return "lazy_capture_groups";
    case RegexResult::TRACE_FINDER:
        return "trace_finder";
    }
    return "unknown";
}

ostream &operator<<(ostream &os, const RegexResult &r) {
    os << kindName(r.kind());
    if (!r.isMatch()) {
        return os;
    }

    /* only print what is already known; printing must not resolve */
    os << "[";
    if (r.startResolved()) {
        os << r.start();
    } else {
        os << "?";
    }
    os << "," << r.end() << ")";
    return os;
}

} // namespace lzs
