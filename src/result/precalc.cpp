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

#include "precalc.h"
#include "regex_result.h"
#include "dfa/automaton.h"
#include "util/compile_error.h"

#include <string>
#include <utility>

using namespace std;

namespace lzs {

PrecalculatedResultFactory::PrecalculatedResultFactory(vector<s64a> rel_offsets,
                                                       u32 length)
    : indices(move(rel_offsets)), len(length) {
    if (indices.size() < 2 || indices.size() % 2) {
        throw CompileError("Precalculated result must hold a start and end "
                           "for every group.");
    }
    if (indices[0] != 0 || indices[1] != (s64a)len) {
        throw CompileError("Precalculated result must span the whole "
                           "match in group 0.");
    }

    for (size_t i = 2; i < indices.size(); i += 2) {
        s64a from = indices[i];
        s64a to = indices[i + 1];
        if (from == GROUP_UNSET && to == GROUP_UNSET) {
            continue;
        }
        if (from < 0 || from > to || to > (s64a)len) {
            throw CompileError("Precalculated group " + to_string(i / 2)
                               + " lies outside the match.");
        }
    }
}

RegexResult PrecalculatedResultFactory::createFromStart(s64a start) const {
    assert(start >= 0);
    if (indices.size() == 2) {
        return RegexResult::single(start, start + len);
    }

    vector<s64a> groups(indices);
    for (auto &g : groups) {
        if (g != GROUP_UNSET) {
            g += start;
        }
    }
    return RegexResult::captureGroups(move(groups));
}

RegexResult PrecalculatedResultFactory::createFromEnd(s64a end) const {
    assert(end >= (s64a)len);
    return createFromStart(end - len);
}

} // namespace lzs
