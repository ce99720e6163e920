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
 * \brief Lazy search strategy: find the end of a match with a forward scan
 * and leave the start and capture groups for the result to resolve on
 * demand.
 */

#ifndef LAZY_SEARCH_H
#define LAZY_SEARCH_H

#include "result/regex_result.h"
#include "lzscommon.h"

#include <memory>

namespace lzs {

struct CompiledAutomata;
class MatchProfile;

class LazySearch {
public:
    LazySearch(std::shared_ptr<const CompiledAutomata> automata_in,
               std::shared_ptr<MatchProfile> profile_in);

    RegexResult run(const u8 *buf, size_t len, s64a from_index) const;

private:
    RegexResult executeForward(const u8 *buf, size_t len,
                               s64a from_index) const;
    RegexResult executeBackwardAnchored(const u8 *buf, size_t len,
                                        s64a from_index) const;
    DeferredScan bind(const u8 *buf, size_t len, s64a from_index) const;

    std::shared_ptr<const CompiledAutomata> automata;
    std::shared_ptr<MatchProfile> profile;
};

} // namespace lzs

#endif
