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
 * \brief CompiledAutomata: the immutable bundle of automata and
 * precalculated results the compiler produces for one pattern.
 */

#ifndef AUTOMATA_H
#define AUTOMATA_H

#include "dfa/automaton.h"
#include "result/precalc.h"
#include "lzscommon.h"

#include <memory>
#include <vector>

namespace lzs {

struct CompiledAutomata {
    /** Checks that the bundle is usable by the search strategies; throws
     * ContractError if an automaton that some search path needs is
     * missing. */
    CompiledAutomata(std::shared_ptr<const Automaton> forward_in,
                     std::shared_ptr<const Automaton> backward_in,
                     std::shared_ptr<const Automaton> capture_groups_in,
                     std::vector<PrecalculatedResultFactory> precalc_in,
                     u32 flags_in);

    std::shared_ptr<const Automaton> forward;
    std::shared_ptr<const Automaton> backward;       //!< may be null
    std::shared_ptr<const Automaton> capture_groups; //!< may be null
    std::vector<PrecalculatedResultFactory> precalc; //!< may be empty

    u32 flags; //!< LZS_FLAG_* of the source pattern

    bool isSticky() const;

    bool singlePreCalcResult() const { return precalc.size() == 1; }
    bool multiplePreCalcResults() const { return precalc.size() > 1; }

    /** \brief Number of groups reported by results, including group 0. */
    u32 numGroups() const;
};

} // namespace lzs

#endif
