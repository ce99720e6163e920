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
 * \brief Table-driven DFA executor for forward and backward scans.
 */

#ifndef DFA_EXEC_H
#define DFA_EXEC_H

#include "automaton.h"
#include "rdfa.h"
#include "lzscommon.h"

#include <array>
#include <vector>

#include <boost/dynamic_bitset.hpp>

namespace lzs {

enum ScanDirection {
    SCAN_FORWARD,
    SCAN_BACKWARD
};

/** \brief Properties the compiler attaches to a DFA. */
struct dfa_props {
    ScanDirection direction = SCAN_FORWARD;
    bool anchored = false;
    u32 prefix_len = 0;

    /** Report the accepting state's report value rather than a position;
     * used by trace finder backward scans. */
    bool report_result = false;
};

/** \brief Runs a plain DFA. Forward scans report the index after the last
 * accepting state; backward scans report the index before it. */
class DfaExecutor : public Automaton {
public:
    /** Flattens \a raw; throws CompileError if the table is malformed. */
    DfaExecutor(const raw_dfa &raw, const dfa_props &props_in);
    ~DfaExecutor() override;

    MatchOutcome execute(const u8 *buf, size_t len, s64a from_index,
                         s64a start_index, s64a max_index) const override;

    bool isAnchored() const override { return props.anchored; }
    u32 prefixLength() const override { return props.prefix_len; }
    u32 numCaptureGroups() const override { return 0; }

    ScanDirection direction() const { return props.direction; }

private:
    dstate_id_t next(dstate_id_t s, u8 c) const {
        return succ_table[(size_t)s * alpha_size + remap[c]];
    }

    s64a resultFor(dstate_id_t s, s64a idx) const {
        return props.report_result ? (s64a)reports[s] : idx;
    }

    MatchOutcome scanForward(const u8 *buf, s64a start_index,
                             s64a max_index) const;
    MatchOutcome scanBackward(const u8 *buf, size_t len, s64a start_index,
                              s64a max_index) const;

    dfa_props props;
    u16 alpha_size;
    std::array<u16, N_CHARS> remap;
    std::vector<dstate_id_t> succ_table; //!< num_states * alpha_size
    boost::dynamic_bitset<> accepts;
    std::vector<u32> reports;
    dstate_id_t start_anchored;
    dstate_id_t start_floating;
};

} // namespace lzs

#endif
