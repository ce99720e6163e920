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
 * \brief Tagged DFA executor: a forward scan that records capture group
 * boundaries in a register file.
 */

#ifndef TAGGED_EXEC_H
#define TAGGED_EXEC_H

#include "automaton.h"
#include "dfa_exec.h"
#include "rdfa.h"
#include "lzscommon.h"

#include <array>
#include <vector>

#include <boost/dynamic_bitset.hpp>

namespace lzs {

class TaggedDfaExecutor : public Automaton {
public:
    /** Flattens \a raw; throws CompileError if the table is malformed or
     * \a props_in asks for a backward scan. */
    TaggedDfaExecutor(const raw_tagged_dfa &raw, const dfa_props &props_in);
    ~TaggedDfaExecutor() override;

    MatchOutcome execute(const u8 *buf, size_t len, s64a from_index,
                         s64a start_index, s64a max_index) const override;

    bool isAnchored() const override { return props.anchored; }
    u32 prefixLength() const override { return props.prefix_len; }
    u32 numCaptureGroups() const override { return num_groups; }

private:
    /** Half-open range of ops in the op table. */
    struct op_range {
        u32 begin;
        u32 end;
    };

    op_range appendOps(const tag_op_list &ops);
    void applyOps(op_range r, s64a idx, std::vector<s64a> &regs) const;

    dfa_props props;
    u32 num_groups;
    u16 alpha_size;
    std::array<u16, N_CHARS> remap;
    std::vector<dstate_id_t> succ_table; //!< num_states * alpha_size
    std::vector<op_range> tran_ops;      //!< parallel to succ_table
    std::vector<op_range> accept_ops;    //!< per state
    std::vector<tag_op> ops;
    boost::dynamic_bitset<> accepts;
    dstate_id_t start_anchored;
    dstate_id_t start_floating;
};

} // namespace lzs

#endif
