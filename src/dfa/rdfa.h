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
 * \brief Raw DFA tables, as produced by the pattern compiler.
 */

#ifndef RDFA_H
#define RDFA_H

#include "lzscommon.h"

#include <array>
#include <vector>

#include <boost/container/small_vector.hpp>

namespace lzs {

typedef u16 dstate_id_t;
typedef u16 symbol_t;

static constexpr dstate_id_t DEAD_STATE = 0;

/** Structure representing a dfa state in a raw table. */
struct dstate {
    /** Next state; indexed by remapped sym */
    std::vector<dstate_id_t> next;

    /** Accepting state: reaching it records a candidate result. */
    bool accept = false;

    /** Value returned instead of a position by report-mode executors. */
    u32 report = 0;

    explicit dstate(size_t alphabet_size) : next(alphabet_size, DEAD_STATE) {}
};

struct raw_dfa {
    std::vector<dstate> states;
    dstate_id_t start_anchored = DEAD_STATE; //!< scan begins at a boundary
    dstate_id_t start_floating = DEAD_STATE; //!< scan begins elsewhere
    u16 alpha_size = 0;

    /* mapping from input symbol --> equiv class id */
    std::array<u16, N_CHARS> alpha_remap;

    explicit raw_dfa(u16 alpha_size_in);
    virtual ~raw_dfa();

    /** \brief Appends a state with all transitions to the dead state and
     * returns its id. */
    dstate_id_t addState(void);
};

/** \brief Capture register update attached to a transition or accept
 * state. */
struct tag_op {
    tag_op(u32 r, bool c) : reg(r), clear(c) {}

    u32 reg;    //!< register index: 2 * group (+1 for the group end)
    bool clear; //!< reset to "unset" rather than the current position
};

typedef boost::container::small_vector<tag_op, 2> tag_op_list;

/** Tag operations for a dfa state in a raw tagged table. */
struct dstate_tags {
    /** Applied before the symbol is consumed; indexed by remapped sym */
    std::vector<tag_op_list> tran;

    /** Applied to the snapshot taken when the state accepts. */
    tag_op_list accept;

    explicit dstate_tags(size_t alphabet_size) : tran(alphabet_size) {}
};

/** \brief A raw DFA whose transitions also maintain capture group
 * registers. */
struct raw_tagged_dfa : public raw_dfa {
    raw_tagged_dfa(u16 alpha_size_in, u32 num_groups_in)
        : raw_dfa(alpha_size_in), num_groups(num_groups_in),
          state_tags(1, dstate_tags(alpha_size_in)) {}
    ~raw_tagged_dfa() override;

    u32 num_groups;
    std::vector<dstate_tags> state_tags; //!< parallel to states

    dstate_id_t addState(void);
};

/** \brief Checks that a raw table is well formed: every state has a full
 * row, every successor and start state exists and the remap stays inside the
 * alphabet. Throws CompileError otherwise. */
void checkRawDfa(const raw_dfa &raw);

/** \brief As above, and also checks the tag tables against the register
 * file implied by the group count. */
void checkRawTaggedDfa(const raw_tagged_dfa &raw);

} // namespace lzs

#endif
