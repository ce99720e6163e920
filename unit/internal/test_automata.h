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
 * \brief Hand-built automata shared by the unit tests.
 *
 * Each pattern below is built directly as DFA tables: the forward automaton
 * finds the match end, the backward automaton finds the start (or the
 * precalculated result), and tagged automata report capture groups.
 */

#ifndef TEST_AUTOMATA_H
#define TEST_AUTOMATA_H

#include "lzscommon.h"
#include "dfa/automaton.h"
#include "dfa/dfa_exec.h"
#include "dfa/rdfa.h"
#include "dfa/tagged_exec.h"
#include "result/precalc.h"
#include "search/automata.h"
#include "search/regex_compiler.h"
#include "search/regex_source.h"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lzs {

static UNUSED
const u8 *bytes(const std::string &s) {
    return (const u8 *)s.data();
}

/** Symbol class 0 holds every byte not in \a chars; chars[i] gets class
 * i + 1. */
void setAlphabet(raw_dfa &raw, const std::string &chars);

void addEdge(raw_dfa &raw, dstate_id_t from, char c, dstate_id_t to);

/** Sends every symbol not yet given a successor in \a from to \a to. */
void addDefaultEdge(raw_dfa &raw, dstate_id_t from, dstate_id_t to);

void addTaggedEdge(raw_tagged_dfa &raw, dstate_id_t from, char c,
                   dstate_id_t to, const std::vector<tag_op> &ops);

/* a(b)?c */
std::shared_ptr<const Automaton> abcForward(bool floating = true);
std::shared_ptr<const Automaton> abcBackward();
std::shared_ptr<const Automaton> abcCaptureGroups();
std::shared_ptr<const Automaton> abcEager();

/* a(b)?c with a backward automaton and a capture group automaton */
std::shared_ptr<const CompiledAutomata> abcLazyAutomata(u32 flags = 0);

/* ^abc */
std::shared_ptr<const Automaton> anchoredAbcForward();

/* bc$ */
std::shared_ptr<const Automaton> bcForward();
std::shared_ptr<const Automaton> bcEndBackward();

/* [ab]c: the backward automaton reports 0 for 'a' and 1 for 'b' */
std::shared_ptr<const Automaton> acOrBcForward();
std::shared_ptr<const Automaton> acOrBcTraceBackward(bool anchored);
/* (?:(a)|(b))c: result 0 sets group 1, result 1 sets group 2 */
std::vector<PrecalculatedResultFactory> acOrBcPrecalc();
/* (?:(a)|(b))c as a searching capture group automaton */
std::shared_ptr<const Automaton> acOrBcEager();

/* x* */
std::shared_ptr<const Automaton> xStarForward();
std::shared_ptr<const Automaton> xStarBackward();

/** Forwards to another automaton, counting executions. */
class CountingAutomaton : public Automaton {
public:
    explicit CountingAutomaton(std::shared_ptr<const Automaton> inner_in)
        : inner(std::move(inner_in)), calls(0) {}

    MatchOutcome execute(const u8 *buf, size_t len, s64a from_index,
                         s64a start_index, s64a max_index) const override {
        calls++;
        return inner->execute(buf, len, from_index, start_index, max_index);
    }
    bool isAnchored() const override { return inner->isAnchored(); }
    u32 prefixLength() const override { return inner->prefixLength(); }
    u32 numCaptureGroups() const override {
        return inner->numCaptureGroups();
    }

    u32 executions() const { return calls.load(); }

private:
    std::shared_ptr<const Automaton> inner;
    mutable std::atomic<u32> calls;
};

/** Reports the metadata of another automaton but throws a non-library
 * exception on every execution. */
class FailingAutomaton : public Automaton {
public:
    explicit FailingAutomaton(std::shared_ptr<const Automaton> inner_in)
        : inner(std::move(inner_in)) {}

    MatchOutcome execute(const u8 *, size_t, s64a, s64a,
                         s64a) const override {
        throw std::runtime_error("automaton failed");
    }
    bool isAnchored() const override { return inner->isAnchored(); }
    u32 prefixLength() const override { return inner->prefixLength(); }
    u32 numCaptureGroups() const override {
        return inner->numCaptureGroups();
    }

private:
    std::shared_ptr<const Automaton> inner;
};

/** Hands out prebuilt automata, optionally failing. */
class FixedCompiler : public RegexCompiler {
public:
    FixedCompiler(std::shared_ptr<const CompiledAutomata> lazy_in,
                  std::shared_ptr<const Automaton> eager_in)
        : lazy(std::move(lazy_in)), eager(std::move(eager_in)),
          compile_calls(0), eager_calls(0) {}

    std::shared_ptr<const CompiledAutomata>
    compile(const RegexSource &source) const override;

    std::shared_ptr<const Automaton>
    compileEager(const RegexSource &source) const override;

    bool fail_compile = false;
    bool fail_eager = false;
    bool crash_compile = false; //!< throw std::runtime_error from compile()

    std::shared_ptr<const CompiledAutomata> lazy;
    std::shared_ptr<const Automaton> eager;
    mutable std::atomic<u32> compile_calls;
    mutable std::atomic<u32> eager_calls;
};

} // namespace lzs

#endif
