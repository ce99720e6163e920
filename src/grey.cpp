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

#include "grey.h"
#include "lzscommon.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib> // exit
#include <string>

#define DEFAULT_TRIP_POINT 800

using namespace std;

namespace lzs {

Grey::Grey(void) :
                   profileSearches(true),
                   allowEagerMatching(true),
                   eagerEvaluationTripPoint(DEFAULT_TRIP_POINT),
                   eagerMinCalls(DEFAULT_TRIP_POINT),
                   eagerMinMatchPercent(50),
                   eagerMinGroupAccessPercent(50)
{
    assert(eagerEvaluationTripPoint); /* used as a modulus */
}

} // namespace lzs

#ifndef RELEASE_BUILD

#include <boost/lexical_cast.hpp>
using boost::lexical_cast;

namespace lzs {

void applyGreyOverrides(Grey *g, const string &s) {
    string::const_iterator p = s.begin();
    string::const_iterator pe = s.end();
    string help = "help:0";
    bool invalid_key_seen = false;
    Grey defaultg;

    if (s == "help" || s == "help:") {
        printf("Valid grey overrides:\n");
        p = help.begin();
        pe = help.end();
    }

    while (p != pe) {
        string::const_iterator ke = find(p, pe, ':');

        if (ke == pe) {
            break;
        }

        string key(p, ke);

        string::const_iterator ve = find(ke, pe, ';');

        unsigned int value = 0;
        try {
            value = lexical_cast<unsigned int>(string(ke + 1, ve));
        } catch (boost::bad_lexical_cast &e) {
            printf("Invalid grey override key %s:%s\n", key.c_str(),
                   string(ke + 1, ve).c_str());
            invalid_key_seen = true;
            break;
        }
        bool done = false;

#define G_UPDATE(k) do {                                                \
            if (key == ""#k) { g->k = value; done = 1;}                 \
            if (key == "help") {                                        \
                printf("\t%-30s\tdefault: %s\n", #k,                    \
                       lexical_cast<string>(defaultg.k).c_str());       \
            }                                                           \
        } while (0)

        G_UPDATE(profileSearches);
        G_UPDATE(allowEagerMatching);
        G_UPDATE(eagerEvaluationTripPoint);
        G_UPDATE(eagerMinCalls);
        G_UPDATE(eagerMinMatchPercent);
        G_UPDATE(eagerMinGroupAccessPercent);
#undef G_UPDATE
        if (key == "forceLazy") {
            g->profileSearches = false;
            g->allowEagerMatching = false;
            done = true;
        }
        if (key == "eagerAsap") {
            /* evaluate on every call and switch at the first opportunity */
            g->profileSearches = true;
            g->allowEagerMatching = true;
            g->eagerEvaluationTripPoint = 1;
            g->eagerMinCalls = 1;
            g->eagerMinMatchPercent = 0;
            g->eagerMinGroupAccessPercent = 0;
            done = true;
        }

        if (!done && key != "help") {
            printf("Invalid grey override key %s:%u\n", key.c_str(), value);
            invalid_key_seen = true;
        }

        p = ve;

        if (p != pe) {
            ++p;
        }
    }

    if (invalid_key_seen) {
        applyGreyOverrides(g, "help");
        exit(1);
    }

    if (!g->eagerEvaluationTripPoint) {
        printf("eagerEvaluationTripPoint must be non-zero\n");
        exit(1);
    }
}

} // namespace lzs

#endif
