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
 * \brief Internal-use only definitions. Available to the components that
 * construct regex handles.
 */

#ifndef LZS_INTERNAL_H
#define LZS_INTERNAL_H

#include "lzscommon.h"
#include "lzs.h"

#ifdef __cplusplus

#include "result/regex_result.h"

#include <memory>
#include <utility>

namespace lzs {

class RegexObject;

} // namespace lzs

/** \brief Backing structure of an lzs_regex_t handle. */
struct lzs_regex {
    explicit lzs_regex(std::shared_ptr<lzs::RegexObject> regex_in)
        : regex(std::move(regex_in)) {}

    std::shared_ptr<lzs::RegexObject> regex;
};

/** \brief Backing structure of an lzs_result_t. */
struct lzs_result {
    explicit lzs_result(lzs::RegexResult result_in)
        : result(std::move(result_in)) {}

    lzs::RegexResult result;
};

namespace lzs {

/** \brief Internal use only: wraps a regex object in a C API handle, to be
 * released with lzs_free_regex(). Returns null if \a regex is null or
 * allocation fails. */
lzs_regex_t *wrapRegexObject(std::shared_ptr<RegexObject> regex);

} // namespace lzs

#endif

#endif
