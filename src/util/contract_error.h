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
 * \brief Errors raised when a caller breaks the search or accessor contract.
 */

#ifndef UTIL_CONTRACT_ERROR_H
#define UTIL_CONTRACT_ERROR_H

#include <string>

#include "lzscommon.h"

namespace lzs {

/** \brief Error thrown when the runtime is used outside its contract: bad
 * indices, accessors on a failed match, or an unusable automaton set. */
class ContractError {
public:
    // Note: 'why' should describe why the error occurred and end with a
    // full stop, but no line break.
    explicit ContractError(const std::string &why);

    virtual ~ContractError();

    std::string reason; //!< Reason for the error
};

/** \brief Error thrown for a search index or group index that is out of
 * range. */
class OutOfRangeError : public ContractError {
public:
    explicit OutOfRangeError(const std::string &why);
    ~OutOfRangeError() override;
};

/** \brief Error thrown when a positional accessor is used on a result that
 * did not match. */
class NoMatchError : public ContractError {
public:
    NoMatchError();
    ~NoMatchError() override;
};

} // namespace lzs

#endif
