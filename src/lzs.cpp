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
 * \brief Runtime API: search entry and result accessors.
 */
#include "lzs.h"
#include "lzs_internal.h"
#include "lzscommon.h"
#include "search/regex_object.h"
#include "util/compile_error.h"
#include "util/contract_error.h"

#include <new>
#include <utility>

#define LZS_STR_(x) #x
#define LZS_STR(x) LZS_STR_(x)
#define LZS_VERSION_STRING \
    LZS_STR(LZS_MAJOR) "." LZS_STR(LZS_MINOR) "." LZS_STR(LZS_PATCH) \
    " 2026-10-18"

using namespace std;
using namespace lzs;

namespace lzs {

lzs_regex_t *wrapRegexObject(shared_ptr<RegexObject> regex) {
    if (!regex) {
        return nullptr;
    }
    return new (nothrow) lzs_regex(move(regex));
}

} // namespace lzs

extern "C" LZS_PUBLIC_API
const char *lzs_version(void) {
    return LZS_VERSION_STRING;
}

extern "C" LZS_PUBLIC_API
lzs_error_t lzs_search(lzs_regex_t *regex, const char *data,
                       unsigned int length, unsigned int from,
                       lzs_result_t **result) {
    if (!result) {
        return LZS_INVALID;
    }
    *result = nullptr;

    if (!regex || !regex->regex || (!data && length)) {
        return LZS_INVALID;
    }

    if (from > length) {
        DEBUG_PRINTF("search index %u beyond input length %u\n", from,
                     length);
        return LZS_INVALID;
    }

    try {
        RegexResult rv = regex->regex->search((const u8 *)data, length, from);
        *result = new lzs_result(move(rv));
    } catch (const CompileError &e) {
        DEBUG_PRINTF("compile failed: %s\n", e.reason.c_str());
        return LZS_COMPILER_ERROR;
    } catch (const OutOfRangeError &) {
        return LZS_INVALID;
    } catch (const ContractError &e) {
        DEBUG_PRINTF("inconsistent automata: %s\n", e.reason.c_str());
        return LZS_UNKNOWN_ERROR;
    } catch (const std::bad_alloc &) {
        return LZS_NOMEM;
    } catch (...) {
        return LZS_UNKNOWN_ERROR;
    }

    return LZS_SUCCESS;
}

extern "C" LZS_PUBLIC_API
lzs_error_t lzs_free_result(lzs_result_t *result) {
    delete result;
    return LZS_SUCCESS;
}

extern "C" LZS_PUBLIC_API
lzs_error_t lzs_free_regex(lzs_regex_t *regex) {
    delete regex;
    return LZS_SUCCESS;
}

extern "C" LZS_PUBLIC_API
lzs_error_t lzs_result_is_match(const lzs_result_t *result, int *matched) {
    if (!result || !matched) {
        return LZS_INVALID;
    }
    *matched = result->result.isMatch() ? 1 : 0;
    return LZS_SUCCESS;
}

extern "C" LZS_PUBLIC_API
lzs_error_t lzs_result_group_count(const lzs_result_t *result,
                                   unsigned int *count) {
    if (!result || !count) {
        return LZS_INVALID;
    }
    *count = result->result.numGroups();
    return LZS_SUCCESS;
}

/** \brief Runs an accessor that may resolve deferred fields, mapping the
 * errors it can raise to API error codes. */
template<typename Func>
static
lzs_error_t guardAccess(const lzs_result_t *result, Func func) {
    if (!result->result.isMatch()) {
        return LZS_NO_MATCH;
    }

    try {
        func(result->result);
    } catch (const NoMatchError &) {
        return LZS_NO_MATCH;
    } catch (const OutOfRangeError &) {
        return LZS_INVALID;
    } catch (const ContractError &e) {
        DEBUG_PRINTF("inconsistent automata: %s\n", e.reason.c_str());
        return LZS_UNKNOWN_ERROR;
    } catch (const std::bad_alloc &) {
        return LZS_NOMEM;
    } catch (...) {
        return LZS_UNKNOWN_ERROR;
    }

    return LZS_SUCCESS;
}

extern "C" LZS_PUBLIC_API
lzs_error_t lzs_result_start(const lzs_result_t *result,
                             unsigned long long *start) {
    if (!result || !start) {
        return LZS_INVALID;
    }
    return guardAccess(result, [start](const RegexResult &r) {
        *start = (unsigned long long)r.start();
    });
}

extern "C" LZS_PUBLIC_API
lzs_error_t lzs_result_end(const lzs_result_t *result,
                           unsigned long long *end) {
    if (!result || !end) {
        return LZS_INVALID;
    }
    return guardAccess(result, [end](const RegexResult &r) {
        *end = (unsigned long long)r.end();
    });
}

extern "C" LZS_PUBLIC_API
lzs_error_t lzs_result_group(const lzs_result_t *result, unsigned int group,
                             long long *from, long long *to) {
    if (!result || !from || !to) {
        return LZS_INVALID;
    }
    return guardAccess(result, [group, from, to](const RegexResult &r) {
        s64a group_from = r.groupStart(group);
        s64a group_to = r.groupEnd(group);
        *from = group_from;
        *to = group_to;
    });
}
