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

#ifndef LZS_RUNTIME_H_
#define LZS_RUNTIME_H_

/**
 * @file
 * @brief The lazyscan runtime API definition.
 *
 * This header contains functions for searching input with a regex handle and
 * for reading the result of a search.
 */

#include "lzs_common.h"

#ifdef __cplusplus
extern "C"
{
#endif

struct lzs_regex;

/**
 * A compiled regex handle.
 *
 * Handles are created by the component that owns the pattern compiler. A
 * handle may be used for searches from several threads at once.
 */
typedef struct lzs_regex lzs_regex_t;

struct lzs_result;

/**
 * The result of a single search.
 *
 * A result may defer work until its start or capture groups are read, and
 * refers to the searched data for that purpose: the data passed to @ref
 * lzs_search() must remain valid until the result is freed. A result must
 * only be used by one thread at a time.
 */
typedef struct lzs_result lzs_result_t;

/**
 * Search for the first match at or after a start index.
 *
 * @param regex
 *      A regex handle.
 * @param data
 *      Pointer to the data to be searched.
 * @param length
 *      The number of bytes to search.
 * @param from
 *      The index at which the search begins; must not exceed @p length.
 * @param result
 *      On success, a pointer to a newly allocated @ref lzs_result_t, which
 *      must be released with @ref lzs_free_result(). A search that finds no
 *      match still succeeds and produces a result.
 * @return
 *      @ref LZS_SUCCESS on success, @ref LZS_INVALID for bad parameters,
 *      other values on failure.
 */
lzs_error_t lzs_search(lzs_regex_t *regex, const char *data,
                       unsigned int length, unsigned int from,
                       lzs_result_t **result);

/**
 * Free a result.
 *
 * @param result
 *      A result returned by @ref lzs_search(). NULL is accepted.
 * @return
 *      @ref LZS_SUCCESS on success.
 */
lzs_error_t lzs_free_result(lzs_result_t *result);

/**
 * Free a regex handle.
 *
 * @param regex
 *      A regex handle. NULL is accepted. Results produced with the handle
 *      remain valid.
 * @return
 *      @ref LZS_SUCCESS on success.
 */
lzs_error_t lzs_free_regex(lzs_regex_t *regex);

/**
 * Report whether a search matched.
 *
 * @param result
 *      A search result.
 * @param matched
 *      On success, set to 1 if the search matched and 0 otherwise.
 * @return
 *      @ref LZS_SUCCESS on success, @ref LZS_INVALID for bad parameters.
 */
lzs_error_t lzs_result_is_match(const lzs_result_t *result, int *matched);

/**
 * Retrieve the start offset of a match, finding it first if necessary.
 *
 * @return
 *      @ref LZS_SUCCESS on success, @ref LZS_NO_MATCH if the search did not
 *      match, @ref LZS_INVALID for bad parameters.
 */
lzs_error_t lzs_result_start(const lzs_result_t *result,
                             unsigned long long *start);

/**
 * Retrieve the end offset of a match: the offset after its last byte.
 *
 * @return
 *      @ref LZS_SUCCESS on success, @ref LZS_NO_MATCH if the search did not
 *      match, @ref LZS_INVALID for bad parameters.
 */
lzs_error_t lzs_result_end(const lzs_result_t *result,
                           unsigned long long *end);

/**
 * Retrieve the number of capture groups in a result, including group 0 (the
 * whole match). A result that did not match has no groups.
 */
lzs_error_t lzs_result_group_count(const lzs_result_t *result,
                                   unsigned int *count);

/**
 * Retrieve the boundaries of a capture group, computing them first if
 * necessary.
 *
 * @param result
 *      A search result.
 * @param group
 *      The group index; group 0 is the whole match.
 * @param from
 *      On success, the start offset of the group, or -1 if the group did not
 *      participate in the match.
 * @param to
 *      On success, the end offset of the group, or -1 if the group did not
 *      participate in the match.
 * @return
 *      @ref LZS_SUCCESS on success, @ref LZS_NO_MATCH if the search did not
 *      match, @ref LZS_INVALID for bad parameters or an out-of-range group.
 */
lzs_error_t lzs_result_group(const lzs_result_t *result, unsigned int group,
                             long long *from, long long *to);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* LZS_RUNTIME_H_ */
