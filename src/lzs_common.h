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

#ifndef LZS_COMMON_H_
#define LZS_COMMON_H_

/**
 * @file
 * @brief The lazyscan common API definition.
 *
 * This header contains functions available to both the runtime and the
 * components that construct regex handles.
 */

#ifdef __cplusplus
extern "C"
{
#endif

/**
 * A type for errors returned by lazyscan functions.
 */
typedef int lzs_error_t;

/**
 * Utility function for identifying this release version.
 *
 * @return
 *      A string containing the version number of this release build and the
 *      date of the build. It is allocated statically, so it does not need to
 *      be freed by the caller.
 */
const char *lzs_version(void);

/**
 * @defgroup LZS_ERROR lzs_error_t values
 *
 * @{
 */

/**
 * The engine completed normally.
 */
#define LZS_SUCCESS             0

/**
 * A parameter passed to this function was invalid.
 *
 * This error is also returned for a search start index beyond the end of the
 * input, and for a capture group index beyond the groups of a result.
 */
#define LZS_INVALID             (-1)

/**
 * A memory allocation failed.
 */
#define LZS_NOMEM               (-2)

/**
 * A positional accessor was called on a result that did not match.
 */
#define LZS_NO_MATCH            (-3)

/**
 * The pattern compiler failed when a regex was compiled on first use.
 */
#define LZS_COMPILER_ERROR      (-4)

/**
 * Unexpected internal error.
 *
 * This error indicates that the automata handed to the runtime are
 * inconsistent with each other.
 */
#define LZS_UNKNOWN_ERROR       (-5)

/** @} */

/**
 * @defgroup LZS_PATTERN_FLAG Pattern flags
 *
 * @{
 */

/**
 * Pattern flag: Set case-insensitive matching.
 */
#define LZS_FLAG_CASELESS       1

/**
 * Pattern flag: Matching a `.` will not exclude newlines.
 */
#define LZS_FLAG_DOTALL         2

/**
 * Pattern flag: Set multi-line anchoring.
 */
#define LZS_FLAG_MULTILINE      4

/**
 * Pattern flag: Sticky search.
 *
 * A match may only begin at the start index handed to @ref lzs_search(),
 * rather than anywhere at or after it. The runtime uses this flag to place
 * the start of a match without a backward scan.
 */
#define LZS_FLAG_STICKY         8

/** @} */

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* LZS_COMMON_H_ */
