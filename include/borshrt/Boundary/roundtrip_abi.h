//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// C ABI of the round-trip harness.
///
/// A foreign-language test encodes a value of a registered case type and
/// passes the bytes together with the case identifier. The harness decodes
/// them, checks the result against its canonical value and returns its own
/// encoding of the canonical value.
///
/// Ownership of the returned buffer transfers to the caller. It is allocated
/// by the C allocator, sized exactly to the encoding, and never null even for
/// an empty encoding. Release it with `roundtrip_release_buffer` (or `free`).
///
/// Any failure (unknown identifier, malformed input, value mismatch, encoding
/// failure, invalid arguments) terminates the process abnormally after a
/// diagnostic on standard error. No error is reported through the return path.
///
//===----------------------------------------------------------------------===//

#ifndef BORSHRT_BOUNDARY_ROUNDTRIP_ABI_H
#define BORSHRT_BOUNDARY_ROUNDTRIP_ABI_H

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32)
#    define BORSHRT_ABI_EXPORT __declspec(dllexport)
#else
#    define BORSHRT_ABI_EXPORT __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C"
{
#endif

/// @brief Runs round-trip case `id` against `input`.
/// @param[in] id Case identifier.
/// @param[in] input Encoded bytes; may be null only when `input_len` is zero.
/// @param[in] input_len Length of `input` in bytes.
/// @param[out] output Receives the canonical encoding; must not be null.
/// @param[out] output_len Receives the encoding length; must not be null.
BORSHRT_ABI_EXPORT void roundtrip_test_case(uint8_t        id,
                                            const uint8_t* input,
                                            size_t         input_len,
                                            uint8_t**      output,
                                            size_t*        output_len);

/// @brief Releases a buffer returned by `roundtrip_test_case`.
/// @param[in] buffer Buffer to release; null is ignored.
/// @param[in] buffer_len Length reported alongside `buffer`.
BORSHRT_ABI_EXPORT void roundtrip_release_buffer(uint8_t* buffer, size_t buffer_len);

#ifdef __cplusplus
}
#endif

#endif  // BORSHRT_BOUNDARY_ROUNDTRIP_ABI_H
