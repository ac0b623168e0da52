//===----------------------------------------------------------------------===//
///
/// @file
/// C/C++ Borsh serialization runtime primitives shared by the codec layer.
///
/// This header provides bounds-checked little-endian integer, wide-integer,
/// floating-point, boolean and length-prefix helpers. The implementation is
/// header-only and byte-aligned; every helper reports failure through a
/// negative error code instead of reading or writing out of range.
///
//===----------------------------------------------------------------------===//

#ifndef BORSHRT_RUNTIME_BORSH_RUNTIME_H
#define BORSHRT_RUNTIME_BORSH_RUNTIME_H

#ifdef __cplusplus
#    if (__cplusplus < 201402L)
#        error "Unsupported language: ISO C11, C++14, or a newer version of either is required."
#    endif

extern "C"
{
#else
#    if !defined(__STDC_VERSION__) || (__STDC_VERSION__ < 201112L)
#        error "Unsupported language: ISO C11 or a newer version is required."
#    endif
#endif

#include <string.h>

#include <float.h>
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>
#include <assert.h>  // For _Static_assert (C11) static_assert (C23) and assert() if BORSH_RUNTIME_ASSERT is used.

#ifdef __cplusplus
#    ifndef _Static_assert
#        define _Static_assert(TERM, MESSAGE) static_assert(TERM, MESSAGE)
#    endif
#endif

/// @brief Runtime success code.
///
/// Every helper returns `BORSH_RUNTIME_SUCCESS` or a negated `BORSH_RUNTIME_ERROR_*` code.
#define BORSH_RUNTIME_SUCCESS 0

/// @brief API usage error code for invalid arguments.
#define BORSH_RUNTIME_ERROR_INVALID_ARGUMENT 2

/// @brief API usage error code for insufficient serialization buffer size.
#define BORSH_RUNTIME_ERROR_SERIALIZATION_BUFFER_TOO_SMALL 3

/// @brief Representation error code for input that ends before the value does.
#define BORSH_RUNTIME_ERROR_DESERIALIZATION_INPUT_TOO_SMALL 4

/// @brief Representation error code for a boolean byte other than 0 or 1.
#define BORSH_RUNTIME_ERROR_REPRESENTATION_BAD_BOOLEAN 10

/// @brief Representation error code for an out-of-range enum or union tag.
#define BORSH_RUNTIME_ERROR_REPRESENTATION_BAD_ENUM_TAG 11

/// @brief Representation error code for a length that does not fit the `u32` prefix.
#define BORSH_RUNTIME_ERROR_REPRESENTATION_BAD_LENGTH 12

/// @brief Size in bytes of a sequence length prefix.
#define BORSH_RUNTIME_LENGTH_PREFIX_BYTES 4U

/// @brief Compile-time check for IEEE-754 single-precision compatibility.
#define BORSH_RUNTIME_PLATFORM_IEEE754_FLOAT \
    ((FLT_RADIX == 2) && (FLT_MANT_DIG == 24) && (FLT_MIN_EXP == -125) && (FLT_MAX_EXP == 128))

/// @brief Compile-time check for IEEE-754 double-precision compatibility.
#define BORSH_RUNTIME_PLATFORM_IEEE754_DOUBLE \
    ((FLT_RADIX == 2) && (DBL_MANT_DIG == 53) && (DBL_MIN_EXP == -1021) && (DBL_MAX_EXP == 1024))

#ifndef BORSH_RUNTIME_ASSERT
#    define BORSH_RUNTIME_ASSERT(x) assert(x)
#endif

    _Static_assert(BORSH_RUNTIME_PLATFORM_IEEE754_FLOAT, "Native IEEE754 binary32 required");
    _Static_assert(BORSH_RUNTIME_PLATFORM_IEEE754_DOUBLE, "Native IEEE754 binary64 required");

    // This code is endianness-invariant: values are assembled byte by byte in little-endian order.

    // Bounds helpers.

    /// @brief Checks that `len_bytes` bytes starting at `off_bytes` fit a buffer of `buf_size_bytes`.
    /// @param[in] buf_size_bytes Total buffer size in bytes.
    /// @param[in] off_bytes Fragment start offset in bytes.
    /// @param[in] len_bytes Fragment length in bytes.
    /// @return `true` when the whole fragment lies inside the buffer.
    static inline bool borsh_runtime_fits(const size_t buf_size_bytes, const size_t off_bytes, const size_t len_bytes)
    {
        return (off_bytes <= buf_size_bytes) && (len_bytes <= (buf_size_bytes - off_bytes));
    }

    // Fixed-width integers.

    /// @brief Serializes an unsigned integer of `len_bytes` bytes in little-endian order.
    /// @param[out] buf Destination serialized buffer.
    /// @param[in] buf_size_bytes Destination buffer size in bytes.
    /// @param[in] off_bytes Destination byte offset.
    /// @param[in] value Unsigned value to serialize; bits above `len_bytes * 8` are discarded.
    /// @param[in] len_bytes Serialized width in bytes (1 to 8).
    /// @return `BORSH_RUNTIME_SUCCESS` or a negative error code.
    static inline int8_t borsh_runtime_set_uxx(uint8_t* const buf,
                                               const size_t   buf_size_bytes,
                                               const size_t   off_bytes,
                                               const uint64_t value,
                                               const uint8_t  len_bytes)
    {
        _Static_assert(64U == (sizeof(uint64_t) * 8U), "Unexpected size of uint64_t");
        if ((len_bytes == 0U) || (len_bytes > sizeof(uint64_t)))
        {
            return -BORSH_RUNTIME_ERROR_INVALID_ARGUMENT;
        }
        if (!borsh_runtime_fits(buf_size_bytes, off_bytes, len_bytes))
        {
            return -BORSH_RUNTIME_ERROR_SERIALIZATION_BUFFER_TOO_SMALL;
        }
        BORSH_RUNTIME_ASSERT(buf != NULL);
        for (uint8_t i = 0U; i < len_bytes; ++i)
        {
            // Little-endian: least significant byte first.
            buf[off_bytes + i] = (uint8_t) ((value >> (8U * i)) & 0xFFU);  // NOSONAR
        }
        return BORSH_RUNTIME_SUCCESS;
    }

    /// @brief Serializes a signed integer of `len_bytes` bytes in two's complement little-endian order.
    /// @param[out] buf Destination serialized buffer.
    /// @param[in] buf_size_bytes Destination buffer size in bytes.
    /// @param[in] off_bytes Destination byte offset.
    /// @param[in] value Signed value to serialize.
    /// @param[in] len_bytes Serialized width in bytes (1 to 8).
    /// @return `BORSH_RUNTIME_SUCCESS` or a negative error code.
    static inline int8_t borsh_runtime_set_ixx(uint8_t* const buf,
                                               const size_t   buf_size_bytes,
                                               const size_t   off_bytes,
                                               const int64_t  value,
                                               const uint8_t  len_bytes)
    {
        // Signed to unsigned conversion is modular (C11 6.3.1.3), which yields the two's complement bit pattern.
        return borsh_runtime_set_uxx(buf, buf_size_bytes, off_bytes, (uint64_t) value, len_bytes);
    }

    /// @brief Deserializes an unsigned integer of `len_bytes` bytes in little-endian order.
    ///
    /// @details Unlike bit-oriented runtimes there is no implicit zero
    /// extension: a read that crosses the end of the buffer fails.
    ///
    /// @param[in] buf Source serialized buffer.
    /// @param[in] buf_size_bytes Source buffer size in bytes.
    /// @param[in] off_bytes Source byte offset.
    /// @param[in] len_bytes Requested width in bytes (1 to 8).
    /// @param[out] out_value Deserialized value, zero-extended to 64 bits.
    /// @return `BORSH_RUNTIME_SUCCESS` or a negative error code.
    static inline int8_t borsh_runtime_get_uxx(const uint8_t* const buf,
                                               const size_t         buf_size_bytes,
                                               const size_t         off_bytes,
                                               const uint8_t        len_bytes,
                                               uint64_t* const      out_value)
    {
        if ((out_value == NULL) || (len_bytes == 0U) || (len_bytes > sizeof(uint64_t)))
        {
            return -BORSH_RUNTIME_ERROR_INVALID_ARGUMENT;
        }
        if (!borsh_runtime_fits(buf_size_bytes, off_bytes, len_bytes))
        {
            return -BORSH_RUNTIME_ERROR_DESERIALIZATION_INPUT_TOO_SMALL;
        }
        BORSH_RUNTIME_ASSERT(buf != NULL);
        uint64_t value = 0U;
        for (uint8_t i = 0U; i < len_bytes; ++i)
        {
            value |= ((uint64_t) buf[off_bytes + i]) << (8U * i);  // NOSONAR
        }
        *out_value = value;
        return BORSH_RUNTIME_SUCCESS;
    }

    /// @brief Deserializes a signed integer of `len_bytes` bytes and sign-extends it to 64 bits.
    /// @param[in] buf Source serialized buffer.
    /// @param[in] buf_size_bytes Source buffer size in bytes.
    /// @param[in] off_bytes Source byte offset.
    /// @param[in] len_bytes Requested width in bytes (1 to 8).
    /// @param[out] out_value Deserialized value.
    /// @return `BORSH_RUNTIME_SUCCESS` or a negative error code.
    static inline int8_t borsh_runtime_get_ixx(const uint8_t* const buf,
                                               const size_t         buf_size_bytes,
                                               const size_t         off_bytes,
                                               const uint8_t        len_bytes,
                                               int64_t* const       out_value)
    {
        if (out_value == NULL)
        {
            return -BORSH_RUNTIME_ERROR_INVALID_ARGUMENT;
        }
        uint64_t     raw = 0U;
        const int8_t err = borsh_runtime_get_uxx(buf, buf_size_bytes, off_bytes, len_bytes, &raw);
        if (err < 0)
        {
            return err;
        }
        const uint8_t bits = (uint8_t) (len_bytes * 8U);
        if ((bits < 64U) && ((raw & (((uint64_t) 1U) << (bits - 1U))) != 0U))
        {
            raw |= ~((((uint64_t) 1U) << bits) - 1U);
        }
        *out_value = (int64_t) raw;
        return BORSH_RUNTIME_SUCCESS;
    }

    /// @brief Serializes a 128-bit unsigned integer given as two 64-bit halves.
    /// @param[out] buf Destination serialized buffer.
    /// @param[in] buf_size_bytes Destination buffer size in bytes.
    /// @param[in] off_bytes Destination byte offset.
    /// @param[in] low Least significant 64 bits.
    /// @param[in] high Most significant 64 bits.
    /// @return `BORSH_RUNTIME_SUCCESS` or a negative error code.
    static inline int8_t borsh_runtime_set_u128(uint8_t* const buf,
                                                const size_t   buf_size_bytes,
                                                const size_t   off_bytes,
                                                const uint64_t low,
                                                const uint64_t high)
    {
        if (!borsh_runtime_fits(buf_size_bytes, off_bytes, 16U))
        {
            return -BORSH_RUNTIME_ERROR_SERIALIZATION_BUFFER_TOO_SMALL;
        }
        (void) borsh_runtime_set_uxx(buf, buf_size_bytes, off_bytes, low, 8U);
        return borsh_runtime_set_uxx(buf, buf_size_bytes, off_bytes + 8U, high, 8U);
    }

    /// @brief Deserializes a 128-bit unsigned integer into two 64-bit halves.
    /// @param[in] buf Source serialized buffer.
    /// @param[in] buf_size_bytes Source buffer size in bytes.
    /// @param[in] off_bytes Source byte offset.
    /// @param[out] out_low Least significant 64 bits.
    /// @param[out] out_high Most significant 64 bits.
    /// @return `BORSH_RUNTIME_SUCCESS` or a negative error code.
    static inline int8_t borsh_runtime_get_u128(const uint8_t* const buf,
                                                const size_t         buf_size_bytes,
                                                const size_t         off_bytes,
                                                uint64_t* const      out_low,
                                                uint64_t* const      out_high)
    {
        if ((out_low == NULL) || (out_high == NULL))
        {
            return -BORSH_RUNTIME_ERROR_INVALID_ARGUMENT;
        }
        if (!borsh_runtime_fits(buf_size_bytes, off_bytes, 16U))
        {
            return -BORSH_RUNTIME_ERROR_DESERIALIZATION_INPUT_TOO_SMALL;
        }
        (void) borsh_runtime_get_uxx(buf, buf_size_bytes, off_bytes, 8U, out_low);
        return borsh_runtime_get_uxx(buf, buf_size_bytes, off_bytes + 8U, 8U, out_high);
    }

    // ---------------------------------------------------- BOOLEAN ----------------------------------------------------

    /// @brief Serializes a boolean as a single byte (`0` or `1`).
    /// @param[out] buf Destination serialized buffer.
    /// @param[in] buf_size_bytes Destination buffer size in bytes.
    /// @param[in] off_bytes Destination byte offset.
    /// @param[in] value Boolean value to serialize.
    /// @return `BORSH_RUNTIME_SUCCESS` or a negative error code.
    static inline int8_t borsh_runtime_set_bool(uint8_t* const buf,
                                                const size_t   buf_size_bytes,
                                                const size_t   off_bytes,
                                                const bool     value)
    {
        return borsh_runtime_set_uxx(buf, buf_size_bytes, off_bytes, value ? 1U : 0U, 1U);
    }

    /// @brief Deserializes a strict boolean; any byte other than `0` or `1` is rejected.
    /// @param[in] buf Source serialized buffer.
    /// @param[in] buf_size_bytes Source buffer size in bytes.
    /// @param[in] off_bytes Source byte offset.
    /// @param[out] out_value Deserialized value.
    /// @return `BORSH_RUNTIME_SUCCESS` or a negative error code.
    static inline int8_t borsh_runtime_get_bool(const uint8_t* const buf,
                                                const size_t         buf_size_bytes,
                                                const size_t         off_bytes,
                                                bool* const          out_value)
    {
        if (out_value == NULL)
        {
            return -BORSH_RUNTIME_ERROR_INVALID_ARGUMENT;
        }
        uint64_t     raw = 0U;
        const int8_t err = borsh_runtime_get_uxx(buf, buf_size_bytes, off_bytes, 1U, &raw);
        if (err < 0)
        {
            return err;
        }
        if (raw > 1U)
        {
            return -BORSH_RUNTIME_ERROR_REPRESENTATION_BAD_BOOLEAN;
        }
        *out_value = (raw == 1U);
        return BORSH_RUNTIME_SUCCESS;
    }

    // ----------------------------------------------------- FLOAT -----------------------------------------------------

    /// @brief Serializes an IEEE-754 binary32 value by bit pattern.
    /// @param[out] buf Destination serialized buffer.
    /// @param[in] buf_size_bytes Destination buffer size in bytes.
    /// @param[in] off_bytes Destination byte offset.
    /// @param[in] value Float value; NaN payloads and signed zeros are preserved.
    /// @return `BORSH_RUNTIME_SUCCESS` or a negative error code.
    static inline int8_t borsh_runtime_set_f32(uint8_t* const buf,
                                               const size_t   buf_size_bytes,
                                               const size_t   off_bytes,
                                               const float    value)
    {
        _Static_assert(sizeof(float) == sizeof(uint32_t), "Unexpected size of float");
        uint32_t bits = 0U;
        (void) memcpy(&bits, &value, sizeof(bits));
        return borsh_runtime_set_uxx(buf, buf_size_bytes, off_bytes, bits, 4U);
    }

    /// @brief Deserializes an IEEE-754 binary32 value by bit pattern.
    /// @param[in] buf Source serialized buffer.
    /// @param[in] buf_size_bytes Source buffer size in bytes.
    /// @param[in] off_bytes Source byte offset.
    /// @param[out] out_value Deserialized value.
    /// @return `BORSH_RUNTIME_SUCCESS` or a negative error code.
    static inline int8_t borsh_runtime_get_f32(const uint8_t* const buf,
                                               const size_t         buf_size_bytes,
                                               const size_t         off_bytes,
                                               float* const         out_value)
    {
        if (out_value == NULL)
        {
            return -BORSH_RUNTIME_ERROR_INVALID_ARGUMENT;
        }
        uint64_t     raw = 0U;
        const int8_t err = borsh_runtime_get_uxx(buf, buf_size_bytes, off_bytes, 4U, &raw);
        if (err < 0)
        {
            return err;
        }
        const uint32_t bits = (uint32_t) raw;
        (void) memcpy(out_value, &bits, sizeof(bits));
        return BORSH_RUNTIME_SUCCESS;
    }

    /// @brief Serializes an IEEE-754 binary64 value by bit pattern.
    /// @param[out] buf Destination serialized buffer.
    /// @param[in] buf_size_bytes Destination buffer size in bytes.
    /// @param[in] off_bytes Destination byte offset.
    /// @param[in] value Double value; NaN payloads and signed zeros are preserved.
    /// @return `BORSH_RUNTIME_SUCCESS` or a negative error code.
    static inline int8_t borsh_runtime_set_f64(uint8_t* const buf,
                                               const size_t   buf_size_bytes,
                                               const size_t   off_bytes,
                                               const double   value)
    {
        _Static_assert(sizeof(double) == sizeof(uint64_t), "Unexpected size of double");
        uint64_t bits = 0U;
        (void) memcpy(&bits, &value, sizeof(bits));
        return borsh_runtime_set_uxx(buf, buf_size_bytes, off_bytes, bits, 8U);
    }

    /// @brief Deserializes an IEEE-754 binary64 value by bit pattern.
    /// @param[in] buf Source serialized buffer.
    /// @param[in] buf_size_bytes Source buffer size in bytes.
    /// @param[in] off_bytes Source byte offset.
    /// @param[out] out_value Deserialized value.
    /// @return `BORSH_RUNTIME_SUCCESS` or a negative error code.
    static inline int8_t borsh_runtime_get_f64(const uint8_t* const buf,
                                               const size_t         buf_size_bytes,
                                               const size_t         off_bytes,
                                               double* const        out_value)
    {
        if (out_value == NULL)
        {
            return -BORSH_RUNTIME_ERROR_INVALID_ARGUMENT;
        }
        uint64_t     bits = 0U;
        const int8_t err  = borsh_runtime_get_uxx(buf, buf_size_bytes, off_bytes, 8U, &bits);
        if (err < 0)
        {
            return err;
        }
        (void) memcpy(out_value, &bits, sizeof(bits));
        return BORSH_RUNTIME_SUCCESS;
    }

    // ------------------------------------------------- LENGTH PREFIX -------------------------------------------------

    /// @brief Serializes a sequence length as a `u32` prefix.
    /// @param[out] buf Destination serialized buffer.
    /// @param[in] buf_size_bytes Destination buffer size in bytes.
    /// @param[in] off_bytes Destination byte offset.
    /// @param[in] length Element count; must not exceed `UINT32_MAX`.
    /// @return `BORSH_RUNTIME_SUCCESS` or a negative error code.
    static inline int8_t borsh_runtime_set_length(uint8_t* const buf,
                                                  const size_t   buf_size_bytes,
                                                  const size_t   off_bytes,
                                                  const size_t   length)
    {
        if ((uint64_t) length > (uint64_t) UINT32_MAX)
        {
            return -BORSH_RUNTIME_ERROR_REPRESENTATION_BAD_LENGTH;
        }
        return borsh_runtime_set_uxx(buf, buf_size_bytes, off_bytes, (uint64_t) length, BORSH_RUNTIME_LENGTH_PREFIX_BYTES);
    }

    /// @brief Deserializes a `u32` sequence length prefix.
    /// @param[in] buf Source serialized buffer.
    /// @param[in] buf_size_bytes Source buffer size in bytes.
    /// @param[in] off_bytes Source byte offset.
    /// @param[out] out_length Deserialized element count.
    /// @return `BORSH_RUNTIME_SUCCESS` or a negative error code.
    static inline int8_t borsh_runtime_get_length(const uint8_t* const buf,
                                                  const size_t         buf_size_bytes,
                                                  const size_t         off_bytes,
                                                  uint32_t* const      out_length)
    {
        if (out_length == NULL)
        {
            return -BORSH_RUNTIME_ERROR_INVALID_ARGUMENT;
        }
        uint64_t     raw = 0U;
        const int8_t err = borsh_runtime_get_uxx(buf, buf_size_bytes, off_bytes, BORSH_RUNTIME_LENGTH_PREFIX_BYTES, &raw);
        if (err < 0)
        {
            return err;
        }
        *out_length = (uint32_t) raw;
        return BORSH_RUNTIME_SUCCESS;
    }

#ifdef __cplusplus
}
#endif

#endif  // BORSHRT_RUNTIME_BORSH_RUNTIME_H
