//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <limits>

#include "borsh_runtime.h"
#include "borsh_runtime.hpp"

bool runRuntimeTests()
{
    {
        if (BORSH_RUNTIME_SUCCESS != 0 || BORSH_RUNTIME_ERROR_INVALID_ARGUMENT != 2 ||
            BORSH_RUNTIME_ERROR_SERIALIZATION_BUFFER_TOO_SMALL != 3 ||
            BORSH_RUNTIME_ERROR_DESERIALIZATION_INPUT_TOO_SMALL != 4 ||
            BORSH_RUNTIME_ERROR_REPRESENTATION_BAD_BOOLEAN != 10 ||
            BORSH_RUNTIME_ERROR_REPRESENTATION_BAD_ENUM_TAG != 11 ||
            BORSH_RUNTIME_ERROR_REPRESENTATION_BAD_LENGTH != 12 || BORSH_RUNTIME_LENGTH_PREFIX_BYTES != 4U)
        {
            std::cerr << "runtime error code constants mismatch\n";
            return false;
        }
    }

    {
        std::uint8_t buffer[4] = {0xAAU, 0xAAU, 0xAAU, 0xAAU};
        if (borsh_runtime_set_uxx(buffer, 4U, 1U, 0x0102U, 2U) < 0)
        {
            std::cerr << "borsh_runtime_set_uxx failed unexpectedly\n";
            return false;
        }
        if (buffer[0] != 0xAAU || buffer[1] != 0x02U || buffer[2] != 0x01U || buffer[3] != 0xAAU)
        {
            std::cerr << "u16 was not written little-endian at the requested offset\n";
            return false;
        }
        std::uint64_t got = 0U;
        if (borsh_runtime_get_uxx(buffer, 4U, 1U, 2U, &got) < 0 || got != 0x0102U)
        {
            std::cerr << "u16 get/set mismatch\n";
            return false;
        }
    }

    {
        std::uint8_t buffer[2] = {0U, 0U};
        if (borsh_runtime_set_ixx(buffer, 2U, 0U, -2, 2U) < 0 || buffer[0] != 0xFEU || buffer[1] != 0xFFU)
        {
            std::cerr << "i16 two's complement encoding mismatch\n";
            return false;
        }
        std::int64_t got = 0;
        if (borsh_runtime_get_ixx(buffer, 2U, 0U, 2U, &got) < 0 || got != -2)
        {
            std::cerr << "i16 sign extension mismatch\n";
            return false;
        }
    }

    {
        std::uint8_t buffer[16] = {};
        if (borsh_runtime_set_u128(buffer, 16U, 0U, UINT64_C(0x0102030405060708), UINT64_C(0x1112131415161718)) < 0)
        {
            std::cerr << "borsh_runtime_set_u128 failed unexpectedly\n";
            return false;
        }
        if (buffer[0] != 0x08U || buffer[7] != 0x01U || buffer[8] != 0x18U || buffer[15] != 0x11U)
        {
            std::cerr << "u128 halves written in the wrong order\n";
            return false;
        }
        std::uint64_t low  = 0U;
        std::uint64_t high = 0U;
        if (borsh_runtime_get_u128(buffer, 16U, 0U, &low, &high) < 0 || low != UINT64_C(0x0102030405060708) ||
            high != UINT64_C(0x1112131415161718))
        {
            std::cerr << "u128 get/set mismatch\n";
            return false;
        }
        if (borsh_runtime_get_u128(buffer, 15U, 0U, &low, &high) !=
            -static_cast<std::int8_t>(BORSH_RUNTIME_ERROR_DESERIALIZATION_INPUT_TOO_SMALL))
        {
            std::cerr << "short u128 read was not rejected\n";
            return false;
        }
    }

    {
        const std::uint8_t good[2] = {0x00U, 0x01U};
        bool               value   = true;
        if (borsh_runtime_get_bool(good, 2U, 0U, &value) < 0 || value)
        {
            std::cerr << "bool 0 decode mismatch\n";
            return false;
        }
        if (borsh_runtime_get_bool(good, 2U, 1U, &value) < 0 || !value)
        {
            std::cerr << "bool 1 decode mismatch\n";
            return false;
        }
        const std::uint8_t bad[1] = {0x02U};
        if (borsh_runtime_get_bool(bad, 1U, 0U, &value) !=
            -static_cast<std::int8_t>(BORSH_RUNTIME_ERROR_REPRESENTATION_BAD_BOOLEAN))
        {
            std::cerr << "non-canonical bool byte was accepted\n";
            return false;
        }
    }

    {
        // 0.69 has bit pattern 0x3FE6147AE147AE14.
        std::uint8_t buffer[8] = {};
        if (borsh_runtime_set_f64(buffer, 8U, 0U, 0.69) < 0)
        {
            std::cerr << "borsh_runtime_set_f64 failed unexpectedly\n";
            return false;
        }
        const std::uint8_t expected[8] = {0x14U, 0xAEU, 0x47U, 0xE1U, 0x7AU, 0x14U, 0xE6U, 0x3FU};
        if (std::memcmp(buffer, expected, sizeof(expected)) != 0)
        {
            std::cerr << "f64 bit pattern mismatch\n";
            return false;
        }
        double back = 0.0;
        if (borsh_runtime_get_f64(buffer, 8U, 0U, &back) < 0 || back != 0.69)
        {
            std::cerr << "f64 get/set mismatch\n";
            return false;
        }
    }

    {
        std::uint8_t buffer[4] = {};
        float        negZero   = -0.0F;
        float        back      = 0.0F;
        if (borsh_runtime_set_f32(buffer, 4U, 0U, negZero) < 0 || borsh_runtime_get_f32(buffer, 4U, 0U, &back) < 0 ||
            buffer[3] != 0x80U || std::memcmp(&back, &negZero, sizeof(float)) != 0)
        {
            std::cerr << "f32 signed zero was not preserved\n";
            return false;
        }
    }

    {
        std::uint8_t buffer[4] = {};
        if (borsh_runtime_set_length(buffer, 4U, 0U, 258U) < 0 || buffer[0] != 0x02U || buffer[1] != 0x01U)
        {
            std::cerr << "length prefix encoding mismatch\n";
            return false;
        }
        std::uint32_t length = 0U;
        if (borsh_runtime_get_length(buffer, 4U, 0U, &length) < 0 || length != 258U)
        {
            std::cerr << "length prefix decode mismatch\n";
            return false;
        }
        if (sizeof(std::size_t) > sizeof(std::uint32_t))
        {
            const auto tooLong = static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max()) + 1U;
            if (borsh_runtime_set_length(buffer, 4U, 0U, tooLong) !=
                -static_cast<std::int8_t>(BORSH_RUNTIME_ERROR_REPRESENTATION_BAD_LENGTH))
            {
                std::cerr << "over-long length prefix was accepted\n";
                return false;
            }
        }
    }

    {
        std::uint8_t buffer[1] = {0U};
        const auto   err       = borsh_runtime_set_uxx(buffer, 1U, 0U, 0x3U, 2U);
        if (err != -static_cast<std::int8_t>(BORSH_RUNTIME_ERROR_SERIALIZATION_BUFFER_TOO_SMALL))
        {
            std::cerr << "buffer-too-small path returned unexpected error\n";
            return false;
        }
        if (borsh_runtime_set_uxx(buffer, 1U, 0U, 0x3U, 9U) !=
            -static_cast<std::int8_t>(BORSH_RUNTIME_ERROR_INVALID_ARGUMENT))
        {
            std::cerr << "oversized integer width was accepted\n";
            return false;
        }
        if (borsh_runtime_fits(1U, 2U, 0U))
        {
            std::cerr << "fragment starting past the buffer end reported as fitting\n";
            return false;
        }
    }

    {
        using borshrt::runtime::Status;
        if (borshrt::runtime::toStatus(BORSH_RUNTIME_SUCCESS) != Status::Success ||
            borshrt::runtime::toStatus(-BORSH_RUNTIME_ERROR_REPRESENTATION_BAD_BOOLEAN) != Status::BadBoolean ||
            borshrt::runtime::toStatus(-BORSH_RUNTIME_ERROR_DESERIALIZATION_INPUT_TOO_SMALL) != Status::InputTooSmall)
        {
            std::cerr << "runtime status mapping mismatch\n";
            return false;
        }
    }

    return true;
}
