//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// C++ convenience wrappers for the shared C Borsh runtime.
///
/// This header re-exports the C runtime and provides typed result helpers used
/// by the C++ encoder and decoder.
///
//===----------------------------------------------------------------------===//

#ifndef BORSHRT_CPP_RUNTIME_HPP
#define BORSHRT_CPP_RUNTIME_HPP

#include <cstdint>

extern "C"
{
#include "borsh_runtime.h"
}

namespace borshrt
{
namespace runtime
{

/// @brief Runtime result classification, mirroring the C error codes.
enum class Status : std::int8_t
{
    Success                = BORSH_RUNTIME_SUCCESS,
    InvalidArgument        = -BORSH_RUNTIME_ERROR_INVALID_ARGUMENT,
    BufferTooSmall         = -BORSH_RUNTIME_ERROR_SERIALIZATION_BUFFER_TOO_SMALL,
    InputTooSmall          = -BORSH_RUNTIME_ERROR_DESERIALIZATION_INPUT_TOO_SMALL,
    BadBoolean             = -BORSH_RUNTIME_ERROR_REPRESENTATION_BAD_BOOLEAN,
    BadEnumTag             = -BORSH_RUNTIME_ERROR_REPRESENTATION_BAD_ENUM_TAG,
    BadLength              = -BORSH_RUNTIME_ERROR_REPRESENTATION_BAD_LENGTH,
};

/// @brief Converts a raw C runtime return code into a `Status`.
/// @param[in] code Value returned by a `borsh_runtime_*` helper.
/// @return Matching status; unknown codes map to `InvalidArgument`.
[[nodiscard]] inline constexpr Status toStatus(const std::int8_t code) noexcept
{
    switch (code)
    {
    case static_cast<std::int8_t>(Status::Success):
    case static_cast<std::int8_t>(Status::InvalidArgument):
    case static_cast<std::int8_t>(Status::BufferTooSmall):
    case static_cast<std::int8_t>(Status::InputTooSmall):
    case static_cast<std::int8_t>(Status::BadBoolean):
    case static_cast<std::int8_t>(Status::BadEnumTag):
    case static_cast<std::int8_t>(Status::BadLength):
        return static_cast<Status>(code);
    default:
        return Status::InvalidArgument;
    }
}

}  // namespace runtime
}  // namespace borshrt

#endif  // BORSHRT_CPP_RUNTIME_HPP
