//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Error payload raised by the Borsh encoder and decoder.
///
/// Every codec failure records a reason code and the byte offset at which the
/// failure was detected so the harness can point at the offending input byte.
///
//===----------------------------------------------------------------------===//
#ifndef BORSHRT_CODEC_CODEC_ERROR_H
#define BORSHRT_CODEC_CODEC_ERROR_H

#include "borsh_runtime.hpp"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <string>
#include <system_error>

namespace borshrt
{

/// @brief Reason code for a codec failure.
enum class CodecErrc
{
    /// @brief Output buffer is not large enough to hold the encoding.
    BufferTooSmall,

    /// @brief Input ended before the value was complete.
    InputTooSmall,

    /// @brief Input bytes remain after the value was fully decoded.
    RemainingBytes,

    /// @brief A boolean or presence tag byte was neither 0 nor 1.
    InvalidBoolean,

    /// @brief An enum or union tag byte named no alternative.
    InvalidEnumTag,

    /// @brief A text field did not hold well-formed UTF-8.
    InvalidUtf8,

    /// @brief A sequence length does not fit the `u32` prefix.
    LengthOverflow,

    /// @brief Nesting exceeded the configured recursion limit.
    MaxRecursionDepthReached,

    /// @brief A wide integer width is not a whole number of bytes.
    UnsupportedWidth,
};

/// @brief Returns a stable lowercase name for a codec reason code.
/// @param[in] code Reason code.
/// @return Identifier-style name such as `input-too-small`.
[[nodiscard]] llvm::StringRef codecErrcName(CodecErrc code);

/// @brief Maps a C runtime status onto a codec reason code.
/// @param[in] status Non-success runtime status.
/// @return Matching codec reason code.
[[nodiscard]] CodecErrc codecErrcFromRuntime(runtime::Status status);

/// @brief LLVM error payload describing one codec failure.
class CodecError final : public llvm::ErrorInfo<CodecError>
{
public:
    /// @brief Error class identifier used by LLVM-style RTTI.
    static char ID;

    /// @brief Constructs a codec error.
    /// @param[in] code Reason code.
    /// @param[in] offset Byte offset at which the failure was detected.
    /// @param[in] detail Optional extra context appended to the message.
    CodecError(CodecErrc code, std::size_t offset, std::string detail = {});

    /// @brief Returns the reason code.
    [[nodiscard]] CodecErrc code() const
    {
        return code_;
    }

    /// @brief Returns the byte offset of the failure.
    [[nodiscard]] std::size_t offset() const
    {
        return offset_;
    }

    /// @brief Returns the optional extra context.
    [[nodiscard]] const std::string& detail() const
    {
        return detail_;
    }

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

private:
    CodecErrc   code_;
    std::size_t offset_;
    std::string detail_;
};

/// @brief Creates an `llvm::Error` holding a `CodecError`.
/// @param[in] code Reason code.
/// @param[in] offset Byte offset at which the failure was detected.
/// @param[in] detail Optional extra context.
/// @return Failure value.
[[nodiscard]] llvm::Error makeCodecError(CodecErrc code, std::size_t offset, std::string detail = {});

}  // namespace borshrt

#endif  // BORSHRT_CODEC_CODEC_ERROR_H
