//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Error taxonomy of the round-trip harness.
///
/// Harness errors are ordinary `llvm::Error` payloads inside the library. Only
/// the C ABI boundary turns them into process termination.
///
//===----------------------------------------------------------------------===//
#ifndef BORSHRT_HARNESS_HARNESS_ERROR_H
#define BORSHRT_HARNESS_HARNESS_ERROR_H

#include "borshrt/Codec/CodecError.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace borshrt
{

/// @brief Harness failure category.
enum class HarnessErrc
{
    /// @brief The identifier has no registered case.
    UnsupportedCase,

    /// @brief The input bytes do not decode as the case's type.
    DecodeError,

    /// @brief The decoded value differs from the canonical value.
    RoundTripMismatch,

    /// @brief The canonical value could not be encoded.
    EncodeError,

    /// @brief Harness configuration is malformed.
    InvalidConfiguration,
};

/// @brief Returns a stable CamelCase name for a harness error category.
[[nodiscard]] llvm::StringRef harnessErrcName(HarnessErrc code);

/// @brief LLVM error payload describing one harness failure.
class HarnessError final : public llvm::ErrorInfo<HarnessError>
{
public:
    /// @brief Error class identifier used by LLVM-style RTTI.
    static char ID;

    /// @brief Constructs a harness error.
    /// @param[in] code Failure category.
    /// @param[in] message Human-readable description, including the case identifier where one applies.
    /// @param[in] caseId Identifier of the case being run, if known.
    /// @param[in] codecCause Underlying codec reason for decode and encode failures.
    HarnessError(HarnessErrc                 code,
                 std::string                 message,
                 std::optional<std::uint8_t> caseId     = std::nullopt,
                 std::optional<CodecErrc>    codecCause = std::nullopt);

    [[nodiscard]] HarnessErrc code() const
    {
        return code_;
    }

    /// @brief Returns the description without the category prefix that `log()` adds.
    [[nodiscard]] const std::string& description() const
    {
        return message_;
    }

    [[nodiscard]] std::optional<std::uint8_t> caseId() const
    {
        return caseId_;
    }

    [[nodiscard]] std::optional<CodecErrc> codecCause() const
    {
        return codecCause_;
    }

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

private:
    HarnessErrc                 code_;
    std::string                 message_;
    std::optional<std::uint8_t> caseId_;
    std::optional<CodecErrc>    codecCause_;
};

/// @brief Creates an `llvm::Error` holding a `HarnessError` without a case or codec cause.
[[nodiscard]] llvm::Error makeHarnessError(HarnessErrc code, std::string message);

/// @brief Wraps a codec failure raised while running case `caseId`.
///
/// Consumes `codecErr`. Non-codec payloads are folded into the message text.
///
/// @param[in] code `DecodeError` or `EncodeError`.
/// @param[in] caseId Identifier of the case being run.
/// @param[in] caseName Symbolic name of the case.
/// @param[in] codecErr Failure to wrap; must hold an error.
/// @return Failure value holding a `HarnessError`.
[[nodiscard]] llvm::Error wrapCodecError(HarnessErrc     code,
                                         std::uint8_t    caseId,
                                         llvm::StringRef caseName,
                                         llvm::Error     codecErr);

}  // namespace borshrt

#endif  // BORSHRT_HARNESS_HARNESS_ERROR_H
