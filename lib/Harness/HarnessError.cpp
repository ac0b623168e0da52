//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the harness error payload.
///
//===----------------------------------------------------------------------===//

#include "borshrt/Harness/HarnessError.h"

#include "llvm/Support/raw_ostream.h"

#include <utility>

namespace borshrt
{

char HarnessError::ID = 0;

llvm::StringRef harnessErrcName(const HarnessErrc code)
{
    switch (code)
    {
    case HarnessErrc::UnsupportedCase:
        return "UnsupportedCase";
    case HarnessErrc::DecodeError:
        return "DecodeError";
    case HarnessErrc::RoundTripMismatch:
        return "RoundTripMismatch";
    case HarnessErrc::EncodeError:
        return "EncodeError";
    case HarnessErrc::InvalidConfiguration:
        return "InvalidConfiguration";
    }
    return "Unknown";
}

HarnessError::HarnessError(const HarnessErrc                 code,
                           std::string                       message,
                           const std::optional<std::uint8_t> caseId,
                           const std::optional<CodecErrc>    codecCause)
    : code_(code)
    , message_(std::move(message))
    , caseId_(caseId)
    , codecCause_(codecCause)
{
}

void HarnessError::log(llvm::raw_ostream& os) const
{
    os << harnessErrcName(code_) << ": " << message_;
}

std::error_code HarnessError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

llvm::Error makeHarnessError(const HarnessErrc code, std::string message)
{
    return llvm::make_error<HarnessError>(code, std::move(message));
}

llvm::Error wrapCodecError(const HarnessErrc     code,
                           const std::uint8_t    caseId,
                           const llvm::StringRef caseName,
                           llvm::Error           codecErr)
{
    std::optional<CodecErrc> cause;
    std::string              detail;
    llvm::Error              rest = llvm::handleErrors(std::move(codecErr), [&](const CodecError& e) {
        cause = e.code();
        llvm::raw_string_ostream os(detail);
        e.log(os);
    });
    if (rest)
    {
        detail = llvm::toString(std::move(rest));
    }

    std::string              message;
    llvm::raw_string_ostream os(message);
    os << "case " << static_cast<unsigned>(caseId) << " (" << caseName << "): "
       << (code == HarnessErrc::EncodeError ? "encoding canonical value failed: " : "decoding input failed: ")
       << detail;
    return llvm::make_error<HarnessError>(code, os.str(), caseId, cause);
}

}  // namespace borshrt
