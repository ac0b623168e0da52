//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the codec error payload and its textual rendering.
///
//===----------------------------------------------------------------------===//

#include "borshrt/Codec/CodecError.h"

#include "llvm/Support/raw_ostream.h"

#include <utility>

namespace borshrt
{

char CodecError::ID = 0;

llvm::StringRef codecErrcName(const CodecErrc code)
{
    switch (code)
    {
    case CodecErrc::BufferTooSmall:
        return "buffer-too-small";
    case CodecErrc::InputTooSmall:
        return "input-too-small";
    case CodecErrc::RemainingBytes:
        return "remaining-bytes";
    case CodecErrc::InvalidBoolean:
        return "invalid-boolean";
    case CodecErrc::InvalidEnumTag:
        return "invalid-enum-tag";
    case CodecErrc::InvalidUtf8:
        return "invalid-utf8";
    case CodecErrc::LengthOverflow:
        return "length-overflow";
    case CodecErrc::MaxRecursionDepthReached:
        return "max-recursion-depth-reached";
    case CodecErrc::UnsupportedWidth:
        return "unsupported-width";
    }
    return "unknown";
}

CodecErrc codecErrcFromRuntime(const runtime::Status status)
{
    switch (status)
    {
    case runtime::Status::BufferTooSmall:
        return CodecErrc::BufferTooSmall;
    case runtime::Status::InputTooSmall:
        return CodecErrc::InputTooSmall;
    case runtime::Status::BadBoolean:
        return CodecErrc::InvalidBoolean;
    case runtime::Status::BadEnumTag:
        return CodecErrc::InvalidEnumTag;
    case runtime::Status::BadLength:
        return CodecErrc::LengthOverflow;
    case runtime::Status::Success:
    case runtime::Status::InvalidArgument:
        break;
    }
    return CodecErrc::UnsupportedWidth;
}

CodecError::CodecError(const CodecErrc code, const std::size_t offset, std::string detail)
    : code_(code)
    , offset_(offset)
    , detail_(std::move(detail))
{
}

void CodecError::log(llvm::raw_ostream& os) const
{
    os << codecErrcName(code_) << " at byte offset " << offset_;
    if (!detail_.empty())
    {
        os << " (" << detail_ << ")";
    }
}

std::error_code CodecError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

llvm::Error makeCodecError(const CodecErrc code, const std::size_t offset, std::string detail)
{
    return llvm::make_error<CodecError>(code, offset, std::move(detail));
}

}  // namespace borshrt
