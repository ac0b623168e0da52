//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the byte-level Borsh decoder on top of the C runtime helpers.
///
//===----------------------------------------------------------------------===//

#include "borshrt/Codec/Decoder.h"

#include "llvm/ADT/SmallVector.h"

#include <algorithm>
#include <string>

namespace borshrt
{

Decoder::Decoder(llvm::ArrayRef<std::uint8_t> input, const std::uint32_t maxDepth)
    : input_(input)
    , maxDepth_(maxDepth)
{
}

llvm::Error Decoder::commit(const std::int8_t rc, const std::size_t width)
{
    if (rc < 0)
    {
        return makeCodecError(codecErrcFromRuntime(runtime::toStatus(rc)), offset_);
    }
    offset_ += width;
    return llvm::Error::success();
}

llvm::Error Decoder::readUnsigned(std::uint64_t& out, const std::uint8_t widthBytes)
{
    return commit(borsh_runtime_get_uxx(input_.data(), input_.size(), offset_, widthBytes, &out), widthBytes);
}

llvm::Error Decoder::readSigned(std::int64_t& out, const std::uint8_t widthBytes)
{
    return commit(borsh_runtime_get_ixx(input_.data(), input_.size(), offset_, widthBytes, &out), widthBytes);
}

llvm::Error Decoder::readWide(llvm::APInt& out)
{
    const unsigned bits = out.getBitWidth();
    if ((bits % 8U) != 0U)
    {
        return makeCodecError(CodecErrc::UnsupportedWidth, offset_, std::to_string(bits) + " bits");
    }
    const std::size_t widthBytes = bits / 8U;
    if (bits == 128U)
    {
        std::uint64_t halves[2] = {0, 0};
        if (llvm::Error err =
                commit(borsh_runtime_get_u128(input_.data(), input_.size(), offset_, &halves[0], &halves[1]), 16U))
        {
            return err;
        }
        out = llvm::APInt(128, llvm::ArrayRef<std::uint64_t>(halves));
        return llvm::Error::success();
    }
    if (remaining() < widthBytes)
    {
        return makeCodecError(CodecErrc::InputTooSmall, offset_);
    }

    llvm::SmallVector<std::uint64_t, 2> words;
    std::size_t                         read = 0;
    while (read < widthBytes)
    {
        const auto    chunk = static_cast<std::uint8_t>(std::min<std::size_t>(8U, widthBytes - read));
        std::uint64_t word  = 0;
        if (llvm::Error err = readUnsigned(word, chunk))
        {
            return err;
        }
        words.push_back(word);
        read += chunk;
    }
    out = llvm::APInt(bits, words);
    return llvm::Error::success();
}

llvm::Error Decoder::readF32(float& out)
{
    return commit(borsh_runtime_get_f32(input_.data(), input_.size(), offset_, &out), 4U);
}

llvm::Error Decoder::readF64(double& out)
{
    return commit(borsh_runtime_get_f64(input_.data(), input_.size(), offset_, &out), 8U);
}

llvm::Error Decoder::readBool(bool& out)
{
    return commit(borsh_runtime_get_bool(input_.data(), input_.size(), offset_, &out), 1U);
}

llvm::Error Decoder::readLength(std::uint32_t& out)
{
    return commit(borsh_runtime_get_length(input_.data(), input_.size(), offset_, &out),
                  BORSH_RUNTIME_LENGTH_PREFIX_BYTES);
}

llvm::Error Decoder::readBytes(const std::size_t count, llvm::ArrayRef<std::uint8_t>& out)
{
    if (remaining() < count)
    {
        return makeCodecError(CodecErrc::InputTooSmall, offset_);
    }
    out = input_.slice(offset_, count);
    offset_ += count;
    return llvm::Error::success();
}

llvm::Error Decoder::requireElements(const std::uint64_t count, const std::size_t elementBytes) const
{
    if (elementBytes != 0U && count > remaining() / elementBytes)
    {
        return makeCodecError(CodecErrc::InputTooSmall,
                              offset_,
                              std::to_string(count) + " elements declared, " + std::to_string(remaining()) +
                                  " bytes left");
    }
    return llvm::Error::success();
}

llvm::Error Decoder::finish() const
{
    if (offset_ != input_.size())
    {
        return makeCodecError(CodecErrc::RemainingBytes, offset_, std::to_string(remaining()) + " bytes unread");
    }
    return llvm::Error::success();
}

}  // namespace borshrt
