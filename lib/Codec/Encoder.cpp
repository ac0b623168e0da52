//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the byte-level Borsh encoder on top of the C runtime helpers.
///
//===----------------------------------------------------------------------===//

#include "borshrt/Codec/Encoder.h"

#include <algorithm>
#include <string>

namespace borshrt
{

Encoder::Encoder(llvm::MutableArrayRef<std::uint8_t> output, const std::uint32_t maxDepth)
    : Encoder(output, maxDepth, false)
{
}

Encoder::Encoder(llvm::MutableArrayRef<std::uint8_t> output, const std::uint32_t maxDepth, const bool sizing)
    : output_(output)
    , maxDepth_(maxDepth)
    , sizing_(sizing)
{
}

Encoder Encoder::sizing(const std::uint32_t maxDepth)
{
    return Encoder(llvm::MutableArrayRef<std::uint8_t>(), maxDepth, true);
}

llvm::Error Encoder::commit(const std::int8_t rc, const std::size_t width)
{
    if (rc < 0)
    {
        return makeCodecError(codecErrcFromRuntime(runtime::toStatus(rc)), offset_);
    }
    offset_ += width;
    return llvm::Error::success();
}

llvm::Error Encoder::writeUnsigned(const std::uint64_t value, const std::uint8_t widthBytes)
{
    if (sizing_)
    {
        return commit(BORSH_RUNTIME_SUCCESS, widthBytes);
    }
    return commit(borsh_runtime_set_uxx(output_.data(), output_.size(), offset_, value, widthBytes), widthBytes);
}

llvm::Error Encoder::writeSigned(const std::int64_t value, const std::uint8_t widthBytes)
{
    if (sizing_)
    {
        return commit(BORSH_RUNTIME_SUCCESS, widthBytes);
    }
    return commit(borsh_runtime_set_ixx(output_.data(), output_.size(), offset_, value, widthBytes), widthBytes);
}

llvm::Error Encoder::writeWide(const llvm::APInt& value)
{
    const unsigned bits = value.getBitWidth();
    if ((bits % 8U) != 0U)
    {
        return makeCodecError(CodecErrc::UnsupportedWidth, offset_, std::to_string(bits) + " bits");
    }
    const std::size_t widthBytes = bits / 8U;
    if (sizing_)
    {
        return commit(BORSH_RUNTIME_SUCCESS, widthBytes);
    }
    if (bits == 128U)
    {
        const std::uint64_t* const halves = value.getRawData();
        return commit(borsh_runtime_set_u128(output_.data(), output_.size(), offset_, halves[0], halves[1]), 16U);
    }
    if (output_.size() < offset_ || (output_.size() - offset_) < widthBytes)
    {
        return makeCodecError(CodecErrc::BufferTooSmall, offset_);
    }

    // Words are stored least significant first, which is already Borsh byte order.
    const std::uint64_t* const words = value.getRawData();
    std::size_t                written = 0;
    for (unsigned w = 0; w < value.getNumWords(); ++w)
    {
        const auto chunk = static_cast<std::uint8_t>(std::min<std::size_t>(8U, widthBytes - written));
        if (llvm::Error err =
                commit(borsh_runtime_set_uxx(output_.data(), output_.size(), offset_, words[w], chunk), chunk))
        {
            return err;
        }
        written += chunk;
    }
    return llvm::Error::success();
}

llvm::Error Encoder::writeF32(const float value)
{
    if (sizing_)
    {
        return commit(BORSH_RUNTIME_SUCCESS, 4U);
    }
    return commit(borsh_runtime_set_f32(output_.data(), output_.size(), offset_, value), 4U);
}

llvm::Error Encoder::writeF64(const double value)
{
    if (sizing_)
    {
        return commit(BORSH_RUNTIME_SUCCESS, 8U);
    }
    return commit(borsh_runtime_set_f64(output_.data(), output_.size(), offset_, value), 8U);
}

llvm::Error Encoder::writeBool(const bool value)
{
    if (sizing_)
    {
        return commit(BORSH_RUNTIME_SUCCESS, 1U);
    }
    return commit(borsh_runtime_set_bool(output_.data(), output_.size(), offset_, value), 1U);
}

llvm::Error Encoder::writeLength(const std::size_t length)
{
    if (static_cast<std::uint64_t>(length) > UINT32_MAX)
    {
        return makeCodecError(CodecErrc::LengthOverflow, offset_, std::to_string(length) + " elements");
    }
    if (sizing_)
    {
        return commit(BORSH_RUNTIME_SUCCESS, BORSH_RUNTIME_LENGTH_PREFIX_BYTES);
    }
    return commit(borsh_runtime_set_length(output_.data(), output_.size(), offset_, length),
                  BORSH_RUNTIME_LENGTH_PREFIX_BYTES);
}

llvm::Error Encoder::writeBytes(llvm::ArrayRef<std::uint8_t> bytes)
{
    if (!sizing_)
    {
        if (output_.size() < offset_ || (output_.size() - offset_) < bytes.size())
        {
            return makeCodecError(CodecErrc::BufferTooSmall, offset_);
        }
        std::copy(bytes.begin(), bytes.end(), output_.begin() + offset_);
    }
    offset_ += bytes.size();
    return llvm::Error::success();
}

}  // namespace borshrt
