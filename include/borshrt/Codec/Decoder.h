//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Byte-level Borsh decoder reading from a borrowed input buffer.
///
/// The decoder never reads outside the input; every shortfall is reported as
/// `InputTooSmall` with the offset at which it was detected. Decoded values
/// never alias the input.
///
//===----------------------------------------------------------------------===//
#ifndef BORSHRT_CODEC_DECODER_H
#define BORSHRT_CODEC_DECODER_H

#include "borshrt/Codec/CodecError.h"
#include "llvm/ADT/APInt.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <cstdint>
#include <utility>

namespace borshrt
{

/// @brief Sequential Borsh decoder.
class Decoder final
{
public:
    /// @brief Constructs a decoder over `input`.
    /// @param[in] input Borrowed input bytes; must outlive the decoder.
    /// @param[in] maxDepth Maximum nesting depth accepted by `nested`.
    Decoder(llvm::ArrayRef<std::uint8_t> input, std::uint32_t maxDepth);

    /// @brief Reads a little-endian unsigned integer of `widthBytes` bytes.
    llvm::Error readUnsigned(std::uint64_t& out, std::uint8_t widthBytes);

    /// @brief Reads a two's complement signed integer of `widthBytes` bytes.
    llvm::Error readSigned(std::int64_t& out, std::uint8_t widthBytes);

    /// @brief Reads an arbitrary-width integer.
    /// @param[in,out] out On entry its bit width selects how many bytes are read.
    llvm::Error readWide(llvm::APInt& out);

    llvm::Error readF32(float& out);
    llvm::Error readF64(double& out);

    /// @brief Reads a strict boolean byte.
    llvm::Error readBool(bool& out);

    /// @brief Reads a `u32` element-count prefix.
    llvm::Error readLength(std::uint32_t& out);

    /// @brief Borrows the next `count` bytes without copying.
    llvm::Error readBytes(std::size_t count, llvm::ArrayRef<std::uint8_t>& out);

    /// @brief Checks that at least `count` elements of `elementBytes` bytes remain.
    ///
    /// Used before allocating storage for a length-prefixed sequence so an
    /// oversized length fails without a large allocation.
    llvm::Error requireElements(std::uint64_t count, std::size_t elementBytes) const;

    /// @brief Fails with `RemainingBytes` unless the whole input was consumed.
    llvm::Error finish() const;

    /// @brief Runs `body` one nesting level deeper.
    /// @param[in] body Callable returning `llvm::Error`.
    /// @return `MaxRecursionDepthReached` when the limit is hit; otherwise the result of `body`.
    template <typename Body>
    llvm::Error nested(Body&& body)
    {
        if (depth_ >= maxDepth_)
        {
            return makeCodecError(CodecErrc::MaxRecursionDepthReached, offset_);
        }
        ++depth_;
        llvm::Error err = std::forward<Body>(body)();
        --depth_;
        return err;
    }

    /// @brief Returns the number of bytes consumed so far.
    [[nodiscard]] std::size_t offset() const
    {
        return offset_;
    }

    /// @brief Returns the number of unread bytes.
    [[nodiscard]] std::size_t remaining() const
    {
        return input_.size() - offset_;
    }

private:
    /// @brief Converts a runtime return code, advancing the offset on success.
    llvm::Error commit(std::int8_t rc, std::size_t width);

    llvm::ArrayRef<std::uint8_t> input_;
    std::size_t                  offset_{0};
    std::uint32_t                depth_{0};
    std::uint32_t                maxDepth_;
};

}  // namespace borshrt

#endif  // BORSHRT_CODEC_DECODER_H
