//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Byte-level Borsh encoder writing into a caller-provided buffer.
///
/// The encoder can also run in sizing mode, where it only advances its offset.
/// Sizing first and writing second lets callers allocate the exact output size.
///
//===----------------------------------------------------------------------===//
#ifndef BORSHRT_CODEC_ENCODER_H
#define BORSHRT_CODEC_ENCODER_H

#include "borshrt/Codec/CodecError.h"
#include "llvm/ADT/APInt.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <cstdint>
#include <utility>

namespace borshrt
{

/// @brief Sequential Borsh encoder.
class Encoder final
{
public:
    /// @brief Constructs an encoder writing into `output`.
    /// @param[in] output Destination buffer; writes past its end fail with `BufferTooSmall`.
    /// @param[in] maxDepth Maximum nesting depth accepted by `nested`.
    Encoder(llvm::MutableArrayRef<std::uint8_t> output, std::uint32_t maxDepth);

    /// @brief Constructs an encoder that only measures the encoded size.
    /// @param[in] maxDepth Maximum nesting depth accepted by `nested`.
    /// @return Encoder in sizing mode.
    static Encoder sizing(std::uint32_t maxDepth);

    /// @brief Writes the low `widthBytes` bytes of `value` in little-endian order.
    llvm::Error writeUnsigned(std::uint64_t value, std::uint8_t widthBytes);

    /// @brief Writes a two's complement signed value of `widthBytes` bytes.
    llvm::Error writeSigned(std::int64_t value, std::uint8_t widthBytes);

    /// @brief Writes an arbitrary-width integer using its full bit width.
    /// @param[in] value Integer whose bit width is a whole number of bytes.
    llvm::Error writeWide(const llvm::APInt& value);

    llvm::Error writeF32(float value);
    llvm::Error writeF64(double value);
    llvm::Error writeBool(bool value);

    /// @brief Writes a `u32` element-count prefix.
    llvm::Error writeLength(std::size_t length);

    /// @brief Copies raw bytes verbatim.
    llvm::Error writeBytes(llvm::ArrayRef<std::uint8_t> bytes);

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

    /// @brief Returns the number of bytes written (or measured) so far.
    [[nodiscard]] std::size_t offset() const
    {
        return offset_;
    }

    /// @brief Indicates whether this encoder only measures.
    [[nodiscard]] bool isSizing() const
    {
        return sizing_;
    }

private:
    Encoder(llvm::MutableArrayRef<std::uint8_t> output, std::uint32_t maxDepth, bool sizing);

    /// @brief Converts a runtime return code, advancing the offset on success.
    llvm::Error commit(std::int8_t rc, std::size_t width);

    llvm::MutableArrayRef<std::uint8_t> output_;
    std::size_t                         offset_{0};
    std::uint32_t                       depth_{0};
    std::uint32_t                       maxDepth_;
    bool                                sizing_;
};

}  // namespace borshrt

#endif  // BORSHRT_CODEC_ENCODER_H
