//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Heap byte buffer whose storage can be handed across the C ABI.
///
/// Storage comes from the C allocator so that a caller holding a released
/// pointer may free it with either `roundtrip_release_buffer` or `free`.
///
//===----------------------------------------------------------------------===//
#ifndef BORSHRT_HARNESS_OWNED_BUFFER_H
#define BORSHRT_HARNESS_OWNED_BUFFER_H

#include "llvm/ADT/ArrayRef.h"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace borshrt
{

/// @brief Move-only owner of a `malloc`-allocated byte array.
class OwnedBuffer final
{
public:
    OwnedBuffer() = default;

    /// @brief Allocates `size` bytes, zero-initialized.
    ///
    /// A zero-size request still allocates one byte so the storage pointer is
    /// never null. Allocation failure is fatal.
    [[nodiscard]] static OwnedBuffer allocate(std::size_t size);

    /// @brief Takes ownership of storage previously returned by `release()`.
    [[nodiscard]] static OwnedBuffer adopt(std::uint8_t* data, std::size_t size);

    /// @brief Frees storage previously returned by `release()`; null is ignored.
    static void free(std::uint8_t* data);

    /// @brief Moved-from buffers are empty: null storage and zero size.
    OwnedBuffer(OwnedBuffer&& other) noexcept;
    OwnedBuffer& operator=(OwnedBuffer&& other) noexcept;
    OwnedBuffer(const OwnedBuffer&)            = delete;
    OwnedBuffer& operator=(const OwnedBuffer&) = delete;

    [[nodiscard]] std::uint8_t* data() const
    {
        return storage_.get();
    }

    /// @brief Logical length in bytes; may be zero while `data()` is non-null.
    [[nodiscard]] std::size_t size() const
    {
        return size_;
    }

    [[nodiscard]] llvm::MutableArrayRef<std::uint8_t> bytes() const
    {
        return llvm::MutableArrayRef<std::uint8_t>(storage_.get(), size_);
    }

    /// @brief Gives up ownership; the caller must free the result.
    [[nodiscard]] std::uint8_t* release();

private:
    struct FreeDeleter
    {
        void operator()(std::uint8_t* data) const;
    };

    OwnedBuffer(std::uint8_t* data, std::size_t size);

    std::unique_ptr<std::uint8_t[], FreeDeleter> storage_;
    std::size_t                                  size_ = 0;
};

}  // namespace borshrt

#endif  // BORSHRT_HARNESS_OWNED_BUFFER_H
