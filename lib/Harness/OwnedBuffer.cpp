//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "borshrt/Harness/OwnedBuffer.h"

#include "llvm/Support/MemAlloc.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace borshrt
{

void OwnedBuffer::FreeDeleter::operator()(std::uint8_t* data) const
{
    std::free(data);
}

OwnedBuffer::OwnedBuffer(std::uint8_t* data, const std::size_t size)
    : storage_(data)
    , size_(size)
{
}

OwnedBuffer::OwnedBuffer(OwnedBuffer&& other) noexcept
    : storage_(std::move(other.storage_))
    , size_(std::exchange(other.size_, 0U))
{
}

OwnedBuffer& OwnedBuffer::operator=(OwnedBuffer&& other) noexcept
{
    if (this != &other)
    {
        storage_ = std::move(other.storage_);
        size_    = std::exchange(other.size_, 0U);
    }
    return *this;
}

OwnedBuffer OwnedBuffer::allocate(const std::size_t size)
{
    const std::size_t allocSize = std::max<std::size_t>(size, 1U);
    auto*             data      = static_cast<std::uint8_t*>(llvm::safe_malloc(allocSize));
    std::memset(data, 0, allocSize);
    return OwnedBuffer(data, size);
}

OwnedBuffer OwnedBuffer::adopt(std::uint8_t* const data, const std::size_t size)
{
    return OwnedBuffer(data, data == nullptr ? 0U : size);
}

void OwnedBuffer::free(std::uint8_t* const data)
{
    std::free(data);
}

std::uint8_t* OwnedBuffer::release()
{
    size_ = 0;
    return storage_.release();
}

}  // namespace borshrt
