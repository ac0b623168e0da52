//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <utility>

#include "borshrt/Harness/OwnedBuffer.h"

bool runOwnedBufferTests()
{
    {
        borshrt::OwnedBuffer empty = borshrt::OwnedBuffer::allocate(0);
        if (empty.data() == nullptr || empty.size() != 0U || !empty.bytes().empty())
        {
            std::cerr << "zero-size allocation must be non-null with zero length\n";
            return false;
        }
    }

    {
        borshrt::OwnedBuffer buffer = borshrt::OwnedBuffer::allocate(16);
        if (buffer.data() == nullptr || buffer.size() != 16U || buffer.bytes().size() != 16U)
        {
            std::cerr << "allocation size mismatch\n";
            return false;
        }
        for (const std::uint8_t b : buffer.bytes())
        {
            if (b != 0U)
            {
                std::cerr << "allocation is not zero-initialized\n";
                return false;
            }
        }
        buffer.bytes()[15] = 0x5AU;

        borshrt::OwnedBuffer moved = std::move(buffer);
        if (moved.size() != 16U || moved.data()[15] != 0x5AU)
        {
            std::cerr << "move did not transfer storage\n";
            return false;
        }
        // NOLINTNEXTLINE(bugprone-use-after-move)
        if (buffer.data() != nullptr || buffer.size() != 0U || !buffer.bytes().empty())
        {
            std::cerr << "moved-from buffer must be empty\n";
            return false;
        }

        borshrt::OwnedBuffer target = borshrt::OwnedBuffer::allocate(2);
        target                      = std::move(moved);
        // NOLINTNEXTLINE(bugprone-use-after-move)
        if (target.size() != 16U || target.data()[15] != 0x5AU || moved.data() != nullptr || moved.size() != 0U)
        {
            std::cerr << "move assignment did not transfer storage\n";
            return false;
        }
    }

    {
        borshrt::OwnedBuffer buffer = borshrt::OwnedBuffer::allocate(4);
        buffer.bytes()[0]           = 0x11U;
        std::uint8_t* const raw     = buffer.release();
        if (raw == nullptr || buffer.data() != nullptr || buffer.size() != 0U || raw[0] != 0x11U)
        {
            std::cerr << "release did not relinquish storage\n";
            return false;
        }
        borshrt::OwnedBuffer adopted = borshrt::OwnedBuffer::adopt(raw, 4);
        if (adopted.data() != raw || adopted.size() != 4U)
        {
            std::cerr << "adopt did not take the released storage\n";
            return false;
        }
    }

    {
        // Released storage belongs to the C allocator.
        borshrt::OwnedBuffer buffer = borshrt::OwnedBuffer::allocate(8);
        std::free(buffer.release());
        borshrt::OwnedBuffer::free(nullptr);

        borshrt::OwnedBuffer nothing = borshrt::OwnedBuffer::adopt(nullptr, 8);
        if (nothing.data() != nullptr || nothing.size() != 0U)
        {
            std::cerr << "adopting null must yield an empty buffer\n";
            return false;
        }
    }

    return true;
}
