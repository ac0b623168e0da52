//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <array>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "borshrt/Codec/CodecError.h"
#include "borshrt/Codec/Serde.h"
#include "borshrt/Harness/CaseTypes.h"
#include "llvm/ADT/APInt.h"
#include "llvm/Support/Error.h"

namespace
{

using borshrt::CodecErrc;

std::optional<CodecErrc> codecErrcOf(llvm::Error err)
{
    std::optional<CodecErrc> code;
    llvm::Error rest = llvm::handleErrors(std::move(err), [&](const borshrt::CodecError& e) { code = e.code(); });
    if (rest)
    {
        std::cerr << "unexpected non-codec error: " << llvm::toString(std::move(rest)) << "\n";
    }
    return code;
}

template <typename T>
std::optional<CodecErrc> decodeFailure(const std::vector<std::uint8_t>& bytes,
                                       const std::uint32_t              maxDepth = borshrt::kDefaultMaxRecursionDepth)
{
    T value{};
    return codecErrcOf(borshrt::deserialize(bytes, value, maxDepth));
}

borshrt::Person personCcccc()
{
    borshrt::Person person;
    person.name = "ccccc";
    person.age  = llvm::APInt(128, 541212312321534534ULL);
    person.prob = 0.69;
    person.data = {31, 69};
    return person;
}

const std::vector<std::uint8_t> kPersonCccccBytes = {
    0x05, 0x00, 0x00, 0x00, 0x63, 0x63, 0x63, 0x63, 0x63, 0x46, 0x2A, 0xFE, 0x07, 0xBB, 0xC5,
    0x82, 0x07, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x14, 0xAE, 0x47, 0xE1, 0x7A,
    0x14, 0xE6, 0x3F, 0x02, 0x00, 0x00, 0x00, 0x1F, 0x00, 0x00, 0x00, 0x45, 0x00, 0x00, 0x00,
};

const std::vector<std::uint8_t> kHoleNestedBytes = {
    0x6B, 0x04, 0x00, 0x00, 0x03, 0x00, 0x0A, 0x00, 0x01,
    0x35, 0x05, 0x00, 0x00, 0x06, 0x00, 0x09, 0x00, 0x00,
};

borshrt::Hole holeChain(const std::size_t length)
{
    borshrt::Hole root;
    borshrt::Hole* tail = &root;
    for (std::size_t i = 1; i < length; ++i)
    {
        tail->inner = std::make_unique<borshrt::Hole>();
        tail        = tail->inner.get();
    }
    return root;
}

}  // namespace

bool runSerdeTests()
{
    {
        llvm::Expected<std::vector<std::uint8_t>> bytes = borshrt::serializeToVector(personCcccc());
        if (!bytes)
        {
            std::cerr << "person encode failed: " << llvm::toString(bytes.takeError()) << "\n";
            return false;
        }
        if (*bytes != kPersonCccccBytes)
        {
            std::cerr << "person encoding does not match the reference bytes\n";
            return false;
        }
    }

    {
        borshrt::Person decoded;
        if (llvm::Error err = borshrt::deserialize(kPersonCccccBytes, decoded))
        {
            std::cerr << "person decode failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (decoded.name != "ccccc" || decoded.age != llvm::APInt(128, 541212312321534534ULL) ||
            decoded.prob != 0.69 || decoded.data != std::vector<std::int32_t>{31, 69})
        {
            std::cerr << "person decode produced wrong field values\n";
            return false;
        }
    }

    {
        llvm::Expected<std::size_t> size = borshrt::serializedSize(personCcccc());
        if (!size || *size != kPersonCccccBytes.size())
        {
            if (!size)
            {
                llvm::consumeError(size.takeError());
            }
            std::cerr << "serializedSize disagrees with the encoded length\n";
            return false;
        }
    }

    {
        borshrt::Hole hole;
        hole.age             = 1131;
        hole.id              = {3, 10};
        hole.inner           = std::make_unique<borshrt::Hole>();
        hole.inner->age      = 1333;
        hole.inner->id       = {6, 9};
        llvm::Expected<std::vector<std::uint8_t>> bytes = borshrt::serializeToVector(hole);
        if (!bytes || *bytes != kHoleNestedBytes)
        {
            if (!bytes)
            {
                llvm::consumeError(bytes.takeError());
            }
            std::cerr << "nested hole encoding mismatch\n";
            return false;
        }
    }

    {
        llvm::Expected<std::vector<std::uint8_t>> tally = borshrt::serializeToVector(borshrt::Tally::Two);
        llvm::Expected<std::vector<std::uint8_t>> no    = borshrt::serializeToVector(borshrt::Exists{});
        llvm::Expected<std::vector<std::uint8_t>> yes =
            borshrt::serializeToVector(borshrt::Exists{borshrt::ExistsYes{std::monostate{}, true}});
        if (!tally || !no || !yes)
        {
            llvm::consumeError(tally.takeError());
            llvm::consumeError(no.takeError());
            llvm::consumeError(yes.takeError());
            std::cerr << "enum or union encode failed\n";
            return false;
        }
        if (*tally != std::vector<std::uint8_t>{0x01} || *no != std::vector<std::uint8_t>{0x00} ||
            *yes != std::vector<std::uint8_t>{0x01, 0x01})
        {
            std::cerr << "enum or union encoding mismatch\n";
            return false;
        }
    }

    {
        std::vector<std::uint8_t> truncated(kPersonCccccBytes.begin(), kPersonCccccBytes.end() - 1);
        if (decodeFailure<borshrt::Person>(truncated) != CodecErrc::InputTooSmall)
        {
            std::cerr << "truncated person was not rejected as input-too-small\n";
            return false;
        }
        if (decodeFailure<borshrt::Person>({}) != CodecErrc::InputTooSmall)
        {
            std::cerr << "empty input was not rejected as input-too-small\n";
            return false;
        }
    }

    {
        std::vector<std::uint8_t> trailing = kPersonCccccBytes;
        trailing.push_back(0x00);
        if (decodeFailure<borshrt::Person>(trailing) != CodecErrc::RemainingBytes)
        {
            std::cerr << "trailing byte was not rejected as remaining-bytes\n";
            return false;
        }

        borshrt::Person             decoded;
        llvm::Expected<std::size_t> consumed = borshrt::deserializeStream(trailing, decoded);
        if (!consumed || *consumed != kPersonCccccBytes.size())
        {
            if (!consumed)
            {
                llvm::consumeError(consumed.takeError());
            }
            std::cerr << "stream decode did not report the consumed offset\n";
            return false;
        }
    }

    {
        if (decodeFailure<bool>({0x02}) != CodecErrc::InvalidBoolean)
        {
            std::cerr << "bool byte 2 was not rejected\n";
            return false;
        }
        if (decodeFailure<std::optional<std::uint8_t>>({0x02, 0x07}) != CodecErrc::InvalidBoolean)
        {
            std::cerr << "option presence byte 2 was not rejected\n";
            return false;
        }
        if (decodeFailure<borshrt::Tally>({0x03}) != CodecErrc::InvalidEnumTag)
        {
            std::cerr << "enum index out of range was not rejected\n";
            return false;
        }
        if (decodeFailure<borshrt::Exists>({0x02}) != CodecErrc::InvalidEnumTag)
        {
            std::cerr << "union tag out of range was not rejected\n";
            return false;
        }
        if (decodeFailure<borshrt::Exists>({0x01, 0x05}) != CodecErrc::InvalidBoolean)
        {
            std::cerr << "union payload with bad bool was not rejected\n";
            return false;
        }
    }

    {
        // Length prefix 2 followed by an overlong encoding of '/'.
        if (decodeFailure<std::string>({0x02, 0x00, 0x00, 0x00, 0xC0, 0xAF}) != CodecErrc::InvalidUtf8)
        {
            std::cerr << "invalid UTF-8 was accepted\n";
            return false;
        }
        std::string text;
        if (llvm::Error err = borshrt::deserialize(std::vector<std::uint8_t>{0x02, 0x00, 0x00, 0x00, 0xC3, 0xA9}, text))
        {
            std::cerr << "valid UTF-8 rejected: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (text != "\xC3\xA9")
        {
            std::cerr << "UTF-8 text decode mismatch\n";
            return false;
        }
    }

    {
        if (decodeFailure<std::vector<std::int32_t>>({0xFF, 0xFF, 0xFF, 0xFF, 0x01, 0x00, 0x00, 0x00}) !=
            CodecErrc::InputTooSmall)
        {
            std::cerr << "oversized sequence length was not rejected\n";
            return false;
        }
    }

    {
        // Person needs one level for its fields and one for the sequence elements.
        if (decodeFailure<borshrt::Person>(kPersonCccccBytes, 1U) != CodecErrc::MaxRecursionDepthReached)
        {
            std::cerr << "person decode ignored depth limit 1\n";
            return false;
        }
        if (decodeFailure<borshrt::Person>(kPersonCccccBytes, 2U).has_value())
        {
            std::cerr << "person decode failed within depth limit 2\n";
            return false;
        }
        if (decodeFailure<borshrt::Hole>(kHoleNestedBytes, 3U) != CodecErrc::MaxRecursionDepthReached ||
            decodeFailure<borshrt::Hole>(kHoleNestedBytes, 4U).has_value())
        {
            std::cerr << "nested hole depth accounting mismatch\n";
            return false;
        }
    }

    {
        const borshrt::Hole deep = holeChain(40);
        if (codecErrcOf(borshrt::serializedSize(deep).takeError()) != CodecErrc::MaxRecursionDepthReached)
        {
            std::cerr << "deep chain encoded past the default depth limit\n";
            return false;
        }
        llvm::Expected<std::vector<std::uint8_t>> shallow = borshrt::serializeToVector(holeChain(40), 200U);
        if (!shallow)
        {
            std::cerr << "deep chain rejected under a raised limit: " << llvm::toString(shallow.takeError()) << "\n";
            return false;
        }
        if (decodeFailure<borshrt::Hole>(*shallow) != CodecErrc::MaxRecursionDepthReached)
        {
            std::cerr << "deep chain decoded past the default depth limit\n";
            return false;
        }
    }

    {
        std::array<std::uint8_t, 8>  small{};
        llvm::Expected<std::size_t> written = borshrt::serialize(personCcccc(), small);
        if (written)
        {
            std::cerr << "encode into a short buffer succeeded\n";
            return false;
        }
        if (codecErrcOf(written.takeError()) != CodecErrc::BufferTooSmall)
        {
            std::cerr << "short buffer not reported as buffer-too-small\n";
            return false;
        }
    }

    {
        const std::uint64_t halves[2] = {0x0807060504030201ULL, 0x100F0E0D0C0B0A09ULL};
        const llvm::APInt   wide(128, llvm::ArrayRef<std::uint64_t>(halves));
        llvm::Expected<std::vector<std::uint8_t>> bytes = borshrt::serializeToVector(wide);
        if (!bytes)
        {
            std::cerr << "128-bit encode failed: " << llvm::toString(bytes.takeError()) << "\n";
            return false;
        }
        std::vector<std::uint8_t> expected;
        for (std::uint8_t b = 1; b <= 16; ++b)
        {
            expected.push_back(b);
        }
        if (*bytes != expected)
        {
            std::cerr << "128-bit value is not little-endian across both halves\n";
            return false;
        }
        llvm::APInt decoded(128, 0);
        if (llvm::Error err = borshrt::deserialize(*bytes, decoded))
        {
            std::cerr << "128-bit decode failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (decoded != wide)
        {
            std::cerr << "128-bit value changed across encode and decode\n";
            return false;
        }
        llvm::APInt truncated(128, 0);
        if (codecErrcOf(borshrt::deserialize(llvm::ArrayRef<std::uint8_t>(*bytes).drop_back(), truncated)) !=
            CodecErrc::InputTooSmall)
        {
            std::cerr << "short 128-bit input not reported as input-too-small\n";
            return false;
        }
    }

    {
        const llvm::APInt odd(12, 5);
        if (codecErrcOf(borshrt::serializedSize(odd).takeError()) != CodecErrc::UnsupportedWidth)
        {
            std::cerr << "non byte-multiple integer width was accepted\n";
            return false;
        }
    }

    return true;
}
