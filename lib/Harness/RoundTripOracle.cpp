//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the round-trip pipeline.
///
//===----------------------------------------------------------------------===//

#include "borshrt/Harness/RoundTripOracle.h"

#include "borshrt/Codec/Compare.h"
#include "borshrt/Harness/HarnessError.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace borshrt
{
namespace
{

template <typename T>
llvm::Expected<OwnedBuffer> runTyped(const TestCase&              testCase,
                                     const T&                     canonical,
                                     llvm::ArrayRef<std::uint8_t> input,
                                     const OracleOptions&         options)
{
    T decoded{};
    if (llvm::Error err = deserialize(input, decoded, options.maxRecursionDepth))
    {
        return wrapCodecError(HarnessErrc::DecodeError, testCase.id, testCase.name, std::move(err));
    }

    if (const std::optional<ValueDifference> diff = findFirstDifference(canonical, decoded))
    {
        std::string              message;
        llvm::raw_string_ostream os(message);
        os << "case " << static_cast<unsigned>(testCase.id) << " (" << testCase.name
           << "): decoded value differs from canonical at " << (diff->path.empty() ? "<root>" : diff->path)
           << ": expected " << diff->expected << ", actual " << diff->actual;
        return llvm::make_error<HarnessError>(HarnessErrc::RoundTripMismatch, os.str(), testCase.id);
    }

    llvm::Expected<std::size_t> size = serializedSize(canonical, options.maxRecursionDepth);
    if (!size)
    {
        return wrapCodecError(HarnessErrc::EncodeError, testCase.id, testCase.name, size.takeError());
    }

    OwnedBuffer                 buffer  = OwnedBuffer::allocate(*size);
    llvm::Expected<std::size_t> written = serialize(canonical, buffer.bytes(), options.maxRecursionDepth);
    if (!written)
    {
        return wrapCodecError(HarnessErrc::EncodeError, testCase.id, testCase.name, written.takeError());
    }
    if (*written != *size)
    {
        return llvm::make_error<HarnessError>(HarnessErrc::EncodeError,
                                              "case " + std::to_string(testCase.id) + " (" + testCase.name.str() +
                                                  "): encoder wrote " + std::to_string(*written) +
                                                  " bytes, expected " + std::to_string(*size),
                                              testCase.id);
    }
    return std::move(buffer);
}

}  // namespace

RoundTripOracle::RoundTripOracle(const CaseRegistry& registry, const OracleOptions options)
    : registry_(registry)
    , options_(options)
{
    options_.maxRecursionDepth = std::min(options_.maxRecursionDepth, kMaxRecursionDepthLimit);
}

llvm::Expected<OwnedBuffer> RoundTripOracle::run(const std::uint8_t id, const llvm::ArrayRef<std::uint8_t> input) const
{
    llvm::Expected<const TestCase&> testCase = registry_.resolve(id);
    if (!testCase)
    {
        return testCase.takeError();
    }
    return std::visit(
        [&](const auto& canonical) { return runTyped(*testCase, canonical, input, options_); },
        testCase->canonical);
}

}  // namespace borshrt
