//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// C entry points over the round-trip oracle.
///
/// This is the only layer that turns harness errors into process termination.
///
//===----------------------------------------------------------------------===//

#include "borshrt/Boundary/roundtrip_abi.h"

#include "borshrt/Harness/CaseRegistry.h"
#include "borshrt/Harness/HarnessError.h"
#include "borshrt/Harness/OwnedBuffer.h"
#include "borshrt/Harness/RoundTripOracle.h"
#include "borshrt/Support/HarnessConfig.h"
#include "borshrt/Support/Trace.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorHandling.h"

#include <cstdint>
#include <string>
#include <utility>

namespace
{

[[noreturn]] void fail(const llvm::Twine& message)
{
    borshrt::trace(borshrt::TraceLevel::Basic, message);
    llvm::report_fatal_error(message, /*gen_crash_diag=*/true);
}

const borshrt::HarnessConfig& harnessConfig()
{
    static const borshrt::HarnessConfig config = [] {
        llvm::Expected<borshrt::HarnessConfig> loaded = borshrt::loadHarnessConfigFromEnvironment();
        if (!loaded)
        {
            fail("invalid configuration: " + llvm::toString(loaded.takeError()));
        }
        borshrt::TraceSink::instance().setLevel(loaded->traceLevel);
        return *loaded;
    }();
    return config;
}

llvm::StringRef caseLabel(const std::uint8_t id)
{
    for (const borshrt::TestCase& testCase : borshrt::CaseRegistry::builtin().cases())
    {
        if (testCase.id == id)
        {
            return testCase.name;
        }
    }
    return "<unregistered>";
}

const borshrt::RoundTripOracle& oracle()
{
    static const borshrt::RoundTripOracle instance(borshrt::CaseRegistry::builtin(), harnessConfig().oracleOptions());
    return instance;
}

}  // namespace

extern "C" void roundtrip_test_case(const uint8_t        id,
                                    const uint8_t* const input,
                                    const size_t         input_len,
                                    uint8_t** const      output,
                                    size_t* const        output_len)
{
    if (input == nullptr && input_len != 0)
    {
        fail("roundtrip_test_case: null input with length " + llvm::Twine(static_cast<unsigned long long>(input_len)));
    }
    if (output == nullptr || output_len == nullptr)
    {
        fail("roundtrip_test_case: null output pointer");
    }

    const borshrt::RoundTripOracle& rt = oracle();
    borshrt::trace(borshrt::TraceLevel::Verbose,
                   "roundtrip_test_case id=" + llvm::Twine(static_cast<unsigned>(id)) + " case=" + caseLabel(id) +
                       " input_len=" + llvm::Twine(static_cast<unsigned long long>(input_len)));

    const llvm::ArrayRef<std::uint8_t> bytes(input, input_len);
    llvm::Expected<borshrt::OwnedBuffer> result = rt.run(id, bytes);
    if (!result)
    {
        fail(llvm::toString(result.takeError()));
    }

    const std::size_t size = result->size();
    *output_len            = size;
    *output                = result->release();
    borshrt::trace(borshrt::TraceLevel::Verbose,
                   "roundtrip_test_case id=" + llvm::Twine(static_cast<unsigned>(id)) +
                       " output_len=" + llvm::Twine(static_cast<unsigned long long>(size)));
}

extern "C" void roundtrip_release_buffer(uint8_t* const buffer, const size_t buffer_len)
{
    if (buffer == nullptr)
    {
        return;
    }
    // The adopted owner frees the storage when the temporary is destroyed.
    static_cast<void>(borshrt::OwnedBuffer::adopt(buffer, buffer_len));
}
