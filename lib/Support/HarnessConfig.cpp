//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "borshrt/Support/HarnessConfig.h"

#include "borshrt/Harness/HarnessError.h"
#include "llvm/ADT/StringRef.h"

#include <cstdlib>
#include <optional>
#include <string>

namespace borshrt
{

llvm::Expected<HarnessConfig> parseHarnessConfig(const llvm::function_ref<const char*(const char*)> lookup)
{
    HarnessConfig config;

    const char* rawDepth = lookup(kMaxDepthVariable);
    if (rawDepth != nullptr && *rawDepth != '\0')
    {
        const llvm::StringRef text = llvm::StringRef(rawDepth).trim();
        std::uint32_t         depth = 0;
        // getAsInteger returns true on failure, including overflow.
        if (text.getAsInteger(10, depth) || depth == 0 || depth > kMaxRecursionDepthLimit)
        {
            return makeHarnessError(HarnessErrc::InvalidConfiguration,
                                    std::string(kMaxDepthVariable) + " must be an integer in 1.." +
                                        std::to_string(kMaxRecursionDepthLimit) + ", got '" + rawDepth + "'");
        }
        config.maxRecursionDepth = depth;
    }

    const char* rawTrace = lookup(kTraceVariable);
    if (rawTrace != nullptr && *rawTrace != '\0')
    {
        const std::optional<TraceLevel> level = parseTraceLevel(rawTrace);
        if (!level)
        {
            return makeHarnessError(HarnessErrc::InvalidConfiguration,
                                    std::string(kTraceVariable) + " must be off, basic or verbose, got '" + rawTrace +
                                        "'");
        }
        config.traceLevel = *level;
    }

    return config;
}

llvm::Expected<HarnessConfig> loadHarnessConfigFromEnvironment()
{
    return parseHarnessConfig([](const char* name) -> const char* { return std::getenv(name); });
}

}  // namespace borshrt
