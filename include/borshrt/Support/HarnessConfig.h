//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Harness settings read from the process environment.
///
/// Recognized variables:
///   - `BORSHRT_MAX_DEPTH`: decimal nesting limit in 1..255 (default 32).
///   - `BORSHRT_TRACE`: `off`, `basic` or `verbose` (default `basic`).
///
/// Unset or empty variables keep their defaults.
///
//===----------------------------------------------------------------------===//
#ifndef BORSHRT_SUPPORT_HARNESS_CONFIG_H
#define BORSHRT_SUPPORT_HARNESS_CONFIG_H

#include "borshrt/Harness/RoundTripOracle.h"
#include "borshrt/Support/Trace.h"
#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/Support/Error.h"

#include <cstdint>

namespace borshrt
{

/// @brief Name of the nesting-limit variable.
inline constexpr const char* kMaxDepthVariable = "BORSHRT_MAX_DEPTH";

/// @brief Name of the trace-level variable.
inline constexpr const char* kTraceVariable = "BORSHRT_TRACE";

/// @brief Effective harness configuration.
struct HarnessConfig
{
    /// @brief Nesting limit for decoding and encoding; always in 1..kMaxRecursionDepthLimit.
    std::uint32_t maxRecursionDepth{kDefaultMaxRecursionDepth};

    /// @brief Trace verbosity.
    TraceLevel traceLevel{TraceLevel::Basic};

    [[nodiscard]] OracleOptions oracleOptions() const
    {
        return OracleOptions{maxRecursionDepth};
    }
};

/// @brief Builds a configuration from a variable lookup.
/// @param[in] lookup Returns the value of a variable, or null when unset.
/// @return The configuration, or a `HarnessError` with code `InvalidConfiguration`.
[[nodiscard]] llvm::Expected<HarnessConfig> parseHarnessConfig(llvm::function_ref<const char*(const char*)> lookup);

/// @brief Builds a configuration from the process environment.
[[nodiscard]] llvm::Expected<HarnessConfig> loadHarnessConfigFromEnvironment();

}  // namespace borshrt

#endif  // BORSHRT_SUPPORT_HARNESS_CONFIG_H
