//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Decode, compare and re-encode pipeline for one round-trip request.
///
/// The oracle is stateless apart from its immutable registry and options, so
/// a single instance may serve concurrent callers.
///
//===----------------------------------------------------------------------===//
#ifndef BORSHRT_HARNESS_ROUND_TRIP_ORACLE_H
#define BORSHRT_HARNESS_ROUND_TRIP_ORACLE_H

#include "borshrt/Codec/Serde.h"
#include "borshrt/Harness/CaseRegistry.h"
#include "borshrt/Harness/OwnedBuffer.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>

namespace borshrt
{

/// @brief Tunables applied to every request.
struct OracleOptions
{
    /// @brief Nesting limit for both decoding and encoding; clamped to `kMaxRecursionDepthLimit`.
    std::uint32_t maxRecursionDepth{kDefaultMaxRecursionDepth};
};

/// @brief Runs registered cases against caller-supplied bytes.
class RoundTripOracle final
{
public:
    /// @brief Constructs an oracle over `registry`, which must outlive it.
    explicit RoundTripOracle(const CaseRegistry& registry, OracleOptions options = {});

    /// @brief Runs case `id` against `input`.
    ///
    /// Decodes `input` as the case's type with full consumption, compares the
    /// result with the canonical value, and encodes the canonical value into a
    /// fresh buffer of exactly its serialized size.
    ///
    /// @param[in] id Case identifier.
    /// @param[in] input Encoded bytes produced by the caller.
    /// @return The canonical encoding, or a `HarnessError`.
    [[nodiscard]] llvm::Expected<OwnedBuffer> run(std::uint8_t id, llvm::ArrayRef<std::uint8_t> input) const;

    [[nodiscard]] const OracleOptions& options() const
    {
        return options_;
    }

private:
    const CaseRegistry& registry_;
    OracleOptions       options_;
};

}  // namespace borshrt

#endif  // BORSHRT_HARNESS_ROUND_TRIP_ORACLE_H
