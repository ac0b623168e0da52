//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Fixed table of round-trip cases keyed by a one-byte identifier.
///
/// The alternative held by `CaseValue` is the case's type: dispatching on it
/// with `std::visit` selects the decoder, comparison and encoder, so there is
/// no runtime registration step. The table is built once and never mutated.
///
//===----------------------------------------------------------------------===//
#ifndef BORSHRT_HARNESS_CASE_REGISTRY_H
#define BORSHRT_HARNESS_CASE_REGISTRY_H

#include "borshrt/Harness/CaseTypes.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <variant>
#include <vector>

namespace borshrt
{

/// @brief Closed set of case types; the active alternative holds the canonical value.
using CaseValue = std::variant<Person, Hole, Tally, Exists>;

/// @brief Returns the type name of a case value's active alternative.
[[nodiscard]] llvm::StringRef caseTypeName(const CaseValue& value);

/// @brief One registered case.
struct TestCase
{
    /// @brief Identifier selected by the caller.
    std::uint8_t id;

    /// @brief Symbolic name used in reports.
    llvm::StringRef name;

    /// @brief Canonical value; its alternative fixes the case's type.
    CaseValue canonical;
};

/// @brief Immutable identifier-to-case table.
class CaseRegistry final
{
public:
    /// @brief Returns the process-wide built-in registry.
    static const CaseRegistry& builtin();

    CaseRegistry(const CaseRegistry&)            = delete;
    CaseRegistry& operator=(const CaseRegistry&) = delete;

    /// @brief Looks up the case registered for `id`.
    /// @return The case, or a `HarnessError` with code `UnsupportedCase`.
    [[nodiscard]] llvm::Expected<const TestCase&> resolve(std::uint8_t id) const;

    /// @brief Returns all cases ordered by identifier.
    [[nodiscard]] llvm::ArrayRef<TestCase> cases() const
    {
        return cases_;
    }

private:
    CaseRegistry();

    std::vector<TestCase> cases_;
};

}  // namespace borshrt

#endif  // BORSHRT_HARNESS_CASE_REGISTRY_H
