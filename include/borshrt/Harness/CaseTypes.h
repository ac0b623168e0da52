//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Value types exercised by the registered round-trip cases.
///
/// Each record lists its fields through `fields()` so the codec and the
/// structural comparison share a single field order.
///
//===----------------------------------------------------------------------===//
#ifndef BORSHRT_HARNESS_CASE_TYPES_H
#define BORSHRT_HARNESS_CASE_TYPES_H

#include "borshrt/Codec/Serde.h"
#include "llvm/ADT/APInt.h"
#include "llvm/ADT/StringRef.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace borshrt
{

/// @brief Record mixing text, a 128-bit integer, a double and a signed sequence.
struct Person
{
    std::string               name;
    llvm::APInt               age{128, 0};
    double                    prob{0.0};
    std::vector<std::int32_t> data;

    auto fields()
    {
        return std::make_tuple(field("name", name), field("age", age), field("prob", prob), field("data", data));
    }
    auto fields() const
    {
        return std::make_tuple(field("name", name), field("age", age), field("prob", prob), field("data", data));
    }
};

/// @brief Self-referential record with a fixed array and an optional boxed child.
struct Hole
{
    std::uint32_t               age{0};
    std::array<std::int16_t, 2> id{};
    std::unique_ptr<Hole>       inner;

    auto fields()
    {
        return std::make_tuple(field("age", age), field("id", id), field("inner", inner));
    }
    auto fields() const
    {
        return std::make_tuple(field("age", age), field("id", id), field("inner", inner));
    }
};

/// @brief Fieldless enum encoded as its enumerator index.
enum class Tally : std::uint8_t
{
    One,
    Two,
    Three,
};

template <>
struct EnumTraits<Tally>
{
    static constexpr std::size_t kEnumeratorCount = 3;

    static llvm::StringRef name(const Tally value)
    {
        switch (value)
        {
        case Tally::One:
            return "One";
        case Tally::Two:
            return "Two";
        case Tally::Three:
            return "Three";
        }
        return "<invalid>";
    }
};

/// @brief Payload of the `Yes` alternative of `Exists`; `a` carries no bytes.
struct ExistsYes
{
    std::monostate a;
    bool           b{false};

    auto fields()
    {
        return std::make_tuple(field("a", a), field("b", b));
    }
    auto fields() const
    {
        return std::make_tuple(field("a", a), field("b", b));
    }
};

/// @brief Tagged union `No | Yes{a, b}`.
using Exists = std::variant<std::monostate, ExistsYes>;

}  // namespace borshrt

#endif  // BORSHRT_HARNESS_CASE_TYPES_H
