//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Deep structural comparison over the value shapes supported by `Serde.h`.
///
/// Floating-point values compare by bit pattern, so `-0.0 != 0.0` and a NaN
/// equals itself only when the payload bits match.
///
//===----------------------------------------------------------------------===//
#ifndef BORSHRT_CODEC_COMPARE_H
#define BORSHRT_CODEC_COMPARE_H

#include "borshrt/Codec/Serde.h"
#include "llvm/ADT/APInt.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/MathExtras.h"
#include "llvm/Support/raw_ostream.h"

#include <cstddef>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace borshrt
{

/// @brief First point at which two values differ.
struct ValueDifference
{
    /// @brief Dotted field path, with `[i]` for element indices; empty for the root value.
    std::string path;

    /// @brief Rendering of the expected side at `path`.
    std::string expected;

    /// @brief Rendering of the actual side at `path`.
    std::string actual;
};

namespace detail
{

template <typename T>
std::string renderScalar(const T& value)
{
    std::string              text;
    llvm::raw_string_ostream os(text);
    if constexpr (std::is_same_v<T, bool>)
    {
        os << (value ? "true" : "false");
    }
    else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>)
    {
        os << static_cast<std::int64_t>(value);
    }
    else if constexpr (std::is_integral_v<T>)
    {
        os << static_cast<std::uint64_t>(value);
    }
    else if constexpr (std::is_same_v<T, float>)
    {
        os << llvm::format("%.9g", static_cast<double>(value)) << " (bits " << llvm::format_hex(llvm::FloatToBits(value), 10)
           << ")";
    }
    else if constexpr (std::is_same_v<T, double>)
    {
        os << llvm::format("%.17g", value) << " (bits " << llvm::format_hex(llvm::DoubleToBits(value), 18) << ")";
    }
    else if constexpr (std::is_same_v<T, llvm::APInt>)
    {
        llvm::SmallString<40> digits;
        value.toStringUnsigned(digits, 10);
        os << digits;
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
        os << '"';
        llvm::printEscapedString(value, os);
        os << '"';
    }
    else if constexpr (CodecEnum<T>)
    {
        os << EnumTraits<T>::name(value);
    }
    return os.str();
}

template <typename T>
bool scalarEqual(const T& expected, const T& actual)
{
    if constexpr (std::is_same_v<T, float>)
    {
        return llvm::FloatToBits(expected) == llvm::FloatToBits(actual);
    }
    else if constexpr (std::is_same_v<T, double>)
    {
        return llvm::DoubleToBits(expected) == llvm::DoubleToBits(actual);
    }
    else if constexpr (std::is_same_v<T, llvm::APInt>)
    {
        return expected.getBitWidth() == actual.getBitWidth() && expected == actual;
    }
    else
    {
        return expected == actual;
    }
}

inline std::string joinPath(const std::string& base, llvm::StringRef name)
{
    return base.empty() ? name.str() : base + "." + name.str();
}

inline std::string indexPath(const std::string& base, const std::size_t index)
{
    return base + "[" + std::to_string(index) + "]";
}

template <typename T>
std::optional<ValueDifference> diffValue(const T& expected, const T& actual, const std::string& path);

template <std::size_t I = 0, typename Tuple>
std::optional<ValueDifference> diffFields(const Tuple& expected, const Tuple& actual, const std::string& path)
{
    if constexpr (I == std::tuple_size_v<Tuple>)
    {
        return std::nullopt;
    }
    else
    {
        const auto& e = std::get<I>(expected);
        if (auto diff = diffValue(e.value, std::get<I>(actual).value, joinPath(path, e.name)))
        {
            return diff;
        }
        return diffFields<I + 1>(expected, actual, path);
    }
}

template <typename Container>
std::optional<ValueDifference> diffElements(const Container& expected, const Container& actual, const std::string& path)
{
    for (std::size_t i = 0; i < expected.size(); ++i)
    {
        if (auto diff = diffValue(expected[i], actual[i], indexPath(path, i)))
        {
            return diff;
        }
    }
    return std::nullopt;
}

template <typename T>
std::optional<ValueDifference> diffValue(const T& expected, const T& actual, const std::string& path)
{
    if constexpr (std::is_arithmetic_v<T> || std::is_same_v<T, llvm::APInt> || std::is_same_v<T, std::string> ||
                  CodecEnum<T>)
    {
        if (scalarEqual(expected, actual))
        {
            return std::nullopt;
        }
        return ValueDifference{path, renderScalar(expected), renderScalar(actual)};
    }
    else if constexpr (std::is_same_v<T, std::monostate>)
    {
        return std::nullopt;
    }
    else if constexpr (IsVector<T>::value)
    {
        if (expected.size() != actual.size())
        {
            return ValueDifference{path,
                                   "length " + std::to_string(expected.size()),
                                   "length " + std::to_string(actual.size())};
        }
        return diffElements(expected, actual, path);
    }
    else if constexpr (IsStdArray<T>::value)
    {
        return diffElements(expected, actual, path);
    }
    else if constexpr (IsOptional<T>::value || IsUniquePtr<T>::value)
    {
        if (static_cast<bool>(expected) != static_cast<bool>(actual))
        {
            return ValueDifference{path, expected ? "present" : "absent", actual ? "present" : "absent"};
        }
        if (!expected)
        {
            return std::nullopt;
        }
        return diffValue(*expected, *actual, path);
    }
    else if constexpr (IsVariant<T>::value)
    {
        if (expected.index() != actual.index())
        {
            return ValueDifference{path,
                                   "alternative " + std::to_string(expected.index()),
                                   "alternative " + std::to_string(actual.index())};
        }
        return std::visit(
            [&](const auto& e, const auto& a) -> std::optional<ValueDifference> {
                if constexpr (std::is_same_v<std::decay_t<decltype(e)>, std::decay_t<decltype(a)>>)
                {
                    return diffValue(e, a, path);
                }
                else
                {
                    return std::nullopt;
                }
            },
            expected,
            actual);
    }
    else if constexpr (Record<T>)
    {
        return diffFields(expected.fields(), actual.fields(), path);
    }
    else
    {
        static_assert(kUnsupported<T>, "type has no structural comparison");
    }
}

}  // namespace detail

/// @brief Finds the first point at which `actual` differs from `expected`.
/// @return `std::nullopt` when the values are structurally equal.
template <typename T>
[[nodiscard]] std::optional<ValueDifference> findFirstDifference(const T& expected, const T& actual)
{
    return detail::diffValue(expected, actual, std::string());
}

/// @brief Deep field-by-field equality.
template <typename T>
[[nodiscard]] bool structurallyEqual(const T& lhs, const T& rhs)
{
    return !findFirstDifference(lhs, rhs).has_value();
}

}  // namespace borshrt

#endif  // BORSHRT_CODEC_COMPARE_H
