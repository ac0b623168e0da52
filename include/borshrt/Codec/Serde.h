//===----------------------------------------------------------------------===//
//
// Part of the borshrt project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Type-directed Borsh serialization for C++ value types.
///
/// Supported shapes and their wire form:
///   - `bool`: one byte, 0 or 1.
///   - fixed-width integers, `float`, `double`: little-endian, natural width.
///   - `llvm::APInt`: little-endian, `getBitWidth() / 8` bytes.
///   - `std::string`: `u32` byte length, then UTF-8 bytes.
///   - `std::vector<T>`: `u32` element count, then elements.
///   - `std::array<T, N>`: `N` elements, no prefix.
///   - `std::optional<T>`, `std::unique_ptr<T>`: presence byte, then payload.
///   - `std::variant<...>`: alternative index byte, then payload
///     (`std::monostate` has an empty payload).
///   - enums with an `EnumTraits` specialization: enumerator index byte.
///   - records exposing `fields()`: fields in declaration order, no framing.
///
/// Every child of a composite value is processed one nesting level deeper;
/// the configured maximum bounds both encoding and decoding.
///
//===----------------------------------------------------------------------===//
#ifndef BORSHRT_CODEC_SERDE_H
#define BORSHRT_CODEC_SERDE_H

#include "borshrt/Codec/CodecError.h"
#include "borshrt/Codec/Decoder.h"
#include "borshrt/Codec/Encoder.h"
#include "llvm/ADT/APInt.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/ConvertUTF.h"
#include "llvm/Support/Error.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace borshrt
{

/// @brief Default maximum nesting depth for encoding and decoding.
inline constexpr std::uint32_t kDefaultMaxRecursionDepth = 32;

/// @brief Largest accepted nesting limit; the decoder recurses once per level.
inline constexpr std::uint32_t kMaxRecursionDepthLimit = 255;

/// @brief Named reference to one record field.
template <typename T>
struct Field
{
    /// @brief Field name used in comparison reports.
    llvm::StringRef name;

    /// @brief Referenced field storage.
    T& value;
};

/// @brief Builds a `Field` for use in a record's `fields()` tuple.
template <typename T>
[[nodiscard]] Field<T> field(llvm::StringRef name, T& value)
{
    return Field<T>{name, value};
}

/// @brief Enumerator metadata for fieldless enums.
///
/// Specializations provide `static constexpr std::size_t kEnumeratorCount`
/// and `static llvm::StringRef name(T value)`. Enumerators must be numbered
/// contiguously from zero.
template <typename T>
struct EnumTraits;

/// @brief A type exposing its fields as a tuple of `Field` references.
template <typename T>
concept Record = requires(T& value, const T& constValue) {
    value.fields();
    constValue.fields();
};

/// @brief A fieldless enum with registered enumerator metadata.
template <typename T>
concept CodecEnum = std::is_enum_v<T> && requires { EnumTraits<T>::kEnumeratorCount; };

namespace detail
{

template <typename T>
struct IsVector : std::false_type
{};
template <typename T, typename A>
struct IsVector<std::vector<T, A>> : std::true_type
{};

template <typename T>
struct IsStdArray : std::false_type
{};
template <typename T, std::size_t N>
struct IsStdArray<std::array<T, N>> : std::true_type
{};

template <typename T>
struct IsOptional : std::false_type
{};
template <typename T>
struct IsOptional<std::optional<T>> : std::true_type
{};

template <typename T>
struct IsUniquePtr : std::false_type
{};
template <typename T>
struct IsUniquePtr<std::unique_ptr<T>> : std::true_type
{};

template <typename T>
struct IsVariant : std::false_type
{};
template <typename... Ts>
struct IsVariant<std::variant<Ts...>> : std::true_type
{};

/// @brief Scalars whose encoded size equals `sizeof(T)`.
template <typename T>
inline constexpr bool kIsFixedScalar = std::is_arithmetic_v<T>;

template <typename T>
inline constexpr bool kUnsupported = false;

}  // namespace detail

template <typename T>
llvm::Error encodeValue(Encoder& enc, const T& value);

template <typename T>
llvm::Error decodeValue(Decoder& dec, T& out);

namespace detail
{

template <std::size_t I = 0, typename Tuple>
llvm::Error encodeFields(Encoder& enc, const Tuple& fields)
{
    if constexpr (I == std::tuple_size_v<Tuple>)
    {
        return llvm::Error::success();
    }
    else
    {
        if (llvm::Error err = enc.nested([&] { return encodeValue(enc, std::get<I>(fields).value); }))
        {
            return err;
        }
        return encodeFields<I + 1>(enc, fields);
    }
}

template <std::size_t I = 0, typename Tuple>
llvm::Error decodeFields(Decoder& dec, Tuple& fields)
{
    if constexpr (I == std::tuple_size_v<Tuple>)
    {
        return llvm::Error::success();
    }
    else
    {
        if (llvm::Error err = dec.nested([&] { return decodeValue(dec, std::get<I>(fields).value); }))
        {
            return err;
        }
        return decodeFields<I + 1>(dec, fields);
    }
}

template <std::size_t I = 0, typename... Ts>
llvm::Error decodeAlternative(Decoder& dec, std::variant<Ts...>& out, const std::size_t tag)
{
    if constexpr (I == sizeof...(Ts))
    {
        return makeCodecError(CodecErrc::InvalidEnumTag, dec.offset() - 1U, "alternative " + std::to_string(tag));
    }
    else
    {
        if (tag != I)
        {
            return decodeAlternative<I + 1>(dec, out, tag);
        }
        auto& payload = out.template emplace<I>();
        return dec.nested([&] { return decodeValue(dec, payload); });
    }
}

template <typename Container>
llvm::Error encodeElements(Encoder& enc, const Container& elements)
{
    for (const auto& element : elements)
    {
        if (llvm::Error err = enc.nested([&] { return encodeValue(enc, element); }))
        {
            return err;
        }
    }
    return llvm::Error::success();
}

}  // namespace detail

/// @brief Encodes `value` at the encoder's current position.
template <typename T>
llvm::Error encodeValue(Encoder& enc, const T& value)
{
    if constexpr (std::is_same_v<T, bool>)
    {
        return enc.writeBool(value);
    }
    else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>)
    {
        return enc.writeSigned(static_cast<std::int64_t>(value), static_cast<std::uint8_t>(sizeof(T)));
    }
    else if constexpr (std::is_integral_v<T>)
    {
        return enc.writeUnsigned(static_cast<std::uint64_t>(value), static_cast<std::uint8_t>(sizeof(T)));
    }
    else if constexpr (std::is_same_v<T, float>)
    {
        return enc.writeF32(value);
    }
    else if constexpr (std::is_same_v<T, double>)
    {
        return enc.writeF64(value);
    }
    else if constexpr (std::is_same_v<T, llvm::APInt>)
    {
        return enc.writeWide(value);
    }
    else if constexpr (std::is_same_v<T, std::monostate>)
    {
        return llvm::Error::success();
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
        if (llvm::Error err = enc.writeLength(value.size()))
        {
            return err;
        }
        return enc.writeBytes(
            llvm::ArrayRef<std::uint8_t>(reinterpret_cast<const std::uint8_t*>(value.data()), value.size()));
    }
    else if constexpr (detail::IsVector<T>::value)
    {
        if (llvm::Error err = enc.writeLength(value.size()))
        {
            return err;
        }
        return detail::encodeElements(enc, value);
    }
    else if constexpr (detail::IsStdArray<T>::value)
    {
        return detail::encodeElements(enc, value);
    }
    else if constexpr (detail::IsOptional<T>::value || detail::IsUniquePtr<T>::value)
    {
        const bool present = static_cast<bool>(value);
        if (llvm::Error err = enc.writeBool(present))
        {
            return err;
        }
        if (!present)
        {
            return llvm::Error::success();
        }
        return enc.nested([&] { return encodeValue(enc, *value); });
    }
    else if constexpr (detail::IsVariant<T>::value)
    {
        static_assert(std::variant_size_v<T> <= 256U, "variant has too many alternatives for a one-byte tag");
        if (value.valueless_by_exception())
        {
            return makeCodecError(CodecErrc::InvalidEnumTag, enc.offset(), "valueless variant");
        }
        if (llvm::Error err = enc.writeUnsigned(value.index(), 1U))
        {
            return err;
        }
        return std::visit([&](const auto& payload) { return enc.nested([&] { return encodeValue(enc, payload); }); },
                          value);
    }
    else if constexpr (CodecEnum<T>)
    {
        static_assert(EnumTraits<T>::kEnumeratorCount <= 256U, "enum has too many enumerators for a one-byte tag");
        const auto index = static_cast<std::uint64_t>(static_cast<std::underlying_type_t<T>>(value));
        if (index >= EnumTraits<T>::kEnumeratorCount)
        {
            return makeCodecError(CodecErrc::InvalidEnumTag, enc.offset(), "enumerator " + std::to_string(index));
        }
        return enc.writeUnsigned(index, 1U);
    }
    else if constexpr (Record<T>)
    {
        return detail::encodeFields(enc, value.fields());
    }
    else
    {
        static_assert(detail::kUnsupported<T>, "type has no Borsh encoding");
    }
}

/// @brief Decodes a value of type `T` into `out` from the decoder's current position.
///
/// `out` should be default-constructed; for `llvm::APInt` its bit width selects
/// the encoded width.
template <typename T>
llvm::Error decodeValue(Decoder& dec, T& out)
{
    if constexpr (std::is_same_v<T, bool>)
    {
        return dec.readBool(out);
    }
    else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>)
    {
        std::int64_t raw = 0;
        if (llvm::Error err = dec.readSigned(raw, static_cast<std::uint8_t>(sizeof(T))))
        {
            return err;
        }
        out = static_cast<T>(raw);
        return llvm::Error::success();
    }
    else if constexpr (std::is_integral_v<T>)
    {
        std::uint64_t raw = 0;
        if (llvm::Error err = dec.readUnsigned(raw, static_cast<std::uint8_t>(sizeof(T))))
        {
            return err;
        }
        out = static_cast<T>(raw);
        return llvm::Error::success();
    }
    else if constexpr (std::is_same_v<T, float>)
    {
        return dec.readF32(out);
    }
    else if constexpr (std::is_same_v<T, double>)
    {
        return dec.readF64(out);
    }
    else if constexpr (std::is_same_v<T, llvm::APInt>)
    {
        return dec.readWide(out);
    }
    else if constexpr (std::is_same_v<T, std::monostate>)
    {
        return llvm::Error::success();
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
        std::uint32_t length = 0;
        if (llvm::Error err = dec.readLength(length))
        {
            return err;
        }
        const std::size_t            textOffset = dec.offset();
        llvm::ArrayRef<std::uint8_t> bytes;
        if (llvm::Error err = dec.readBytes(length, bytes))
        {
            return err;
        }
        const auto* begin = reinterpret_cast<const llvm::UTF8*>(bytes.data());
        const auto* end   = begin + bytes.size();
        if (!bytes.empty() && !llvm::isLegalUTF8String(&begin, end))
        {
            return makeCodecError(CodecErrc::InvalidUtf8,
                                  textOffset + static_cast<std::size_t>(begin - reinterpret_cast<const llvm::UTF8*>(
                                                                                    bytes.data())));
        }
        out.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        return llvm::Error::success();
    }
    else if constexpr (detail::IsVector<T>::value)
    {
        using Element        = typename T::value_type;
        std::uint32_t length = 0;
        if (llvm::Error err = dec.readLength(length))
        {
            return err;
        }
        out.clear();
        if constexpr (detail::kIsFixedScalar<Element>)
        {
            if (llvm::Error err = dec.requireElements(length, sizeof(Element)))
            {
                return err;
            }
            out.reserve(length);
        }
        for (std::uint32_t i = 0; i < length; ++i)
        {
            auto& element = out.emplace_back();
            if (llvm::Error err = dec.nested([&] { return decodeValue(dec, element); }))
            {
                return err;
            }
        }
        return llvm::Error::success();
    }
    else if constexpr (detail::IsStdArray<T>::value)
    {
        for (auto& element : out)
        {
            if (llvm::Error err = dec.nested([&] { return decodeValue(dec, element); }))
            {
                return err;
            }
        }
        return llvm::Error::success();
    }
    else if constexpr (detail::IsOptional<T>::value)
    {
        bool present = false;
        if (llvm::Error err = dec.readBool(present))
        {
            return err;
        }
        if (!present)
        {
            out.reset();
            return llvm::Error::success();
        }
        auto& payload = out.emplace();
        return dec.nested([&] { return decodeValue(dec, payload); });
    }
    else if constexpr (detail::IsUniquePtr<T>::value)
    {
        bool present = false;
        if (llvm::Error err = dec.readBool(present))
        {
            return err;
        }
        if (!present)
        {
            out.reset();
            return llvm::Error::success();
        }
        out = std::make_unique<typename T::element_type>();
        return dec.nested([&] { return decodeValue(dec, *out); });
    }
    else if constexpr (detail::IsVariant<T>::value)
    {
        static_assert(std::variant_size_v<T> <= 256U, "variant has too many alternatives for a one-byte tag");
        std::uint64_t tag = 0;
        if (llvm::Error err = dec.readUnsigned(tag, 1U))
        {
            return err;
        }
        return detail::decodeAlternative(dec, out, static_cast<std::size_t>(tag));
    }
    else if constexpr (CodecEnum<T>)
    {
        std::uint64_t index = 0;
        if (llvm::Error err = dec.readUnsigned(index, 1U))
        {
            return err;
        }
        if (index >= EnumTraits<T>::kEnumeratorCount)
        {
            return makeCodecError(CodecErrc::InvalidEnumTag, dec.offset() - 1U, "enumerator " + std::to_string(index));
        }
        out = static_cast<T>(static_cast<std::underlying_type_t<T>>(index));
        return llvm::Error::success();
    }
    else if constexpr (Record<T>)
    {
        auto fields = out.fields();
        return detail::decodeFields(dec, fields);
    }
    else
    {
        static_assert(detail::kUnsupported<T>, "type has no Borsh decoding");
    }
}

/// @brief Computes the exact encoded size of `value`.
template <typename T>
llvm::Expected<std::size_t> serializedSize(const T& value, const std::uint32_t maxDepth = kDefaultMaxRecursionDepth)
{
    Encoder enc = Encoder::sizing(maxDepth);
    if (llvm::Error err = encodeValue(enc, value))
    {
        return std::move(err);
    }
    return enc.offset();
}

/// @brief Encodes `value` into `output`.
/// @return Number of bytes written, or `BufferTooSmall` when `output` is too short.
template <typename T>
llvm::Expected<std::size_t> serialize(const T&                            value,
                                      llvm::MutableArrayRef<std::uint8_t> output,
                                      const std::uint32_t                 maxDepth = kDefaultMaxRecursionDepth)
{
    Encoder enc(output, maxDepth);
    if (llvm::Error err = encodeValue(enc, value))
    {
        return std::move(err);
    }
    return enc.offset();
}

/// @brief Encodes `value` into a freshly sized byte vector.
template <typename T>
llvm::Expected<std::vector<std::uint8_t>> serializeToVector(const T&            value,
                                                            const std::uint32_t maxDepth = kDefaultMaxRecursionDepth)
{
    llvm::Expected<std::size_t> size = serializedSize(value, maxDepth);
    if (!size)
    {
        return size.takeError();
    }
    std::vector<std::uint8_t>   bytes(*size);
    llvm::Expected<std::size_t> written = serialize(value, bytes, maxDepth);
    if (!written)
    {
        return written.takeError();
    }
    return bytes;
}

/// @brief Decodes `input` into `out`, requiring that every input byte is consumed.
template <typename T>
llvm::Error deserialize(llvm::ArrayRef<std::uint8_t> input,
                        T&                           out,
                        const std::uint32_t          maxDepth = kDefaultMaxRecursionDepth)
{
    Decoder dec(input, maxDepth);
    if (llvm::Error err = decodeValue(dec, out))
    {
        return err;
    }
    return dec.finish();
}

/// @brief Decodes one value from the front of `input`, tolerating trailing bytes.
/// @return Number of bytes consumed, so the caller can continue at `input.drop_front(n)`.
template <typename T>
llvm::Expected<std::size_t> deserializeStream(llvm::ArrayRef<std::uint8_t> input,
                                              T&                           out,
                                              const std::uint32_t          maxDepth = kDefaultMaxRecursionDepth)
{
    Decoder dec(input, maxDepth);
    if (llvm::Error err = decodeValue(dec, out))
    {
        return std::move(err);
    }
    return dec.offset();
}

}  // namespace borshrt

#endif  // BORSHRT_CODEC_SERDE_H
