#pragma once

#include <climits>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <google/protobuf/message.h>
#include <google/protobuf/unknown_field_set.h>
#include <tl/expected.hpp>

#include "memc/errors.hpp"

namespace memc::codec
{
    /// The opaque payload stored in the cache.
    using Bytes = std::vector<std::byte>;

    inline Bytes toBytes(std::string const& str)
    {
        Bytes bytes(str.size());
        std::memcpy(bytes.data(), str.data(), str.size());
        return bytes;
    }

    inline std::string toString(Bytes const& bytes)
    {
        return {reinterpret_cast<char const*>(bytes.data()), bytes.size()};
    }

    /// Codec converts values of type T to and from bytes. Each supported type provides a
    /// specialization with static encode and decode functions. Types without a
    /// specialization are rejected at compile time.
    template<typename T>
    struct Codec;

    /// Maps a plain struct onto a protobuf message so that it can be cached as a record.
    ///
    /// Specialize for each record type:
    /// @code
    /// template<>
    /// struct memc::codec::RecordTraits<Person>
    /// {
    ///     using Proto = protos::Person;
    ///     static protos::Person toProto(Person const& person);
    ///     static Person fromProto(protos::Person const& proto);
    /// };
    /// @endcode
    template<typename T>
    struct RecordTraits;

    template<typename T>
    concept ProtoMessage = std::derived_from<T, google::protobuf::Message>;

    template<typename T>
    concept Record = !ProtoMessage<T>
        && requires(T const& value, typename RecordTraits<T>::Proto const& proto) {
               requires ProtoMessage<typename RecordTraits<T>::Proto>;
               { RecordTraits<T>::toProto(value) } -> std::same_as<typename RecordTraits<T>::Proto>;
               { RecordTraits<T>::fromProto(proto) } -> std::same_as<T>;
           };

    /// A composite value with a field-tagged structural encoding.
    template<typename T>
    concept Structured = ProtoMessage<T> || Record<T>;

    /// Fixed-width integers. Character and boolean types are excluded.
    template<typename T>
    concept Integer = std::integral<T> && !std::same_as<T, bool> && !std::same_as<T, char>
        && !std::same_as<T, wchar_t> && !std::same_as<T, char8_t> && !std::same_as<T, char16_t>
        && !std::same_as<T, char32_t>;

    template<typename T>
    concept Encodable = requires(T const& value) {
        { Codec<T>::encode(value) } -> std::same_as<tl::expected<Bytes, Error>>;
    };

    template<typename T>
    concept Decodable = requires(Bytes const& bytes) {
        { Codec<T>::decode(bytes) } -> std::same_as<tl::expected<T, Error>>;
    };

    namespace detail
    {
        // Platform-width integers always travel as 64 bits so that the layout does not
        // depend on the data model of the writer.
        template<Integer T>
        constexpr bool isPlatformWidth()
        {
            return std::is_same_v<T, long> || std::is_same_v<T, unsigned long>
                || std::is_same_v<T, long long> || std::is_same_v<T, unsigned long long>;
        }

        template<Integer T>
        constexpr std::size_t wireWidth()
        {
            if constexpr (isPlatformWidth<T>())
            {
                return 8;
            }
            return sizeof(T);
        }

        template<std::size_t Width>
        struct WireType;

        template<>
        struct WireType<1>
        {
            using Signed = int8_t;
            using Unsigned = uint8_t;
        };

        template<>
        struct WireType<2>
        {
            using Signed = int16_t;
            using Unsigned = uint16_t;
        };

        template<>
        struct WireType<4>
        {
            using Signed = int32_t;
            using Unsigned = uint32_t;
        };

        template<>
        struct WireType<8>
        {
            using Signed = int64_t;
            using Unsigned = uint64_t;
        };
    }  // namespace detail

    template<>
    struct Codec<Bytes>
    {
        static tl::expected<Bytes, Error> encode(Bytes const& value) { return value; }

        static tl::expected<Bytes, Error> decode(Bytes const& bytes) { return bytes; }
    };

    template<>
    struct Codec<std::string>
    {
        static tl::expected<Bytes, Error> encode(std::string const& value)
        {
            return toBytes(value);
        }

        static tl::expected<std::string, Error> decode(Bytes const& bytes)
        {
            return toString(bytes);
        }
    };

    /// C strings encode like std::string. They cannot be decoded into.
    template<>
    struct Codec<char const*>
    {
        static tl::expected<Bytes, Error> encode(char const* const& value)
        {
            if (value == nullptr)
            {
                return tl::make_unexpected(errors::EncodingFailure {.message = "null string"});
            }
            return toBytes(value);
        }
    };

    /// Integers are encoded little-endian in exactly their wire width.
    template<Integer T>
    struct Codec<T>
    {
        static constexpr std::size_t WIDTH = detail::wireWidth<T>();

        using Unsigned = typename detail::WireType<WIDTH>::Unsigned;
        using Wire = std::conditional_t<std::is_signed_v<T>,
                                        typename detail::WireType<WIDTH>::Signed,
                                        Unsigned>;

        static tl::expected<Bytes, Error> encode(T const& value)
        {
            auto wire = static_cast<Unsigned>(static_cast<Wire>(value));
            Bytes bytes(WIDTH);
            for (std::size_t i = 0; i < WIDTH; ++i)
            {
                bytes[i] = static_cast<std::byte>((wire >> (CHAR_BIT * i)) & 0xFF);
            }
            return bytes;
        }

        static tl::expected<T, Error> decode(Bytes const& bytes)
        {
            if (bytes.size() != WIDTH)
            {
                return tl::make_unexpected(errors::DecodingFailure {
                    .message = fmt::format(
                        "expected {} bytes for a {}-bit integer, got {}",
                        WIDTH,
                        WIDTH * CHAR_BIT,
                        bytes.size())});
            }

            Unsigned wire = 0;
            for (std::size_t i = 0; i < WIDTH; ++i)
            {
                wire = static_cast<Unsigned>(
                    wire | (static_cast<Unsigned>(std::to_integer<uint8_t>(bytes[i])) << (CHAR_BIT * i)));
            }

            auto value = static_cast<Wire>(wire);
            if constexpr (sizeof(Wire) > sizeof(T))
            {
                if (!std::in_range<T>(value))
                {
                    return tl::make_unexpected(errors::DecodingFailure {
                        .message = fmt::format("value {} does not fit in {} bytes", value, sizeof(T))});
                }
            }
            return static_cast<T>(value);
        }
    };

    /// Protobuf messages use their own field-tagged wire format. Decoding rejects payloads
    /// that carry fields the message type does not declare.
    template<ProtoMessage T>
    struct Codec<T>
    {
        static tl::expected<Bytes, Error> encode(T const& value)
        {
            std::string serialized;
            if (!value.SerializeToString(&serialized))
            {
                return tl::make_unexpected(errors::EncodingFailure {
                    .message = fmt::format("failed to serialize {}", value.GetTypeName())});
            }
            return toBytes(serialized);
        }

        static tl::expected<T, Error> decode(Bytes const& bytes)
        {
            if (bytes.size() > static_cast<std::size_t>(INT_MAX))
            {
                return tl::make_unexpected(errors::DecodingFailure {
                    .message = fmt::format("payload of {} bytes is too large", bytes.size())});
            }

            T message;
            if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size())))
            {
                return tl::make_unexpected(errors::DecodingFailure {
                    .message = fmt::format("failed to parse {}", message.GetTypeName())});
            }

            // The parser keeps fields it does not recognise, and fields whose wire type does
            // not match the schema, as unknown fields. Either means the bytes were written
            // for another type.
            if (!message.GetReflection()->GetUnknownFields(message).empty())
            {
                return tl::make_unexpected(errors::DecodingFailure {
                    .message = fmt::format("payload has fields unknown to {}", message.GetTypeName())});
            }
            return message;
        }
    };

    template<Record T>
    struct Codec<T>
    {
        using Proto = typename RecordTraits<T>::Proto;

        static tl::expected<Bytes, Error> encode(T const& value)
        {
            return Codec<Proto>::encode(RecordTraits<T>::toProto(value));
        }

        static tl::expected<T, Error> decode(Bytes const& bytes)
        {
            return Codec<Proto>::decode(bytes).map([](Proto const& proto)
                                                   { return RecordTraits<T>::fromProto(proto); });
        }
    };

    namespace detail
    {
        template<Structured T>
        tl::expected<Bytes, Error> encodePointee(T const* value)
        {
            if (value == nullptr)
            {
                return tl::make_unexpected(errors::EncodingFailure {.message = "null pointer"});
            }
            return Codec<T>::encode(*value);
        }
    }  // namespace detail

    template<typename T>
        requires Structured<std::remove_const_t<T>>
    struct Codec<T*>
    {
        static tl::expected<Bytes, Error> encode(T* const& value)
        {
            return detail::encodePointee<std::remove_const_t<T>>(value);
        }
    };

    template<Structured T>
    struct Codec<std::unique_ptr<T>>
    {
        static tl::expected<Bytes, Error> encode(std::unique_ptr<T> const& value)
        {
            return detail::encodePointee<T>(value.get());
        }

        static tl::expected<std::unique_ptr<T>, Error> decode(Bytes const& bytes)
        {
            return Codec<T>::decode(bytes).map([](T&& value)
                                               { return std::make_unique<T>(std::move(value)); });
        }
    };

    template<Structured T>
    struct Codec<std::shared_ptr<T>>
    {
        static tl::expected<Bytes, Error> encode(std::shared_ptr<T> const& value)
        {
            return detail::encodePointee<T>(value.get());
        }

        static tl::expected<std::shared_ptr<T>, Error> decode(Bytes const& bytes)
        {
            return Codec<T>::decode(bytes).map([](T&& value)
                                               { return std::make_shared<T>(std::move(value)); });
        }
    };

    /// Encodes a value into the bytes stored in the cache.
    /// @param value The value to encode.
    /// @return The encoded bytes or an EncodingFailure.
    template<Encodable T>
    tl::expected<Bytes, Error> encode(T const& value)
    {
        return Codec<T>::encode(value);
    }

    /// Decodes bytes read from the cache into the requested type.
    /// @param bytes The bytes to decode.
    /// @return The decoded value or a DecodingFailure.
    template<Decodable T>
    tl::expected<T, Error> decode(Bytes const& bytes)
    {
        return Codec<T>::decode(bytes);
    }
}  // namespace memc::codec
