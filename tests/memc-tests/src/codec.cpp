#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "memc/codec.hpp"

#include <gtest/gtest.h>

#include "memc_test_protos/person.pb.h"
#include "records/person.hpp"

using memc::codec::Bytes;
using memc::codec::decode;
using memc::codec::encode;
using memc::testing::Person;

namespace
{
    Bytes bytes(std::initializer_list<int> values)
    {
        Bytes result;
        for (int value : values)
        {
            result.push_back(static_cast<std::byte>(value));
        }
        return result;
    }

    Bytes repeated(std::size_t count, int value)
    {
        return Bytes(count, static_cast<std::byte>(value));
    }

    template<typename T>
    void expectRoundTrip(T value)
    {
        auto encoded = encode(value);
        ASSERT_TRUE(encoded.has_value());
        auto decoded = decode<T>(*encoded);
        ASSERT_TRUE(decoded.has_value());
        EXPECT_EQ(*decoded, value);
    }

    template<typename T>
    void expectIntegerLimits()
    {
        expectRoundTrip<T>(std::numeric_limits<T>::min());
        expectRoundTrip<T>(std::numeric_limits<T>::max());
        expectRoundTrip<T>(T {0});
        expectRoundTrip<T>(T {1});
        if constexpr (std::is_signed_v<T>)
        {
            expectRoundTrip<T>(T {-1});
        }
    }

    template<typename T>
    bool isDecodingFailure(tl::expected<T, memc::Error> const& result)
    {
        return !result.has_value()
            && std::holds_alternative<memc::errors::DecodingFailure>(result.error());
    }
}  // namespace

TEST(CodecEncode, BytesUnchanged)
{
    auto input = bytes({2, 4, 6, 8});
    auto encoded = encode(input);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(*encoded, input);
}

TEST(CodecEncode, EmptyBytes)
{
    auto encoded = encode(Bytes {});
    ASSERT_TRUE(encoded.has_value());
    EXPECT_TRUE(encoded->empty());
}

TEST(CodecEncode, StringIsRawBytes)
{
    auto encoded = encode(std::string("foobar"));
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded->size(), 6);
    EXPECT_EQ(memc::codec::toString(*encoded), "foobar");
}

TEST(CodecEncode, IntegerWidths)
{
    EXPECT_EQ(encode(int8_t {3})->size(), 1);
    EXPECT_EQ(encode(uint8_t {3})->size(), 1);
    EXPECT_EQ(encode(std::numeric_limits<int16_t>::max())->size(), 2);
    EXPECT_EQ(encode(std::numeric_limits<uint16_t>::max())->size(), 2);
    EXPECT_EQ(encode(std::numeric_limits<int32_t>::max())->size(), 4);
    EXPECT_EQ(encode(std::numeric_limits<uint32_t>::max())->size(), 4);
    EXPECT_EQ(encode(std::numeric_limits<int64_t>::max())->size(), 8);
    EXPECT_EQ(encode(std::numeric_limits<uint64_t>::max())->size(), 8);
}

TEST(CodecEncode, PlatformWidthIntegersUseEightBytes)
{
    EXPECT_EQ(encode(std::numeric_limits<long>::max())->size(), 8);
    EXPECT_EQ(encode(std::numeric_limits<unsigned long>::max())->size(), 8);
    EXPECT_EQ(encode(std::numeric_limits<long long>::max())->size(), 8);
    EXPECT_EQ(encode(std::numeric_limits<unsigned long long>::max())->size(), 8);
}

TEST(CodecEncode, IntegerIsLittleEndian)
{
    EXPECT_EQ(*encode(int16_t {-2}), bytes({0xfe, 0xff}));
    EXPECT_EQ(*encode(uint32_t {0x01020304}), bytes({0x04, 0x03, 0x02, 0x01}));
    EXPECT_EQ(*encode(int64_t {998877}), bytes({0xdd, 0x3d, 0x0f, 0x00, 0x00, 0x00, 0x00, 0x00}));
}

TEST(CodecEncode, RecordIsLengthPrefixedTextAndFixedWidthInteger)
{
    auto encoded = encode(Person {.name = "bob", .age = 32});
    ASSERT_TRUE(encoded.has_value());
    // Tag and length for the name, three name bytes, then a tag and eight integer bytes.
    EXPECT_EQ(encoded->size(), 2 + 3 + 1 + 8);
}

TEST(CodecEncode, RecordPointerMatchesValue)
{
    auto person = Person {.name = "bob", .age = 32};
    auto byValue = encode(person);
    auto byPointer = encode(&person);
    auto byUnique = encode(std::make_unique<Person>(person));
    auto byShared = encode(std::make_shared<Person>(person));
    ASSERT_TRUE(byValue.has_value());
    ASSERT_TRUE(byPointer.has_value());
    ASSERT_TRUE(byUnique.has_value());
    ASSERT_TRUE(byShared.has_value());
    EXPECT_EQ(*byPointer, *byValue);
    EXPECT_EQ(*byUnique, *byValue);
    EXPECT_EQ(*byShared, *byValue);
}

TEST(CodecEncode, CStringMatchesString)
{
    char const* text = "foobar";
    auto encoded = encode(text);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(*encoded, *encode(std::string("foobar")));

    char const* missing = nullptr;
    auto failed = encode(missing);
    ASSERT_FALSE(failed.has_value());
    EXPECT_TRUE(std::holds_alternative<memc::errors::EncodingFailure>(failed.error()));
}

TEST(CodecEncode, NullRecordPointerFails)
{
    Person const* person = nullptr;
    auto encoded = encode(person);
    ASSERT_FALSE(encoded.has_value());
    EXPECT_TRUE(std::holds_alternative<memc::errors::EncodingFailure>(encoded.error()));

    auto unique = encode(std::unique_ptr<Person> {});
    ASSERT_FALSE(unique.has_value());
    EXPECT_TRUE(std::holds_alternative<memc::errors::EncodingFailure>(unique.error()));
}

TEST(CodecDecode, BytesCopied)
{
    auto result = decode<Bytes>(bytes({1, 2}));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, bytes({1, 2}));
}

TEST(CodecDecode, String)
{
    auto result = decode<std::string>(memc::codec::toBytes("hello"));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "hello");
}

TEST(CodecDecode, StringKeepsEmbeddedNul)
{
    auto text = std::string("a\0b", 3);
    auto result = decode<std::string>(*encode(text));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), 3);
    EXPECT_EQ(*result, text);
}

TEST(CodecDecode, SignExtension)
{
    EXPECT_EQ(*decode<int8_t>(bytes({0xfe})), -2);
    EXPECT_EQ(*decode<int16_t>(bytes({0xfe, 0xff})), -2);
    EXPECT_EQ(*decode<int32_t>(bytes({0xfe, 0xff, 0xff, 0xff})), -2);
    EXPECT_EQ(*decode<int64_t>(bytes({0xfe, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff})), -2);
    EXPECT_EQ(*decode<long>(bytes({0xfe, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff})), -2);
}

TEST(CodecDecode, AllBitsSetIsUnsignedMaximum)
{
    EXPECT_EQ(*decode<uint8_t>(repeated(1, 0xff)), std::numeric_limits<uint8_t>::max());
    EXPECT_EQ(*decode<uint16_t>(repeated(2, 0xff)), std::numeric_limits<uint16_t>::max());
    EXPECT_EQ(*decode<uint32_t>(repeated(4, 0xff)), std::numeric_limits<uint32_t>::max());
    EXPECT_EQ(*decode<uint64_t>(repeated(8, 0xff)), std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(*decode<unsigned long>(repeated(8, 0xff)), std::numeric_limits<unsigned long>::max());
}

TEST(CodecDecode, IntegerLengthMismatchFails)
{
    EXPECT_TRUE(isDecodingFailure(decode<int8_t>(Bytes {})));
    EXPECT_TRUE(isDecodingFailure(decode<int8_t>(bytes({1, 2}))));
    EXPECT_TRUE(isDecodingFailure(decode<uint16_t>(bytes({1}))));
    EXPECT_TRUE(isDecodingFailure(decode<int32_t>(repeated(8, 0))));
    EXPECT_TRUE(isDecodingFailure(decode<uint64_t>(repeated(4, 0))));
    EXPECT_TRUE(isDecodingFailure(decode<long>(repeated(4, 0))));
}

TEST(CodecDecode, RecordValue)
{
    auto encoded = encode(Person {.name = "alice", .age = 30});
    ASSERT_TRUE(encoded.has_value());

    auto result = decode<Person>(*encoded);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, (Person {.name = "alice", .age = 30}));
}

TEST(CodecDecode, RecordPointer)
{
    auto person = Person {.name = "bob", .age = 32};
    auto encoded = encode(&person);
    ASSERT_TRUE(encoded.has_value());

    auto unique = decode<std::unique_ptr<Person>>(*encoded);
    ASSERT_TRUE(unique.has_value());
    ASSERT_NE(*unique, nullptr);
    EXPECT_EQ(**unique, person);

    auto shared = decode<std::shared_ptr<Person>>(*encoded);
    ASSERT_TRUE(shared.has_value());
    ASSERT_NE(*shared, nullptr);
    EXPECT_EQ(**shared, person);
}

TEST(CodecDecode, RecordWithNegativeAndEmptyFields)
{
    expectRoundTrip(Person {.name = "", .age = std::numeric_limits<int64_t>::min()});
    expectRoundTrip(Person {.name = std::string(1000, 'x'), .age = -1});
    expectRoundTrip(Person {});
}

TEST(CodecDecode, MalformedRecordFails)
{
    // A length-delimited field that claims more bytes than remain.
    EXPECT_TRUE(isDecodingFailure(decode<Person>(bytes({0x0a, 0x10, 'a', 'b'}))));
}

TEST(CodecDecode, TextAsRecordFails)
{
    // "hi" parses as varint field 13, which Person does not declare.
    auto result = decode<Person>(memc::codec::toBytes("hi"));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<memc::errors::DecodingFailure>(result.error()));
}

TEST(CodecDecode, OtherMessageAsRecordFails)
{
    memc_test_protos::Inventory inventory;
    inventory.set_owner("carol");
    inventory.add_items("lamp");
    (*inventory.mutable_counts())["lamp"] = 2;

    auto encoded = encode(inventory);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_TRUE(isDecodingFailure(decode<Person>(*encoded)));
    EXPECT_TRUE(isDecodingFailure(decode<std::unique_ptr<Person>>(*encoded)));
}

TEST(CodecDecode, EmptyPayloadIsDefaultRecord)
{
    auto result = decode<Person>(Bytes {});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, Person {});
}

TEST(CodecDecode, ProtoMessage)
{
    memc_test_protos::Inventory inventory;
    inventory.set_owner("carol");
    inventory.add_items("lamp");
    inventory.add_items("rope");
    (*inventory.mutable_counts())["lamp"] = 2;

    auto encoded = encode(inventory);
    ASSERT_TRUE(encoded.has_value());

    auto result = decode<memc_test_protos::Inventory>(*encoded);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->owner(), "carol");
    ASSERT_EQ(result->items_size(), 2);
    EXPECT_EQ(result->items(0), "lamp");
    EXPECT_EQ(result->items(1), "rope");
    EXPECT_EQ(result->counts().at("lamp"), 2);

    auto pointer = decode<std::unique_ptr<memc_test_protos::Inventory>>(*encoded);
    ASSERT_TRUE(pointer.has_value());
    EXPECT_EQ((*pointer)->owner(), "carol");
}

TEST(CodecRoundTrip, IntegerLimits)
{
    expectIntegerLimits<int8_t>();
    expectIntegerLimits<uint8_t>();
    expectIntegerLimits<int16_t>();
    expectIntegerLimits<uint16_t>();
    expectIntegerLimits<int32_t>();
    expectIntegerLimits<uint32_t>();
    expectIntegerLimits<int64_t>();
    expectIntegerLimits<uint64_t>();
    expectIntegerLimits<long>();
    expectIntegerLimits<unsigned long>();
    expectIntegerLimits<int>();
    expectIntegerLimits<unsigned int>();
    expectIntegerLimits<short>();
}

TEST(CodecRoundTrip, EveryInt16)
{
    for (int32_t i = std::numeric_limits<int16_t>::min(); i <= std::numeric_limits<int16_t>::max(); ++i)
    {
        auto value = static_cast<int16_t>(i);
        ASSERT_EQ(*decode<int16_t>(*encode(value)), value);
    }
}

TEST(CodecRoundTrip, TextAndBytes)
{
    expectRoundTrip(std::string());
    expectRoundTrip(std::string("myvalue"));
    expectRoundTrip(std::string("h\xc3\xa9llo w\xc3\xb6rld"));
    expectRoundTrip(Bytes {});
    expectRoundTrip(repeated(4096, 0xab));
}

static_assert(memc::codec::Encodable<Person const*>);
static_assert(memc::codec::Encodable<Person*>);
static_assert(!memc::codec::Decodable<Person*>);
static_assert(!memc::codec::Encodable<bool>);
static_assert(!memc::codec::Encodable<double>);
static_assert(!memc::codec::Decodable<char>);
static_assert(memc::codec::Encodable<char const*>);
static_assert(!memc::codec::Decodable<char const*>);
