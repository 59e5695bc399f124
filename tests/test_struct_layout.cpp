#include "wirecast/wirecast.hpp"
#include "TestSupport.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <utility>

namespace {

struct Header {
    std::uint8_t version = 0;
    std::uint16_t length = 0;
};

bool operator==(const Header& a, const Header& b) {
    return a.version == b.version && a.length == b.length;
}

struct Packet {
    Header header;
    std::uint32_t sequence = 0;
    std::array<std::uint16_t, 2> samples{};
    std::array<std::uint8_t, 3> tag{};
};

bool operator==(const Packet& a, const Packet& b) {
    return a.header == b.header && a.sequence == b.sequence && a.samples == b.samples && a.tag == b.tag;
}

struct Reading {
    std::int16_t celsius = 0;
    float ratio = 0.0f;
    double total = 0.0;
};

struct Unit {};

using Tagged = std::pair<std::uint8_t, std::uint32_t>;

// Tenths of a degree, stored on the wire as a big-endian i16.
struct Celsius {
    std::int16_t tenths = 0;
};

// 0..100; larger bytes are rejected on decode.
struct Percent {
    std::uint8_t value = 0;
};

struct OutOfRange {
    std::uint8_t value = 0;
};

struct Climate {
    Celsius inside;
    Percent humidity;
};

} // namespace

namespace wirecast::core {

template<>
struct RawTraits<Celsius> {
    using Raw = BigEndian<std::int16_t>;

    static Raw toRaw(const Celsius& value) { return Raw(value.tenths); }
    static Celsius fromRaw(const Raw& raw) { return Celsius{raw.get()}; }
};

template<>
struct RawTraits<Percent> {
    using Raw = std::uint8_t;
    using Error = OutOfRange;

    static Raw toRaw(const Percent& value) { return value.value; }
    static expected<Percent, OutOfRange> tryFromRaw(const Raw& raw) {
        if (raw > 100) {
            return unexpected(OutOfRange{raw});
        }
        return Percent{raw};
    }
};

} // namespace wirecast::core

WIRECAST_BYTEABLE_VIA(Celsius)
WIRECAST_BYTEABLE_VIA(Percent)

namespace wirecast::layout {

template<>
struct LayoutSchema<Header> {
    static constexpr auto fields = std::make_tuple(
        field<&Header::version>("version"),
        field<&Header::length>("length", littleEndian));
};

template<>
struct LayoutSchema<Packet> {
    static constexpr auto fields = std::make_tuple(
        field<&Packet::header>("header", transparent),
        field<&Packet::sequence>("sequence", bigEndian),
        field<&Packet::samples>("samples", bigEndian),
        field<&Packet::tag>("tag"));
};

template<>
struct LayoutSchema<Reading> {
    static constexpr auto fields = std::make_tuple(
        field<&Reading::celsius>("celsius", bigEndian),
        field<&Reading::ratio>("ratio", littleEndian),
        field<&Reading::total>("total", bigEndian));
};

template<>
struct LayoutSchema<Unit> {
    static constexpr auto fields = std::make_tuple();
};

template<>
struct LayoutSchema<Tagged> {
    static constexpr auto fields = std::make_tuple(element<0>(), element<1>(bigEndian));
};

template<>
struct LayoutSchema<Climate> {
    static constexpr auto fields = std::make_tuple(
        field<&Climate::inside>("inside", transparent),
        field<&Climate::humidity>("humidity", tryTransparent));
};

} // namespace wirecast::layout

using namespace wirecast::core;
using wirecast::layout::RawLayout;
using wirecast::layout::StructLayout;

static void testSimpleStruct() {
    static_assert(byteSizeOf<Header> == 3, "u8 + u16 without padding");
    static_assert(StructLayout<Header>::fieldCount == 2, "two fields");
    static_assert(!StructLayout<Header>::fallible, "plain and endian fields never fail");
    static_assert(hasFromByteArray<Header>, "infallible schema decodes infallibly");
    static_assert(std::is_same_v<TryFromErrorOf<Header>, Infallible>, "blanket try path");
    static_assert(isValidBytecast<StructLayout<Header>::Raw>, "generated layout is marked");
    static_assert(!isValidBytecast<Header>, "the user type itself is not");

    const Header h{1, 0x0203};
    const ByteArray<3> expected{0x01, 0x03, 0x02};
    ASSERT_BYTES_EQ(intoByteArray(h), expected, "fields back to back in declared order");
    ASSERT_TRUE(fromByteArray<Header>(expected) == h, "decode restores every field");

    const auto raw = RawTraits<Header>::toRaw(h);
    ASSERT_EQ(raw.get<0>(), std::uint8_t{1}, "raw plain slot");
    ASSERT_EQ(raw.get<1>().get(), std::uint16_t{0x0203}, "raw endian slot holds the wrapper");
    ASSERT_TRUE(RawTraits<Header>::fromRaw(raw) == h, "raw round trip");
}

static void testFieldMetadata() {
    constexpr auto names = StructLayout<Packet>::fieldNames();
    static_assert(names.size() == 4, "one name per field");
    ASSERT_EQ(names[0], std::string_view("header"), "first name");
    ASSERT_EQ(StructLayout<Packet>::fieldName(3), std::string_view("tag"), "last name");
    ASSERT_TRUE(StructLayout<Packet>::fieldName(4).empty(), "out of range name is empty");

    static_assert(StructLayout<Packet>::fieldOffsets[0] == 0, "header at 0");
    static_assert(StructLayout<Packet>::fieldOffsets[1] == 3, "sequence after header");
    static_assert(StructLayout<Packet>::fieldOffsets[2] == 7, "samples after sequence");
    static_assert(StructLayout<Packet>::fieldOffsets[3] == 11, "tag after samples");
}

static void testNestedTransparentStruct() {
    static_assert(byteSizeOf<Packet> == 14, "nested struct contributes its own size");

    Packet p;
    p.header = Header{1, 0x0203};
    p.sequence = 0x0A0B0C0D;
    p.samples = {{0x1122, 0x3344}};
    p.tag = {{7, 8, 9}};

    const ByteArray<14> expected{
        0x01, 0x03, 0x02,                  // header
        0x0A, 0x0B, 0x0C, 0x0D,            // sequence, big-endian
        0x11, 0x22, 0x33, 0x44,            // samples, each big-endian
        0x07, 0x08, 0x09,                  // tag
    };
    const auto bytes = intoByteArray(p);
    ASSERT_BYTES_EQ(bytes, expected, "outer bytes embed the inner struct's bytes");

    ByteArray<3> inner{};
    std::copy(bytes.begin(), bytes.begin() + 3, inner.begin());
    ASSERT_BYTES_EQ(inner, intoByteArray(p.header), "inner bytes equal the inner struct on its own");

    ASSERT_TRUE(fromByteArray<Packet>(expected) == p, "nested round trip");
}

static void testMixedNumberKinds() {
    static_assert(byteSizeOf<Reading> == 14, "i16 + f32 + f64");

    Reading r;
    r.celsius = -2;
    r.ratio = 1.5f;
    r.total = -2.0;
    const ByteArray<14> expected{
        0xFF, 0xFE,
        0x00, 0x00, 0xC0, 0x3F,
        0xC0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    };
    ASSERT_BYTES_EQ(intoByteArray(r), expected, "each field in its own declared order");

    const Reading back = fromByteArray<Reading>(expected);
    ASSERT_EQ(back.celsius, std::int16_t{-2}, "signed field");
    ASSERT_EQ(back.ratio, 1.5f, "float field");
    ASSERT_EQ(back.total, -2.0, "double field");
}

static void testUnitStruct() {
    static_assert(byteSizeOf<Unit> == 0, "zero-field type has no bytes");
    static_assert(StructLayout<Unit>::fieldCount == 0, "no fields");
    ASSERT_EQ(intoByteArray(Unit{}).size(), std::size_t{0}, "empty encoding");
    (void)fromByteArray<Unit>(ByteArray<0>{});
    auto decoded = tryFromByteArray<Unit>(ByteArray<0>{});
    ASSERT_TRUE(decoded.has_value(), "empty decoding succeeds");
}

static void testTupleLikeElements() {
    static_assert(byteSizeOf<Tagged> == 5, "u8 + u32");
    ASSERT_EQ(StructLayout<Tagged>::fieldName(1), std::string_view("1"), "elements are named by index");

    const Tagged t{0x7F, 0x01020304u};
    const ByteArray<5> expected{0x7F, 0x01, 0x02, 0x03, 0x04};
    ASSERT_BYTES_EQ(intoByteArray(t), expected, "elements in index order");
    ASSERT_TRUE(fromByteArray<Tagged>(expected) == t, "pair round trip");
}

static void testRawLayoutDirectly() {
    using Raw = RawLayout<std::uint8_t, BigEndian<std::uint16_t>, std::array<std::uint8_t, 2>>;
    static_assert(Raw::byteSize == 5, "concatenated size");
    static_assert(Raw::offsets[2] == 3, "offsets accumulate");
    static_assert(isValidBytecast<Raw>, "all fields marked");
    static_assert(!isValidBytecast<RawLayout<std::uint8_t, BoolRaw, float>>, "one unmarked field removes it");

    const ByteArray<5> bytes{0x09, 0x12, 0x34, 0xAA, 0xBB};
    const Raw raw = Raw::fromBytes(bytes);
    ASSERT_EQ(raw.get<1>().get(), std::uint16_t{0x1234}, "slot decoded at its offset");
    ASSERT_BYTES_EQ(raw.toBytes(), bytes, "raw bytes round trip");
    ASSERT_TRUE(raw == Raw::fromBytes(bytes), "equal raw layouts");
}

static void testHandWrittenRawType() {
    static_assert(byteSizeOf<Celsius> == 2, "byte form of the raw type");
    static_assert(hasFromByteArray<Celsius>, "infallible raw decodes infallibly");
    static_assert(std::is_same_v<TryFromErrorOf<Celsius>, Infallible>, "blanket try path");

    const ByteArray<2> minus{0xFF, 0x38};
    ASSERT_BYTES_EQ(intoByteArray(Celsius{-200}), minus, "encoded through the raw type");
    ASSERT_EQ(fromByteArray<Celsius>(minus).tenths, std::int16_t{-200}, "decoded through the raw type");

    static_assert(!hasFromByteArray<Percent>, "fallible raw has no infallible decode");
    static_assert(std::is_same_v<TryFromErrorOf<Percent>, OutOfRange>, "raw error type is the decode error");
    ASSERT_BYTES_EQ(intoByteArray(Percent{42}), (ByteArray<1>{42}), "fallible type still encodes infallibly");

    auto ok = tryFromByteArray<Percent>(ByteArray<1>{100});
    ASSERT_TRUE(ok.has_value() && ok->value == 100, "in range");
    auto bad = tryFromByteArray<Percent>(ByteArray<1>{101});
    ASSERT_TRUE(!bad.has_value(), "out of range");
    if (!bad) {
        ASSERT_EQ(bad.error().value, std::uint8_t{101}, "error carries the byte");
    }
}

static void testHandWrittenRawTypeAsField() {
    static_assert(byteSizeOf<Climate> == 3, "i16 + u8");
    static_assert(StructLayout<Climate>::fallible, "tryTransparent member");
    static_assert(std::is_same_v<TryFromErrorOf<Climate>, OutOfRange>, "member error propagates");

    const ByteArray<3> bytes{0x00, 0xD7, 0x37};
    const Climate c{Celsius{215}, Percent{55}};
    ASSERT_BYTES_EQ(intoByteArray(c), bytes, "members use their raw byte forms");

    auto back = tryFromByteArray<Climate>(bytes);
    ASSERT_TRUE(back.has_value(), "valid climate decodes");
    if (back) {
        ASSERT_EQ(back->inside.tenths, std::int16_t{215}, "transparent member");
        ASSERT_EQ(back->humidity.value, std::uint8_t{55}, "tryTransparent member");
    }

    auto rejected = tryFromByteArray<Climate>(ByteArray<3>{0x00, 0x01, 0xC8});
    ASSERT_TRUE(!rejected.has_value() && rejected.error().value == 200, "member failure returned unchanged");
}

int main() {
    testSimpleStruct();
    testFieldMetadata();
    testNestedTransparentStruct();
    testMixedNumberKinds();
    testUnitStruct();
    testTupleLikeElements();
    testRawLayoutDirectly();
    testHandWrittenRawType();
    testHandWrittenRawTypeAsField();
    return wirecast::test::finish("StructLayout");
}
