#include "wirecast/wirecast.hpp"
#include "TestSupport.hpp"

#include <array>
#include <cstdint>
#include <string_view>

namespace {

enum class Mode : std::uint8_t { Off = 0, Standby = 1, On = 2 };
enum class Opcode : std::uint16_t { Read = 0x0001, Write = 0x0100 };

struct Frame {
    std::uint8_t id = 0;
    Mode mode = Mode::Off;
    Opcode opcode = Opcode::Read;
    bool urgent = false;
    char32_t glyph = U'a';
};

bool operator==(const Frame& a, const Frame& b) {
    return a.id == b.id && a.mode == b.mode && a.opcode == b.opcode && a.urgent == b.urgent &&
           a.glyph == b.glyph;
}

struct Envelope {
    Frame frame;
    std::uint16_t checksum = 0;
};

struct Counters {
    std::uint16_t sent = 0;
    std::uint16_t lost = 0;
};

struct Report {
    Counters counters;
    Mode mode = Mode::Off;
};

} // namespace

namespace wirecast::layout {

template<>
struct EnumSchema<Mode> {
    static constexpr std::string_view name = "Mode";
    static constexpr auto variants = std::make_tuple(
        enumerator<Mode::Off>("Off"),
        enumerator<Mode::Standby>("Standby"),
        enumerator<Mode::On>("On"));
};

template<>
struct EnumSchema<Opcode> {
    static constexpr std::string_view name = "Opcode";
    static constexpr core::ByteOrder order = core::ByteOrder::Big;
    static constexpr auto variants = std::make_tuple(
        enumerator<Opcode::Read>("Read"),
        enumerator<Opcode::Write>("Write"));
};

template<>
struct LayoutSchema<Frame> {
    static constexpr auto fields = std::make_tuple(
        field<&Frame::id>("id"),
        field<&Frame::mode>("mode", tryTransparent),
        field<&Frame::opcode>("opcode", tryTransparent),
        field<&Frame::urgent>("urgent", tryTransparent),
        field<&Frame::glyph>("glyph", tryTransparent));
};

template<>
struct LayoutSchema<Envelope> {
    static constexpr auto fields = std::make_tuple(
        field<&Envelope::frame>("frame", tryTransparent),
        field<&Envelope::checksum>("checksum", littleEndian));
};

template<>
struct LayoutSchema<Counters> {
    static constexpr auto fields = std::make_tuple(
        field<&Counters::sent>("sent", bigEndian),
        field<&Counters::lost>("lost", bigEndian));
};

template<>
struct LayoutSchema<Report> {
    static constexpr auto fields = std::make_tuple(
        field<&Report::counters>("counters", transparent),
        field<&Report::mode>("mode", tryTransparent));
};

} // namespace wirecast::layout

using namespace wirecast::core;
using wirecast::layout::StructLayout;

static Frame sampleFrame() {
    Frame f;
    f.id = 9;
    f.mode = Mode::On;
    f.opcode = Opcode::Write;
    f.urgent = true;
    f.glyph = U'\U0001F980';
    return f;
}

static const ByteArray<9> kFrameBytes{
    0x09,                    // id
    0x02,                    // mode
    0x01, 0x00,              // opcode, big-endian
    0x01,                    // urgent
    0x80, 0xF9, 0x01, 0x00,  // glyph, little-endian code point
};

static void testFallibleStructShape() {
    static_assert(StructLayout<Frame>::fallible, "tryTransparent makes the schema fallible");
    static_assert(std::is_same_v<StructLayout<Frame>::Error, EnumFromBytesError>, "error of the fallible fields");
    static_assert(byteSizeOf<Frame> == 9, "1 + 1 + 2 + 1 + 4");
    static_assert(hasIntoByteArray<Frame>, "encoding stays infallible");
    static_assert(!hasFromByteArray<Frame>, "no infallible decode");
    static_assert(hasTryFromByteArray<Frame>, "checked decode");
    static_assert(std::is_same_v<TryIntoErrorOf<Frame>, Infallible>, "encoding error is the never type");
    static_assert(isValidBytecast<StructLayout<Frame>::Raw>, "raw layout of checked fields is marked");
}

static void testValidFrame() {
    const Frame f = sampleFrame();
    ASSERT_BYTES_EQ(intoByteArray(f), kFrameBytes, "checked fields encode through their raw types");

    auto decoded = tryFromByteArray<Frame>(kFrameBytes);
    ASSERT_TRUE(decoded.has_value(), "valid bytes decode");
    ASSERT_TRUE(decoded && *decoded == f, "decoded frame matches");
}

static void testInvalidFieldErrorPassesThrough() {
    auto bytes = kFrameBytes;
    bytes[1] = 7;
    auto decoded = tryFromByteArray<Frame>(bytes);
    ASSERT_TRUE(!decoded.has_value(), "bad enum byte rejects the struct");

    auto alone = tryFromByteArray<Mode>(ByteArray<1>{7});
    if (!decoded && !alone) {
        ASSERT_EQ(decoded.error(), alone.error(), "error equals decoding the field alone");
        ASSERT_EQ(decoded.error().typeName(), std::string_view("Mode"), "names the field's type");
    }

    bytes[4] = 2;
    auto twoBad = tryFromByteArray<Frame>(bytes);
    if (!twoBad) {
        ASSERT_EQ(twoBad.error().typeName(), std::string_view("Mode"), "first failing field wins");
    } else {
        ASSERT_TRUE(false, "two bad fields still reject");
    }

    auto badBool = kFrameBytes;
    badBool[4] = 2;
    auto boolResult = tryFromByteArray<Frame>(badBool);
    if (!boolResult) {
        ASSERT_EQ(boolResult.error().invalidDiscriminant(), Discriminant::u8(2), "bool byte reported");
        ASSERT_EQ(boolResult.error().typeName(), std::string_view("bool"), "bool type name");
    } else {
        ASSERT_TRUE(false, "bad bool rejects");
    }

    auto badChar = kFrameBytes;
    badChar[5] = 0x00;
    badChar[6] = 0xD8;
    badChar[7] = 0x00;
    auto charResult = tryFromByteArray<Frame>(badChar);
    if (!charResult) {
        ASSERT_EQ(charResult.error().invalidDiscriminant(), Discriminant::u32(0xD800), "surrogate reported");
    } else {
        ASSERT_TRUE(false, "surrogate rejects");
    }

    auto badOpcode = kFrameBytes;
    badOpcode[2] = 0x00;
    badOpcode[3] = 0x02;
    auto opResult = tryFromByteArray<Frame>(badOpcode);
    if (!opResult) {
        ASSERT_EQ(opResult.error().invalidDiscriminant(), Discriminant::u16(0x0002), "opcode read big-endian");
    } else {
        ASSERT_TRUE(false, "undeclared opcode rejects");
    }
}

static void testNestedFallibleStruct() {
    static_assert(StructLayout<Envelope>::fallible, "fallibility propagates outward");
    static_assert(byteSizeOf<Envelope> == 11, "frame + u16");

    Envelope e;
    e.frame = sampleFrame();
    e.checksum = 0xBEEF;
    const auto bytes = intoByteArray(e);
    ASSERT_EQ(bytes[9], std::uint8_t{0xEF}, "checksum low byte first");
    ASSERT_EQ(bytes[10], std::uint8_t{0xBE}, "checksum high byte last");

    auto decoded = tryFromByteArray<Envelope>(bytes);
    ASSERT_TRUE(decoded.has_value(), "nested fallible round trip");
    if (decoded) {
        ASSERT_TRUE(decoded->frame == e.frame, "inner frame restored");
        ASSERT_EQ(decoded->checksum, std::uint16_t{0xBEEF}, "checksum restored");
    }

    auto broken = bytes;
    broken[1] = 0x33;
    auto failed = tryFromByteArray<Envelope>(broken);
    if (!failed) {
        ASSERT_EQ(failed.error().invalidDiscriminant(), Discriminant::u8(0x33), "inner error surfaces unchanged");
    } else {
        ASSERT_TRUE(false, "inner failure rejects the outer struct");
    }
}

static void testMixedTransparentAndChecked() {
    static_assert(StructLayout<Report>::fallible, "one checked field is enough");
    Report r;
    r.counters = Counters{0x0102, 0x0304};
    r.mode = Mode::Standby;
    const ByteArray<5> expected{0x01, 0x02, 0x03, 0x04, 0x01};
    ASSERT_BYTES_EQ(intoByteArray(r), expected, "transparent then checked");

    auto decoded = tryFromByteArray<Report>(expected);
    ASSERT_TRUE(decoded.has_value(), "valid report");
    if (decoded) {
        ASSERT_EQ(decoded->counters.lost, std::uint16_t{0x0304}, "transparent part restored");
        ASSERT_EQ(decoded->mode, Mode::Standby, "checked part restored");
    }
}

static void testArraysOfEnums() {
    using Modes = std::array<Mode, 3>;
    static_assert(byteSizeOf<Modes> == 3, "one byte per element");

    const Modes modes{{Mode::On, Mode::Off, Mode::Standby}};
    ASSERT_BYTES_EQ(intoByteArray(modes), (ByteArray<3>{2, 0, 1}), "array of enums encodes");

    auto ok = tryFromByteArray<Modes>(ByteArray<3>{2, 0, 1});
    ASSERT_TRUE(ok && *ok == modes, "array of enums decodes");

    auto bad = tryFromByteArray<Modes>(ByteArray<3>{2, 9, 8});
    if (!bad) {
        ASSERT_EQ(bad.error().invalidDiscriminant(), Discriminant::u8(9), "first bad element");
    } else {
        ASSERT_TRUE(false, "array with undeclared element rejects");
    }

    using Ops = std::array<Opcode, 2>;
    ASSERT_BYTES_EQ(intoByteArray(Ops{{Opcode::Write, Opcode::Read}}), (ByteArray<4>{0x01, 0x00, 0x00, 0x01}),
                    "elements keep their declared order");
}

int main() {
    testFallibleStructShape();
    testValidFrame();
    testInvalidFieldErrorPassesThrough();
    testNestedFallibleStruct();
    testMixedTransparentAndChecked();
    testArraysOfEnums();
    return wirecast::test::finish("TryTransparent");
}
