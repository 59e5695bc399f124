#include "wirecast/io/StreamIO.hpp"
#include "wirecast/wirecast.hpp"
#include "TestSupport.hpp"

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

enum class Mode : std::uint8_t { Off = 0, On = 1 };

struct Sample {
    std::uint16_t channel = 0;
    Mode mode = Mode::Off;
};

} // namespace

namespace wirecast::layout {

template<>
struct EnumSchema<Mode> {
    static constexpr std::string_view name = "Mode";
    static constexpr auto variants = std::make_tuple(enumerator<Mode::Off>("Off"), enumerator<Mode::On>("On"));
};

template<>
struct LayoutSchema<Sample> {
    static constexpr auto fields = std::make_tuple(
        field<&Sample::channel>("channel", bigEndian),
        field<&Sample::mode>("mode", tryTransparent));
};

} // namespace wirecast::layout

using namespace wirecast;
using io::IoErrc;

// Collects error-sink output for the lifetime of the object.
class ErrorCapture {
public:
    ErrorCapture() {
        log::setErrorLogHandler([this](std::string_view message) { lines_.emplace_back(message); });
    }
    ~ErrorCapture() { log::setErrorLogHandler(nullptr); }

    bool sawText(const char* needle) const {
        for (const auto& line : lines_) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    std::vector<std::string> lines_;
};

static void testRoundTripThroughStream() {
    std::stringstream stream;
    auto written = io::writeByteable(stream, BigEndian<std::uint32_t>(0xCAFEBABE));
    ASSERT_TRUE(written.has_value(), "write succeeds");
    auto second = io::writeByteable(stream, std::uint8_t{0x42});
    ASSERT_TRUE(second.has_value(), "second write succeeds");
    ASSERT_EQ(stream.str().size(), std::size_t{5}, "exactly the byte sizes were written");

    auto first = io::readByteable<BigEndian<std::uint32_t>>(stream);
    ASSERT_TRUE(first.has_value() && first->get() == 0xCAFEBABE, "first value read back");
    auto next = io::readByteable<std::uint8_t>(stream);
    ASSERT_TRUE(next.has_value() && *next == 0x42, "reads continue where the last one stopped");
}

static void testShortRead() {
    ErrorCapture capture;
    std::stringstream stream(std::string("\x01\x02", 2));
    auto result = io::readByteable<std::uint32_t>(stream);
    ASSERT_TRUE(!result.has_value(), "short input is an error");
    if (!result) {
        ASSERT_TRUE(result.error() == IoErrc::UnexpectedEof, "unexpected end of stream");
        ASSERT_EQ(std::string(result.error().category().name()), std::string("wirecast.io"), "error category");
    }
    ASSERT_TRUE(capture.sawText("short read"), "short read is logged");
}

static void testWriteFailure() {
    ErrorCapture capture;
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    auto result = io::writeByteable(out, LittleEndian<std::uint16_t>(1));
    ASSERT_TRUE(!result.has_value(), "write to a bad stream fails");
    if (!result) {
        ASSERT_TRUE(result.error() == IoErrc::StreamFailure, "stream failure");
    }
}

static void testTryReadSeparatesFailures() {
    std::stringstream good;
    auto written = io::writeTryByteable(good, Sample{0x0102, Mode::On});
    ASSERT_TRUE(written.has_value(), "fallible write of a valid value");
    ASSERT_EQ(good.str(), std::string("\x01\x02\x01", 3), "written bytes");

    auto decoded = io::readTryByteable<Sample>(good);
    ASSERT_TRUE(decoded.has_value(), "valid bytes decode");
    if (decoded) {
        ASSERT_EQ(decoded->channel, std::uint16_t{0x0102}, "channel");
        ASSERT_EQ(decoded->mode, Mode::On, "mode");
    }

    std::stringstream invalid(std::string("\x00\x05\x07", 3));
    auto conversion = io::readTryByteable<Sample>(invalid);
    ASSERT_TRUE(!conversion.has_value(), "invalid bytes rejected");
    if (!conversion) {
        ASSERT_TRUE(conversion.error().isConversion(), "classified as a conversion error");
        ASSERT_EQ(conversion.error().conversionError().invalidDiscriminant(), core::Discriminant::u8(7),
                  "conversion error kept as is");
        std::ostringstream text;
        text << conversion.error();
        ASSERT_EQ(text.str(), std::string("Conversion error: Invalid discriminant 7u8 for type Mode"),
                  "conversion error text");
    }

    ErrorCapture capture;
    std::stringstream empty;
    auto ioFailure = io::readTryByteable<Sample>(empty);
    ASSERT_TRUE(!ioFailure.has_value(), "empty stream rejected");
    if (!ioFailure) {
        ASSERT_TRUE(ioFailure.error().isIo(), "classified as an I/O error");
        ASSERT_TRUE(ioFailure.error().ioError() == IoErrc::UnexpectedEof, "end of stream");
        std::ostringstream text;
        text << ioFailure.error();
        ASSERT_EQ(text.str().rfind("I/O error: ", 0), std::size_t{0}, "I/O error text");
    }
}

static void testTryReadOfInfallibleType() {
    std::stringstream stream(std::string("\x00\x10", 2));
    auto value = io::readTryByteable<BigEndian<std::uint16_t>>(stream);
    static_assert(std::is_same_v<decltype(value)::error_type, io::TryByteableError<core::Infallible>>,
                  "infallible types read through the never type");
    ASSERT_TRUE(value.has_value() && value->get() == 0x0010, "fallible read of an infallible type");
}

int main() {
    testRoundTripThroughStream();
    testShortRead();
    testWriteFailure();
    testTryReadSeparatesFailures();
    testTryReadOfInfallibleType();
    return test::finish("StreamIO");
}
