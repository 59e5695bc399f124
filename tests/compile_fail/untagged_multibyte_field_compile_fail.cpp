#include <cstdint>

#include "wirecast/wirecast.hpp"

// A multi-byte number without littleEndian or bigEndian would leave its byte
// order to the host. Plain fields must be safe to bytecast, so this is rejected.
//
// This is a compile-fail test: it must NOT compile.

namespace {

struct Sample {
    std::uint8_t kind = 0;
    std::uint16_t length = 0;
};

} // namespace

namespace wirecast::layout {

template<>
struct LayoutSchema<Sample> {
    static constexpr auto fields = std::make_tuple(
        field<&Sample::kind>("kind"),
        field<&Sample::length>("length"));
};

} // namespace wirecast::layout

int main() {
    return static_cast<int>(wirecast::intoByteArray(Sample{}).size());
}
