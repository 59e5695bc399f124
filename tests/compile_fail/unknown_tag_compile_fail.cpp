#include <cstdint>

#include "wirecast/wirecast.hpp"

// A field attribute outside plain / littleEndian / bigEndian / transparent /
// tryTransparent is rejected where the field is declared.
//
// This is a compile-fail test: it must NOT compile.

namespace {

struct Middle {};

struct Sample {
    std::uint16_t value = 0;
};

} // namespace

namespace wirecast::layout {

template<>
struct LayoutSchema<Sample> {
    static constexpr auto fields = std::make_tuple(field<&Sample::value>("value", Middle{}));
};

} // namespace wirecast::layout

int main() {
    return static_cast<int>(wirecast::intoByteArray(Sample{}).size());
}
