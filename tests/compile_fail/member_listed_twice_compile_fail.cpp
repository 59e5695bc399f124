#include <cstdint>

#include "wirecast/wirecast.hpp"

// Listing the same member twice would write it twice and decode it ambiguously.
//
// This is a compile-fail test: it must NOT compile.

namespace {

struct Sample {
    std::uint8_t a = 0;
    std::uint8_t b = 0;
};

} // namespace

namespace wirecast::layout {

template<>
struct LayoutSchema<Sample> {
    static constexpr auto fields = std::make_tuple(
        field<&Sample::a>("a"),
        field<&Sample::b>("b"),
        field<&Sample::a>("again"));
};

} // namespace wirecast::layout

int main() {
    return static_cast<int>(wirecast::intoByteArray(Sample{}).size());
}
