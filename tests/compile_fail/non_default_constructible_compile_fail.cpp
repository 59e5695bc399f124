#include <cstdint>

#include "wirecast/wirecast.hpp"

// Decoding builds the value field by field, so the type needs a default constructor.
//
// This is a compile-fail test: it must NOT compile.

namespace {

struct Sample {
    explicit Sample(std::uint8_t v) : value(v) {}
    std::uint8_t value;
};

} // namespace

namespace wirecast::layout {

template<>
struct LayoutSchema<Sample> {
    static constexpr auto fields = std::make_tuple(field<&Sample::value>("value"));
};

} // namespace wirecast::layout

int main() {
    return static_cast<int>(wirecast::intoByteArray(Sample{3}).size());
}
