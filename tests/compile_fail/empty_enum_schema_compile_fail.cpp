#include <cstdint>
#include <string_view>

#include "wirecast/wirecast.hpp"

// An enum schema with no variants could never decode anything.
//
// This is a compile-fail test: it must NOT compile.

namespace {

enum class Mode : std::uint8_t { Off = 0 };

} // namespace

namespace wirecast::layout {

template<>
struct EnumSchema<Mode> {
    static constexpr std::string_view name = "Mode";
    static constexpr auto variants = std::make_tuple();
};

} // namespace wirecast::layout

int main() {
    return static_cast<int>(wirecast::intoByteArray(Mode::Off)[0]);
}
