#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <type_traits>

namespace wirecast::core {

/**
 * @brief An enum discriminant together with the integer type it was read as.
 *
 * The value is kept losslessly (sign-extended into 64 bits for the signed kinds),
 * so an error message can print exactly what arrived on the wire.
 */
class Discriminant {
public:
    enum class Kind : std::uint8_t { U8, U16, U32, U64, I8, I16, I32, I64 };

    static constexpr Discriminant u8(std::uint8_t v) { return Discriminant(Kind::U8, v); }
    static constexpr Discriminant u16(std::uint16_t v) { return Discriminant(Kind::U16, v); }
    static constexpr Discriminant u32(std::uint32_t v) { return Discriminant(Kind::U32, v); }
    static constexpr Discriminant u64(std::uint64_t v) { return Discriminant(Kind::U64, v); }
    static constexpr Discriminant i8(std::int8_t v) { return signedOf(Kind::I8, v); }
    static constexpr Discriminant i16(std::int16_t v) { return signedOf(Kind::I16, v); }
    static constexpr Discriminant i32(std::int32_t v) { return signedOf(Kind::I32, v); }
    static constexpr Discriminant i64(std::int64_t v) { return signedOf(Kind::I64, v); }

    // Picks the kind from Int's width and signedness.
    template<class Int>
    static constexpr Discriminant of(Int value) {
        static_assert(std::is_integral_v<Int> && !std::is_same_v<Int, bool>,
                      "discriminants are integers");
        static_assert(sizeof(Int) == 1 || sizeof(Int) == 2 || sizeof(Int) == 4 || sizeof(Int) == 8,
                      "discriminants are 8, 16, 32 or 64 bits wide");
        if constexpr (std::is_signed_v<Int>) {
            return signedOf(signedKind(sizeof(Int)), static_cast<std::int64_t>(value));
        } else {
            return Discriminant(unsignedKind(sizeof(Int)), static_cast<std::uint64_t>(value));
        }
    }

    constexpr Kind kind() const { return kind_; }

    constexpr bool isSigned() const {
        return kind_ == Kind::I8 || kind_ == Kind::I16 || kind_ == Kind::I32 || kind_ == Kind::I64;
    }

    constexpr std::uint64_t asUnsigned() const { return bits_; }
    constexpr std::int64_t asSigned() const { return static_cast<std::int64_t>(bits_); }

    // "255u8", "-3i16"
    std::string toString() const;

    friend constexpr bool operator==(const Discriminant& a, const Discriminant& b) {
        return a.kind_ == b.kind_ && a.bits_ == b.bits_;
    }
    friend constexpr bool operator!=(const Discriminant& a, const Discriminant& b) {
        return !(a == b);
    }

private:
    constexpr Discriminant(Kind kind, std::uint64_t bits) : kind_(kind), bits_(bits) {}

    static constexpr Discriminant signedOf(Kind kind, std::int64_t value) {
        return Discriminant(kind, static_cast<std::uint64_t>(value));
    }

    static constexpr Kind unsignedKind(std::size_t width) {
        return width == 1 ? Kind::U8 : width == 2 ? Kind::U16 : width == 4 ? Kind::U32 : Kind::U64;
    }

    static constexpr Kind signedKind(std::size_t width) {
        return width == 1 ? Kind::I8 : width == 2 ? Kind::I16 : width == 4 ? Kind::I32 : Kind::I64;
    }

    Kind kind_;
    std::uint64_t bits_;
};

// "u8", "i32", ...
const char* kindSuffix(Discriminant::Kind kind);

std::ostream& operator<<(std::ostream& os, const Discriminant& d);

/**
 * @brief Raised when a byte pattern does not name a declared variant.
 *
 * Carries the rejected discriminant and the name of the type being decoded.
 * The name must refer to storage that outlives the error (schema names are
 * string literals).
 */
class EnumFromBytesError {
public:
    EnumFromBytesError(Discriminant invalid, std::string_view typeName)
    : invalid_(invalid), typeName_(typeName) {}

    const Discriminant& invalidDiscriminant() const { return invalid_; }
    std::string_view typeName() const { return typeName_; }

    // "Invalid discriminant 255u8 for type Status"
    std::string message() const;

    // EnumFromBytesError { invalidDiscriminant: 255u8, typeName: "Status" }
    std::string describe() const;

    friend bool operator==(const EnumFromBytesError& a, const EnumFromBytesError& b) {
        return a.invalid_ == b.invalid_ && a.typeName_ == b.typeName_;
    }
    friend bool operator!=(const EnumFromBytesError& a, const EnumFromBytesError& b) {
        return !(a == b);
    }

private:
    Discriminant invalid_;
    std::string_view typeName_;
};

std::ostream& operator<<(std::ostream& os, const EnumFromBytesError& error);

} // namespace wirecast::core
