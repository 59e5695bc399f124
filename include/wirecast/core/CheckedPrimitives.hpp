#pragma once

#include "wirecast/core/ByteConvert.hpp"
#include "wirecast/core/Discriminant.hpp"
#include "wirecast/core/Endian.hpp"
#include "wirecast/core/Expected.hpp"
#include "wirecast/core/RawTraits.hpp"
#include "wirecast/core/ValidBytecast.hpp"

#include <cstdint>

// bool and char32_t have bit patterns that are not values, so they encode
// infallibly and decode fallibly. Their raw companions hold the bare bytes and
// are safe to bytecast.

namespace wirecast::core {

// 0x00 false, 0x01 true, anything else rejected on decode.
struct BoolRaw {
    std::uint8_t value = 0;
};

// Code point as a little-endian u32.
struct CharRaw {
    LittleEndian<std::uint32_t> value;
};

inline bool operator==(const BoolRaw& a, const BoolRaw& b) { return a.value == b.value; }
inline bool operator!=(const BoolRaw& a, const BoolRaw& b) { return !(a == b); }
inline bool operator==(const CharRaw& a, const CharRaw& b) { return a.value == b.value; }
inline bool operator!=(const CharRaw& a, const CharRaw& b) { return !(a == b); }

constexpr bool isValidCodePoint(std::uint32_t cp) {
    return cp <= 0x10FFFFu && !(cp >= 0xD800u && cp <= 0xDFFFu);
}

template<> struct ValidBytecastMarker<BoolRaw> : std::true_type {};
template<> struct ValidBytecastMarker<CharRaw> : std::true_type {};

template<>
struct AssociatedByteArray<BoolRaw> {
    using type = ByteArray<1>;
};

template<>
struct IntoByteArray<BoolRaw> {
    static ByteArray<1> into(const BoolRaw& raw) { return {raw.value}; }
};

template<>
struct FromByteArray<BoolRaw> {
    static BoolRaw from(const ByteArray<1>& bytes) { return BoolRaw{bytes[0]}; }
};

template<>
struct AssociatedByteArray<CharRaw> {
    using type = ByteArray<4>;
};

template<>
struct IntoByteArray<CharRaw> {
    static ByteArray<4> into(const CharRaw& raw) { return raw.value.rawBytes(); }
};

template<>
struct FromByteArray<CharRaw> {
    static CharRaw from(const ByteArray<4>& bytes) {
        return CharRaw{LittleEndian<std::uint32_t>::fromRawBytes(bytes)};
    }
};

template<>
struct RawTraits<bool> {
    using Raw = BoolRaw;
    using Error = EnumFromBytesError;

    static BoolRaw toRaw(bool value) { return BoolRaw{static_cast<std::uint8_t>(value ? 1 : 0)}; }

    static expected<bool, Error> tryFromRaw(const BoolRaw& raw) {
        switch (raw.value) {
            case 0: return false;
            case 1: return true;
            default: return unexpected(Error(Discriminant::u8(raw.value), "bool"));
        }
    }
};

template<>
struct RawTraits<char32_t> {
    using Raw = CharRaw;
    using Error = EnumFromBytesError;

    static CharRaw toRaw(char32_t value) {
        return CharRaw{LittleEndian<std::uint32_t>(static_cast<std::uint32_t>(value))};
    }

    static expected<char32_t, Error> tryFromRaw(const CharRaw& raw) {
        const std::uint32_t cp = raw.value.get();
        if (!isValidCodePoint(cp)) {
            return unexpected(Error(Discriminant::u32(cp), "char32_t"));
        }
        return static_cast<char32_t>(cp);
    }
};

template<>
struct AssociatedByteArray<bool> {
    using type = ByteArray<1>;
};

template<>
struct IntoByteArray<bool> {
    static ByteArray<1> into(bool value) {
        return IntoByteArray<BoolRaw>::into(RawTraits<bool>::toRaw(value));
    }
};

template<>
struct TryFromByteArray<bool> {
    using Error = EnumFromBytesError;

    static expected<bool, Error> tryFrom(const ByteArray<1>& bytes) {
        return RawTraits<bool>::tryFromRaw(FromByteArray<BoolRaw>::from(bytes));
    }
};

template<>
struct AssociatedByteArray<char32_t> {
    using type = ByteArray<4>;
};

template<>
struct IntoByteArray<char32_t> {
    static ByteArray<4> into(char32_t value) {
        return IntoByteArray<CharRaw>::into(RawTraits<char32_t>::toRaw(value));
    }
};

template<>
struct TryFromByteArray<char32_t> {
    using Error = EnumFromBytesError;

    static expected<char32_t, Error> tryFrom(const ByteArray<4>& bytes) {
        return RawTraits<char32_t>::tryFromRaw(FromByteArray<CharRaw>::from(bytes));
    }
};

} // namespace wirecast::core
