#pragma once

#include "wirecast/core/ByteArray.hpp"
#include "wirecast/core/Config.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <limits>
#include <ostream>
#include <type_traits>

namespace wirecast::core {

enum class ByteOrder { Little, Big };

inline constexpr ByteOrder nativeByteOrder =
    config::NATIVE_LITTLE_ENDIAN ? ByteOrder::Little : ByteOrder::Big;

#if WIRECAST_HAS_INT128
__extension__ typedef __int128 Int128;
__extension__ typedef unsigned __int128 UInt128;
#endif

namespace detail {

template<std::size_t Size> struct UnsignedOfSize;
template<> struct UnsignedOfSize<1> { using type = std::uint8_t; };
template<> struct UnsignedOfSize<2> { using type = std::uint16_t; };
template<> struct UnsignedOfSize<4> { using type = std::uint32_t; };
template<> struct UnsignedOfSize<8> { using type = std::uint64_t; };
#if WIRECAST_HAS_INT128
template<> struct UnsignedOfSize<16> { using type = UInt128; };
#endif

template<class T>
struct IsInt128 : std::false_type {};
#if WIRECAST_HAS_INT128
template<> struct IsInt128<Int128> : std::true_type {};
template<> struct IsInt128<UInt128> : std::true_type {};
#endif

// Character types carry meaning beyond their bits (char32_t is validated
// separately), bool has two legal patterns only.
template<class T>
struct IsPlainInteger
    : std::bool_constant<(std::is_integral_v<T> &&
                          !std::is_same_v<T, bool> &&
                          !std::is_same_v<T, wchar_t> &&
                          !std::is_same_v<T, char16_t> &&
                          !std::is_same_v<T, char32_t>) ||
                         IsInt128<T>::value> {};

template<class T>
struct IsEndianConvertible
    : std::bool_constant<IsPlainInteger<T>::value ||
                         std::is_same_v<T, float> ||
                         std::is_same_v<T, double>> {};

} // namespace detail

template<class T>
inline constexpr bool isEndianConvertible = detail::IsEndianConvertible<T>::value;

/**
 * @brief Byte-order conversions for one numeric type.
 *
 * Values are split into bytes by shifting an unsigned carrier of the same width,
 * so the result does not depend on the host order. Floating-point values travel
 * as their IEEE-754 bit pattern.
 */
template<class T>
struct EndianConvert {
    static_assert(detail::IsEndianConvertible<T>::value,
                  "EndianConvert supports integer and floating-point numbers only");
    static_assert(!std::is_floating_point_v<T> || std::numeric_limits<T>::is_iec559,
                  "floating-point byte order needs IEEE-754 types");

    using Bytes = ByteArray<sizeof(T)>;
    using Bits = typename detail::UnsignedOfSize<sizeof(T)>::type;

    template<ByteOrder Order>
    static Bytes to(T value) {
        const Bits bits = toBits(value);
        Bytes out{};
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            out[i] = static_cast<std::uint8_t>((bits >> shiftFor<Order>(i)) & 0xFFu);
        }
        return out;
    }

    template<ByteOrder Order>
    static T from(const Bytes& bytes) {
        Bits bits = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            bits = static_cast<Bits>(bits | static_cast<Bits>(static_cast<Bits>(bytes[i]) << shiftFor<Order>(i)));
        }
        return fromBits(bits);
    }

    static Bytes toLittle(T value) { return to<ByteOrder::Little>(value); }
    static Bytes toBig(T value) { return to<ByteOrder::Big>(value); }
    static Bytes toNative(T value) { return to<nativeByteOrder>(value); }

    static T fromLittle(const Bytes& bytes) { return from<ByteOrder::Little>(bytes); }
    static T fromBig(const Bytes& bytes) { return from<ByteOrder::Big>(bytes); }
    static T fromNative(const Bytes& bytes) { return from<nativeByteOrder>(bytes); }

private:
    template<ByteOrder Order>
    static constexpr unsigned shiftFor(std::size_t index) {
        return static_cast<unsigned>(8 * (Order == ByteOrder::Little ? index : sizeof(T) - 1 - index));
    }

    static Bits toBits(T value) {
        Bits bits;
        std::memcpy(&bits, &value, sizeof(T));
        return bits;
    }

    static T fromBits(Bits bits) {
        T value;
        std::memcpy(&value, &bits, sizeof(T));
        return value;
    }
};

/**
 * @brief A number stored pre-converted to a declared byte order.
 *
 * Holds only the encoded bytes of T, never T itself, so every bit pattern of
 * the right size is a valid instance. get() converts back to the native value;
 * rawBytes() exposes the stored bytes untouched.
 *
 * Comparison, ordering and hashing work on get(), so a little-endian and a
 * big-endian wrapper of the same number compare equal.
 */
template<class T, ByteOrder Order>
class EndianValue {
public:
    static_assert(detail::IsEndianConvertible<T>::value,
                  "endian wrappers hold integer or floating-point numbers only");

    using value_type = T;
    using Bytes = ByteArray<sizeof(T)>;
    static constexpr ByteOrder order = Order;

    EndianValue() = default;

    explicit EndianValue(T value)
    : bytes_(EndianConvert<T>::template to<Order>(value)) {}

    static EndianValue fromRawBytes(const Bytes& bytes) {
        EndianValue out;
        out.bytes_ = bytes;
        return out;
    }

    T get() const { return EndianConvert<T>::template from<Order>(bytes_); }

    Bytes rawBytes() const { return bytes_; }

private:
    Bytes bytes_{};
};

template<class T>
using LittleEndian = EndianValue<T, ByteOrder::Little>;

template<class T>
using BigEndian = EndianValue<T, ByteOrder::Big>;

template<class T>
using NativeEndian = EndianValue<T, nativeByteOrder>;

template<class T, ByteOrder A, ByteOrder B>
bool operator==(const EndianValue<T, A>& lhs, const EndianValue<T, B>& rhs) {
    return lhs.get() == rhs.get();
}

template<class T, ByteOrder A, ByteOrder B>
bool operator!=(const EndianValue<T, A>& lhs, const EndianValue<T, B>& rhs) {
    return lhs.get() != rhs.get();
}

template<class T, ByteOrder A, ByteOrder B>
bool operator<(const EndianValue<T, A>& lhs, const EndianValue<T, B>& rhs) {
    return lhs.get() < rhs.get();
}

template<class T, ByteOrder A, ByteOrder B>
bool operator<=(const EndianValue<T, A>& lhs, const EndianValue<T, B>& rhs) {
    return lhs.get() <= rhs.get();
}

template<class T, ByteOrder A, ByteOrder B>
bool operator>(const EndianValue<T, A>& lhs, const EndianValue<T, B>& rhs) {
    return lhs.get() > rhs.get();
}

template<class T, ByteOrder A, ByteOrder B>
bool operator>=(const EndianValue<T, A>& lhs, const EndianValue<T, B>& rhs) {
    return lhs.get() >= rhs.get();
}

#if WIRECAST_HAS_INT128
namespace detail {

// Strict ISO mode ships no stream or hash support for the 128-bit integers.
template<class T>
void writeInt128(std::ostream& os, T value) {
    char digits[41];
    char* end = digits + sizeof(digits);
    char* p = end;
    UInt128 magnitude = static_cast<UInt128>(value);
    bool negative = false;
    if constexpr (std::is_same_v<T, Int128>) {
        if (value < 0) {
            negative = true;
            magnitude = ~magnitude + 1;
        }
    }
    do {
        *--p = static_cast<char>('0' + static_cast<int>(magnitude % 10));
        magnitude /= 10;
    } while (magnitude != 0);
    if (negative) {
        *--p = '-';
    }
    os.write(p, end - p);
}

inline std::size_t hashInt128(UInt128 value) noexcept {
    const std::size_t low = std::hash<std::uint64_t>{}(static_cast<std::uint64_t>(value));
    const std::size_t high = std::hash<std::uint64_t>{}(static_cast<std::uint64_t>(value >> 64));
    return low ^ (high + 0x9e3779b97f4a7c15ull + (low << 6) + (low >> 2));
}

} // namespace detail
#endif

template<class T, ByteOrder Order>
std::ostream& operator<<(std::ostream& os, const EndianValue<T, Order>& value) {
    os << (Order == ByteOrder::Little ? "LittleEndian(" : "BigEndian(");
    if constexpr (sizeof(T) == 1) {
        os << +value.get();
#if WIRECAST_HAS_INT128
    } else if constexpr (detail::IsInt128<T>::value) {
        detail::writeInt128(os, value.get());
#endif
    } else {
        os << value.get();
    }
    return os << ')';
}

} // namespace wirecast::core

namespace std {

template<class T, wirecast::core::ByteOrder Order>
struct hash<wirecast::core::EndianValue<T, Order>> {
    std::size_t operator()(const wirecast::core::EndianValue<T, Order>& value) const noexcept {
#if WIRECAST_HAS_INT128
        if constexpr (wirecast::core::detail::IsInt128<T>::value) {
            return wirecast::core::detail::hashInt128(static_cast<wirecast::core::UInt128>(value.get()));
        } else
#endif
        {
            return std::hash<T>{}(value.get());
        }
    }
};

} // namespace std
