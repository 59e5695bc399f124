#pragma once

#include "wirecast/core/ByteConvert.hpp"
#include "wirecast/core/Endian.hpp"

#include <array>
#include <cstddef>
#include <cstring>
#include <type_traits>

namespace wirecast::core {

/**
 * @brief Claim that every bit pattern of T's size is a valid T.
 *
 * False unless granted. Granting it wrongly is the one way to produce undefined
 * behaviour through this library, so it is only handed out here for types where
 * the claim is obviously true, and otherwise only through
 * WIRECAST_UNSAFE_VALID_BYTECAST / WIRECAST_UNSAFE_BYTECAST_TRANSMUTE.
 *
 * Never true for bool, char32_t, pointers or unwrapped multi-byte numbers (their
 * byte order would be left to the host).
 */
template<class T, class Enable = void>
struct ValidBytecastMarker : std::false_type {};

template<> struct ValidBytecastMarker<char> : std::true_type {};
template<> struct ValidBytecastMarker<signed char> : std::true_type {};
template<> struct ValidBytecastMarker<unsigned char> : std::true_type {};

template<class T, ByteOrder Order>
struct ValidBytecastMarker<EndianValue<T, Order>> : std::true_type {};

template<class T, std::size_t N>
struct ValidBytecastMarker<std::array<T, N>> : ValidBytecastMarker<T> {};

template<class T>
inline constexpr bool isValidBytecast = ValidBytecastMarker<T>::value;

namespace detail {

template<class T>
struct TransmuteChecks {
    static_assert(std::is_trivially_copyable_v<T>,
                  "bytecast transmute needs a trivially copyable type");
    static_assert(std::has_unique_object_representations_v<T>,
                  "bytecast transmute needs a type without padding bytes");
    static_assert(sizeof(T) > 0, "bytecast transmute needs a non-empty type");
    using type = ByteArray<sizeof(T)>;
};

// Whole-block copy between a value and its bytes. Host representation, so every
// member must already pin its byte order.
template<class T>
struct TransmuteInto {
    static typename TransmuteChecks<T>::type into(const T& value) {
        typename TransmuteChecks<T>::type out{};
        std::memcpy(out.data(), &value, sizeof(T));
        return out;
    }
};

template<class T>
struct TransmuteFrom {
    static T from(const typename TransmuteChecks<T>::type& bytes) {
        T out;
        std::memcpy(&out, bytes.data(), sizeof(T));
        return out;
    }
};

} // namespace detail

} // namespace wirecast::core

// Grants the safety marker to Type. Use at global scope.
#define WIRECAST_UNSAFE_VALID_BYTECAST(Type)                                   \
    namespace wirecast::core {                                                 \
    template<> struct ValidBytecastMarker<Type> : std::true_type {};          \
    }

// Grants the safety marker to Type and converts it by copying its object
// representation. Type must be trivially copyable and free of padding, and each
// of its members must itself be safe to bytecast. Use at global scope.
#define WIRECAST_UNSAFE_BYTECAST_TRANSMUTE(Type)                               \
    WIRECAST_UNSAFE_VALID_BYTECAST(Type)                                       \
    namespace wirecast::core {                                                 \
    template<> struct AssociatedByteArray<Type> {                              \
        using type = typename detail::TransmuteChecks<Type>::type;             \
    };                                                                         \
    template<> struct IntoByteArray<Type> : detail::TransmuteInto<Type> {};    \
    template<> struct FromByteArray<Type> : detail::TransmuteFrom<Type> {};    \
    }
