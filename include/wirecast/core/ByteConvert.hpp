#pragma once

#include "wirecast/core/ByteArray.hpp"
#include "wirecast/core/Endian.hpp"
#include "wirecast/core/Expected.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>

namespace wirecast::core {

// Error type of conversions that cannot fail. No value of it can be made.
class Infallible {
public:
    explicit Infallible() = delete;
};

inline bool operator==(const Infallible&, const Infallible&) { return true; }
inline bool operator!=(const Infallible&, const Infallible&) { return false; }
inline std::ostream& operator<<(std::ostream& os, const Infallible&) { return os; }

// ============================================================================
// Customisation points
// ============================================================================
// Each is specialised per convertible type. Partial specialisations select on
// the Enable parameter; an explicit full specialisation always wins.
//
//   AssociatedByteArray<T>::type             ByteArray<N> holding T's wire form
//   IntoByteArray<T>::into(const T&)         -> ByteArray
//   FromByteArray<T>::from(const ByteArray&) -> T
//   TryIntoByteArray<T>::tryInto             -> expected<ByteArray, Error>
//   TryFromByteArray<T>::tryFrom             -> expected<T, Error>

template<class T, class Enable = void>
struct AssociatedByteArray {};

template<class T, class Enable = void>
struct IntoByteArray {};

template<class T, class Enable = void>
struct FromByteArray {};

template<class T>
using ByteArrayOf = typename AssociatedByteArray<T>::type;

namespace detail {

template<class T, class = void>
struct HasAssociated : std::false_type {};

template<class T>
struct HasAssociated<T, std::void_t<typename AssociatedByteArray<T>::type>> : std::true_type {};

template<class T, class = void>
struct HasInto : std::false_type {};

template<class T>
struct HasInto<T, std::void_t<decltype(IntoByteArray<T>::into(std::declval<const T&>()))>>
    : std::true_type {};

template<class T, class = void>
struct HasFrom : std::false_type {};

template<class T>
struct HasFrom<T, std::void_t<decltype(FromByteArray<T>::from(std::declval<const ByteArrayOf<T>&>()))>>
    : std::true_type {};

// Every infallible conversion is also a fallible one that never fails.
template<class T, bool = HasInto<T>::value>
struct BlanketTryInto {};

template<class T>
struct BlanketTryInto<T, true> {
    using Error = Infallible;

    static expected<ByteArrayOf<T>, Error> tryInto(const T& value) {
        return IntoByteArray<T>::into(value);
    }
};

template<class T, bool = HasFrom<T>::value>
struct BlanketTryFrom {};

template<class T>
struct BlanketTryFrom<T, true> {
    using Error = Infallible;

    static expected<T, Error> tryFrom(const ByteArrayOf<T>& bytes) {
        return FromByteArray<T>::from(bytes);
    }
};

} // namespace detail

template<class T, class Enable = void>
struct TryIntoByteArray : detail::BlanketTryInto<T> {};

template<class T, class Enable = void>
struct TryFromByteArray : detail::BlanketTryFrom<T> {};

template<class T>
using TryIntoErrorOf = typename TryIntoByteArray<T>::Error;

template<class T>
using TryFromErrorOf = typename TryFromByteArray<T>::Error;

namespace detail {

template<class T, class = void>
struct HasTryInto : std::false_type {};

template<class T>
struct HasTryInto<T, std::void_t<decltype(TryIntoByteArray<T>::tryInto(std::declval<const T&>()))>>
    : std::true_type {};

template<class T, class = void>
struct HasTryFrom : std::false_type {};

template<class T>
struct HasTryFrom<T, std::void_t<decltype(TryFromByteArray<T>::tryFrom(std::declval<const ByteArrayOf<T>&>()))>>
    : std::true_type {};

} // namespace detail

template<class T>
inline constexpr bool hasByteArray = detail::HasAssociated<T>::value;

template<class T>
inline constexpr bool hasIntoByteArray = detail::HasInto<T>::value;

template<class T>
inline constexpr bool hasFromByteArray = detail::HasFrom<T>::value;

template<class T>
inline constexpr bool hasTryIntoByteArray = detail::HasTryInto<T>::value;

template<class T>
inline constexpr bool hasTryFromByteArray = detail::HasTryFrom<T>::value;

template<class T>
inline constexpr std::size_t byteSizeOf = FixedByteBuffer<ByteArrayOf<T>>::size;

// ============================================================================
// Free functions
// ============================================================================

template<class T>
ByteArrayOf<T> intoByteArray(const T& value) {
    static_assert(hasIntoByteArray<T>, "type has no infallible byte-array encoding");
    return IntoByteArray<T>::into(value);
}

template<class T>
T fromByteArray(const ByteArrayOf<T>& bytes) {
    static_assert(hasFromByteArray<T>, "type has no infallible byte-array decoding; use tryFromByteArray");
    return FromByteArray<T>::from(bytes);
}

template<class T>
expected<ByteArrayOf<T>, TryIntoErrorOf<T>> tryIntoByteArray(const T& value) {
    return TryIntoByteArray<T>::tryInto(value);
}

template<class T>
expected<T, TryFromErrorOf<T>> tryFromByteArray(const ByteArrayOf<T>& bytes) {
    return TryFromByteArray<T>::tryFrom(bytes);
}

// ============================================================================
// Primitive numbers: native byte order
// ============================================================================
// Multi-byte numbers in a wire layout must be wrapped in an EndianValue; the
// bare conversion here is the host representation.

template<class T>
struct AssociatedByteArray<T, std::enable_if_t<isEndianConvertible<T>>> {
    using type = ByteArray<sizeof(T)>;
};

template<class T>
struct IntoByteArray<T, std::enable_if_t<isEndianConvertible<T>>> {
    static ByteArray<sizeof(T)> into(T value) { return EndianConvert<T>::toNative(value); }
};

template<class T>
struct FromByteArray<T, std::enable_if_t<isEndianConvertible<T>>> {
    static T from(const ByteArray<sizeof(T)>& bytes) { return EndianConvert<T>::fromNative(bytes); }
};

// ============================================================================
// Endian wrappers: the stored bytes are the wire form
// ============================================================================

template<class T, ByteOrder Order>
struct AssociatedByteArray<EndianValue<T, Order>> {
    using type = typename EndianValue<T, Order>::Bytes;
};

template<class T, ByteOrder Order>
struct IntoByteArray<EndianValue<T, Order>> {
    static typename EndianValue<T, Order>::Bytes into(const EndianValue<T, Order>& value) {
        return value.rawBytes();
    }
};

template<class T, ByteOrder Order>
struct FromByteArray<EndianValue<T, Order>> {
    static EndianValue<T, Order> from(const typename EndianValue<T, Order>::Bytes& bytes) {
        return EndianValue<T, Order>::fromRawBytes(bytes);
    }
};

// ============================================================================
// Arrays: elements back to back
// ============================================================================

namespace detail {

template<class T, std::size_t N, class Bytes, std::size_t... I>
Bytes intoChunks(const std::array<T, N>& values, std::index_sequence<I...>) {
    constexpr std::size_t K = byteSizeOf<T>;
    Bytes out{};
    (writeAt<I * K>(out, IntoByteArray<T>::into(values[I])), ...);
    return out;
}

template<class T, std::size_t N, class Bytes, std::size_t... I>
std::array<T, N> fromChunks(const Bytes& bytes, std::index_sequence<I...>) {
    constexpr std::size_t K = byteSizeOf<T>;
    return {{FromByteArray<T>::from(readAt<I * K, K>(bytes))...}};
}

// Decodes element I into out[I]; on failure records the error and stops the fold.
template<std::size_t I, class T, std::size_t N, class Bytes, class Error>
bool tryChunkInto(const Bytes& bytes, std::array<T, N>& out, std::optional<Error>& failure) {
    constexpr std::size_t K = byteSizeOf<T>;
    auto decoded = TryFromByteArray<T>::tryFrom(readAt<I * K, K>(bytes));
    if (!decoded) {
        failure.emplace(std::move(decoded.error()));
        return false;
    }
    out[I] = std::move(*decoded);
    return true;
}

template<std::size_t I, class T, std::size_t N, class Bytes, class Error>
bool tryChunkOut(const std::array<T, N>& values, Bytes& out, std::optional<Error>& failure) {
    constexpr std::size_t K = byteSizeOf<T>;
    auto encoded = TryIntoByteArray<T>::tryInto(values[I]);
    if (!encoded) {
        failure.emplace(std::move(encoded.error()));
        return false;
    }
    writeAt<I * K>(out, *encoded);
    return true;
}

} // namespace detail

template<class T, std::size_t N>
struct AssociatedByteArray<std::array<T, N>, std::enable_if_t<detail::HasAssociated<T>::value>> {
    using type = ByteArray<N * byteSizeOf<T>>;
};

template<class T, std::size_t N>
struct IntoByteArray<std::array<T, N>, std::enable_if_t<detail::HasInto<T>::value>> {
    static ByteArrayOf<std::array<T, N>> into(const std::array<T, N>& values) {
        return detail::intoChunks<T, N, ByteArrayOf<std::array<T, N>>>(values, std::make_index_sequence<N>{});
    }
};

template<class T, std::size_t N>
struct FromByteArray<std::array<T, N>, std::enable_if_t<detail::HasFrom<T>::value>> {
    static std::array<T, N> from(const ByteArrayOf<std::array<T, N>>& bytes) {
        return detail::fromChunks<T, N>(bytes, std::make_index_sequence<N>{});
    }
};

// Elements that only encode fallibly: the first failing element's error, unchanged.
template<class T, std::size_t N>
struct TryIntoByteArray<std::array<T, N>,
                        std::enable_if_t<!detail::HasInto<T>::value && detail::HasTryInto<T>::value>> {
    using Error = TryIntoErrorOf<T>;
    using Bytes = ByteArrayOf<std::array<T, N>>;

    static expected<Bytes, Error> tryInto(const std::array<T, N>& values) {
        return run(values, std::make_index_sequence<N>{});
    }

private:
    template<std::size_t... I>
    static expected<Bytes, Error> run(const std::array<T, N>& values, std::index_sequence<I...>) {
        Bytes out{};
        std::optional<Error> failure;
        (void)(detail::tryChunkOut<I>(values, out, failure) && ...);
        if (failure) {
            return unexpected(std::move(*failure));
        }
        return out;
    }
};

template<class T, std::size_t N>
struct TryFromByteArray<std::array<T, N>,
                        std::enable_if_t<!detail::HasFrom<T>::value && detail::HasTryFrom<T>::value>> {
    static_assert(std::is_default_constructible_v<T>,
                  "fallibly decoded array elements must be default constructible");

    using Error = TryFromErrorOf<T>;
    using Bytes = ByteArrayOf<std::array<T, N>>;

    static expected<std::array<T, N>, Error> tryFrom(const Bytes& bytes) {
        return run(bytes, std::make_index_sequence<N>{});
    }

private:
    template<std::size_t... I>
    static expected<std::array<T, N>, Error> run(const Bytes& bytes, std::index_sequence<I...>) {
        std::array<T, N> out{};
        std::optional<Error> failure;
        (void)(detail::tryChunkInto<I>(bytes, out, failure) && ...);
        if (failure) {
            return unexpected(std::move(*failure));
        }
        return out;
    }
};

} // namespace wirecast::core
