#pragma once

#include "wirecast/core/ByteConvert.hpp"
#include "wirecast/core/Expected.hpp"
#include "wirecast/core/RawTraits.hpp"

#include <type_traits>

namespace wirecast::core {

namespace detail {

// Decoding halves of WIRECAST_BYTEABLE_VIA, picked by the kind of RawTraits<T>.
template<class T, class = void>
struct ViaRawFrom {};

template<class T>
struct ViaRawFrom<T, std::enable_if_t<hasRawType<T>>> {
    static T from(const ByteArrayOf<T>& bytes) {
        return RawTraits<T>::fromRaw(fromByteArray<RawOf<T>>(bytes));
    }
};

template<class T, class = void>
struct ViaRawTryFrom : BlanketTryFrom<T> {};

template<class T>
struct ViaRawTryFrom<T, std::enable_if_t<tryHasRawType<T>>> {
    using Error = RawErrorOf<T>;

    static expected<T, Error> tryFrom(const ByteArrayOf<T>& bytes) {
        return RawTraits<T>::tryFromRaw(fromByteArray<RawOf<T>>(bytes));
    }
};

} // namespace detail

} // namespace wirecast::core

/**
 * @brief Gives Type the conversion trait set of its hand-written raw type.
 *
 * Type needs a RawTraits specialisation whose Raw is itself infallibly
 * byteable. The byte form is the raw type's byte form. Decoding is infallible
 * when RawTraits<Type> has fromRaw and goes through tryFromByteArray with
 * RawTraits<Type>::Error when it has tryFromRaw.
 *
 * Use at global scope, after the RawTraits specialisation:
 *
 *     WIRECAST_BYTEABLE_VIA(Celsius)
 */
#define WIRECAST_BYTEABLE_VIA(Type)                                                        \
    namespace wirecast::core {                                                             \
    template<>                                                                             \
    struct AssociatedByteArray<Type> {                                                     \
        using type = ByteArrayOf<RawOf<Type>>;                                             \
    };                                                                                     \
    template<>                                                                             \
    struct IntoByteArray<Type> {                                                           \
        static ByteArrayOf<Type> into(const Type& value) {                                 \
            return intoByteArray(RawTraits<Type>::toRaw(value));                           \
        }                                                                                  \
    };                                                                                     \
    template<>                                                                             \
    struct FromByteArray<Type> : detail::ViaRawFrom<Type> {};                              \
    template<>                                                                             \
    struct TryFromByteArray<Type> : detail::ViaRawTryFrom<Type> {};                        \
    }
