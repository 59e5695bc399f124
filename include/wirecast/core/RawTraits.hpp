#pragma once

#include <type_traits>
#include <utility>

namespace wirecast::core {

// Relation between a type and its byte-exact companion layout ("raw") type.
//
//   RawTraits<T>::Raw                   the companion type
//   RawTraits<T>::toRaw(const T&)       -> Raw
//   RawTraits<T>::fromRaw(const Raw&)   -> T                    (infallible types)
//   RawTraits<T>::tryFromRaw(const Raw&) -> expected<T, Error>  (fallible types)
//
// Layout schemas, enum schemas, bool and char32_t provide it. A type offers
// either fromRaw or tryFromRaw, never both.
template<class T, class Enable = void>
struct RawTraits {};

template<class T>
using RawOf = typename RawTraits<T>::Raw;

template<class T>
using RawErrorOf = typename RawTraits<T>::Error;

namespace detail {

template<class T, class = void>
struct HasRawType : std::false_type {};

template<class T>
struct HasRawType<T, std::void_t<decltype(RawTraits<T>::fromRaw(std::declval<const RawOf<T>&>()))>>
    : std::true_type {};

template<class T, class = void>
struct TryHasRawType : std::false_type {};

template<class T>
struct TryHasRawType<T, std::void_t<typename RawTraits<T>::Error,
                                    decltype(RawTraits<T>::tryFromRaw(std::declval<const RawOf<T>&>()))>>
    : std::true_type {};

} // namespace detail

template<class T>
inline constexpr bool hasRawType = detail::HasRawType<T>::value;

template<class T>
inline constexpr bool tryHasRawType = detail::TryHasRawType<T>::value;

} // namespace wirecast::core
