#pragma once

#include "wirecast/core/ByteConvert.hpp"
#include "wirecast/core/Endian.hpp"
#include "wirecast/core/Expected.hpp"
#include "wirecast/core/RawTraits.hpp"
#include "wirecast/core/ValidBytecast.hpp"
#include "wirecast/layout/RawLayout.hpp"
#include "wirecast/layout/Schema.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace wirecast::layout {

namespace detail {

template<class>
inline constexpr bool alwaysFalse = false;

// ============================================================================
// Field rules: how one schema entry maps onto its raw slot
// ============================================================================
// Each rule names the raw slot type and the conversions between the member and
// that slot. Fallible rules expose tryFromRaw and an Error type.

template<class Tag, class M, class Enable = void>
struct FieldRule {
    static_assert(alwaysFalse<Tag>,
                  "unknown field attribute: expected plain, littleEndian, bigEndian, transparent or tryTransparent");
};

template<class M>
struct FieldRule<PlainTag, M> {
    static_assert(core::isValidBytecast<M>,
                  "plain field is not safe to bytecast: multi-byte numbers need littleEndian or bigEndian, "
                  "nested layouts need transparent or tryTransparent");

    using Raw = M;
    using Error = core::Infallible;
    static constexpr bool fallible = false;

    static const M& toRaw(const M& value) { return value; }
    static const M& fromRaw(const Raw& raw) { return raw; }
};

template<core::ByteOrder Order, class M, class Enable = void>
struct EndianFieldRule {
    static_assert(alwaysFalse<M>, "littleEndian and bigEndian apply to numbers and arrays of numbers only");
};

template<core::ByteOrder Order, class M>
struct EndianFieldRule<Order, M, std::enable_if_t<core::isEndianConvertible<M>>> {
    using Raw = core::EndianValue<M, Order>;
    using Error = core::Infallible;
    static constexpr bool fallible = false;

    static Raw toRaw(M value) { return Raw(value); }
    static M fromRaw(const Raw& raw) { return raw.get(); }
};

template<core::ByteOrder Order, class E, std::size_t N>
struct EndianFieldRule<Order, std::array<E, N>, std::enable_if_t<core::isEndianConvertible<E>>> {
    using Raw = std::array<core::EndianValue<E, Order>, N>;
    using Error = core::Infallible;
    static constexpr bool fallible = false;

    static Raw toRaw(const std::array<E, N>& values) {
        Raw out{};
        for (std::size_t i = 0; i < N; ++i) {
            out[i] = core::EndianValue<E, Order>(values[i]);
        }
        return out;
    }

    static std::array<E, N> fromRaw(const Raw& raw) {
        std::array<E, N> out{};
        for (std::size_t i = 0; i < N; ++i) {
            out[i] = raw[i].get();
        }
        return out;
    }
};

template<class M>
struct FieldRule<LittleEndianTag, M> : EndianFieldRule<core::ByteOrder::Little, M> {};

template<class M>
struct FieldRule<BigEndianTag, M> : EndianFieldRule<core::ByteOrder::Big, M> {};

template<class M>
struct FieldRule<TransparentTag, M> {
    static_assert(!core::tryHasRawType<M>,
                  "transparent field decodes fallibly; mark it tryTransparent");
    static_assert(core::hasRawType<M>,
                  "transparent field type has no layout of its own");

    using Raw = core::RawOf<M>;
    using Error = core::Infallible;
    static constexpr bool fallible = false;

    static Raw toRaw(const M& value) { return core::RawTraits<M>::toRaw(value); }
    static M fromRaw(const Raw& raw) { return core::RawTraits<M>::fromRaw(raw); }
};

template<class M>
struct FieldRule<TryTransparentTag, M> {
    static_assert(core::tryHasRawType<M>,
                  "tryTransparent field type never fails to decode; mark it transparent");

    using Raw = core::RawOf<M>;
    using Error = core::RawErrorOf<M>;
    static constexpr bool fallible = true;

    static Raw toRaw(const M& value) { return core::RawTraits<M>::toRaw(value); }
    static expected<M, Error> tryFromRaw(const Raw& raw) { return core::RawTraits<M>::tryFromRaw(raw); }
};

// ============================================================================
// Schema binding
// ============================================================================

template<class T, class = void>
struct HasFieldList : std::false_type {};

template<class T>
struct HasFieldList<T, std::void_t<decltype(LayoutSchema<T>::fields)>> : std::true_type {};

template<class T>
using FieldList = std::decay_t<decltype(LayoutSchema<T>::fields)>;

template<class T, class Spec>
struct BoundField {
    static_assert(Spec::template belongsTo<T>, "schema field belongs to another type");

    using Member = typename Spec::template MemberType<T>;
    using Rule = FieldRule<typename Spec::TagType, Member>;
};

template<class... Ts>
struct AllDistinct : std::true_type {};

template<class T, class... Rest>
struct AllDistinct<T, Rest...>
    : std::bool_constant<!(std::is_same_v<T, Rest> || ...) && AllDistinct<Rest...>::value> {};

template<class... Rules>
struct FirstFallibleError {
    using type = core::Infallible;
};

template<class R, class... Rest>
struct FirstFallibleError<R, Rest...> {
    using type = std::conditional_t<R::fallible, typename R::Error, typename FirstFallibleError<Rest...>::type>;
};

template<class T, class List>
struct SchemaBinding {
    static_assert(alwaysFalse<List>, "LayoutSchema<T>::fields must be a std::tuple of field<> or element<> entries");
};

template<class T, class... Specs>
struct SchemaBinding<T, std::tuple<Specs...>> {
    static_assert(AllDistinct<typename Specs::Slot...>::value, "a member is listed twice in the schema");

    using Raw = RawLayout<typename BoundField<T, Specs>::Rule::Raw...>;
    using Error = typename FirstFallibleError<typename BoundField<T, Specs>::Rule...>::type;

    static constexpr bool fallible = (false || ... || BoundField<T, Specs>::Rule::fallible);
    static constexpr bool sameError =
        ((!BoundField<T, Specs>::Rule::fallible ||
          std::is_same_v<typename BoundField<T, Specs>::Rule::Error, Error>) && ...);
};

} // namespace detail

/**
 * @brief Generated layout of a struct described by LayoutSchema<T>.
 *
 * Raw is the byte-exact companion type: one slot per schema entry, in declared
 * order. toRaw/fromRaw are inverse. When any entry is tryTransparent the
 * schema only decodes through tryFromRaw, and the first failing entry's error
 * is returned as is.
 */
template<class T>
class StructLayout {
    static_assert(hasLayoutSchema<T>, "type has no LayoutSchema specialisation");
    static_assert(detail::HasFieldList<T>::value,
                  "LayoutSchema must declare static constexpr auto fields = std::make_tuple(...)");
    static_assert(std::is_default_constructible_v<T>,
                  "types with a layout schema must be default constructible");

    using Binding = detail::SchemaBinding<T, detail::FieldList<T>>;
    static_assert(Binding::sameError, "tryTransparent fields must share one error type");

public:
    using Raw = typename Binding::Raw;
    using Error = typename Binding::Error;

    static_assert(core::isValidBytecast<Raw>, "generated layout has a field that is not safe to bytecast");

    static constexpr bool fallible = Binding::fallible;
    static constexpr std::size_t fieldCount = Raw::fieldCount;
    static constexpr std::size_t byteSize = Raw::byteSize;
    static constexpr std::array<std::size_t, Raw::fieldCount> fieldOffsets = Raw::offsets;

    static constexpr std::array<std::string_view, Raw::fieldCount> fieldNames() {
        return std::apply(
            [](const auto&... spec) { return std::array<std::string_view, sizeof...(spec)>{{spec.name...}}; },
            LayoutSchema<T>::fields);
    }

    static std::string_view fieldName(std::size_t index) {
        return index < fieldCount ? fieldNames()[index] : std::string_view{};
    }

    static Raw toRaw(const T& value) { return toRaw(value, std::make_index_sequence<fieldCount>{}); }

    static T fromRaw(const Raw& raw) {
        static_assert(!fallible, "schema has tryTransparent fields; decode with tryFromRaw");
        return fromRaw(raw, std::make_index_sequence<fieldCount>{});
    }

    static expected<T, Error> tryFromRaw(const Raw& raw) {
        return tryFromRaw(raw, std::make_index_sequence<fieldCount>{});
    }

private:
    template<std::size_t I>
    using SpecAt = std::tuple_element_t<I, detail::FieldList<T>>;

    template<std::size_t I>
    using RuleAt = typename detail::BoundField<T, SpecAt<I>>::Rule;

    template<std::size_t... I>
    static Raw toRaw(const T& value, std::index_sequence<I...>) {
        (void)value;
        return Raw(typename Raw::Tuple(RuleAt<I>::toRaw(SpecAt<I>::get(value))...));
    }

    template<std::size_t... I>
    static T fromRaw(const Raw& raw, std::index_sequence<I...>) {
        (void)raw;
        T out{};
        ((SpecAt<I>::get(out) = RuleAt<I>::fromRaw(raw.template get<I>())), ...);
        return out;
    }

    template<std::size_t I>
    static bool assignField(const Raw& raw, T& out, std::optional<Error>& failure) {
        if constexpr (RuleAt<I>::fallible) {
            auto decoded = RuleAt<I>::tryFromRaw(raw.template get<I>());
            if (!decoded) {
                failure.emplace(std::move(decoded.error()));
                return false;
            }
            SpecAt<I>::get(out) = std::move(*decoded);
        } else {
            SpecAt<I>::get(out) = RuleAt<I>::fromRaw(raw.template get<I>());
        }
        return true;
    }

    template<std::size_t... I>
    static expected<T, Error> tryFromRaw(const Raw& raw, std::index_sequence<I...>) {
        T out{};
        std::optional<Error> failure;
        (void)(assignField<I>(raw, out, failure) && ...);
        if (failure) {
            return unexpected(std::move(*failure));
        }
        return out;
    }
};

template<class T>
struct LayoutIsFallible : std::bool_constant<StructLayout<T>::fallible> {};

} // namespace wirecast::layout

// ============================================================================
// Conversion trait set for types with a layout schema
// ============================================================================

namespace wirecast::core {

template<class T>
struct RawTraits<T, std::enable_if_t<std::conjunction_v<layout::HasLayoutSchema<T>,
                                                        std::negation<layout::LayoutIsFallible<T>>>>> {
    using Raw = typename layout::StructLayout<T>::Raw;

    static Raw toRaw(const T& value) { return layout::StructLayout<T>::toRaw(value); }
    static T fromRaw(const Raw& raw) { return layout::StructLayout<T>::fromRaw(raw); }
};

template<class T>
struct RawTraits<T, std::enable_if_t<std::conjunction_v<layout::HasLayoutSchema<T>,
                                                        layout::LayoutIsFallible<T>>>> {
    using Raw = typename layout::StructLayout<T>::Raw;
    using Error = typename layout::StructLayout<T>::Error;

    static Raw toRaw(const T& value) { return layout::StructLayout<T>::toRaw(value); }
    static expected<T, Error> tryFromRaw(const Raw& raw) { return layout::StructLayout<T>::tryFromRaw(raw); }
};

template<class T>
struct AssociatedByteArray<T, std::enable_if_t<layout::hasLayoutSchema<T>>> {
    using type = typename layout::StructLayout<T>::Raw::Bytes;
};

template<class T>
struct IntoByteArray<T, std::enable_if_t<layout::hasLayoutSchema<T>>> {
    static ByteArrayOf<T> into(const T& value) { return layout::StructLayout<T>::toRaw(value).toBytes(); }
};

template<class T>
struct FromByteArray<T, std::enable_if_t<std::conjunction_v<layout::HasLayoutSchema<T>,
                                                            std::negation<layout::LayoutIsFallible<T>>>>> {
    static T from(const ByteArrayOf<T>& bytes) {
        return layout::StructLayout<T>::fromRaw(layout::StructLayout<T>::Raw::fromBytes(bytes));
    }
};

template<class T>
struct TryFromByteArray<T, std::enable_if_t<std::conjunction_v<layout::HasLayoutSchema<T>,
                                                               layout::LayoutIsFallible<T>>>> {
    using Error = typename layout::StructLayout<T>::Error;

    static expected<T, Error> tryFrom(const ByteArrayOf<T>& bytes) {
        return layout::StructLayout<T>::tryFromRaw(layout::StructLayout<T>::Raw::fromBytes(bytes));
    }
};

} // namespace wirecast::core
