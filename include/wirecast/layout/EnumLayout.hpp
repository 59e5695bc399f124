#pragma once

#include "wirecast/core/ByteConvert.hpp"
#include "wirecast/core/Config.hpp"
#include "wirecast/core/Discriminant.hpp"
#include "wirecast/core/Endian.hpp"
#include "wirecast/core/Expected.hpp"
#include "wirecast/core/RawTraits.hpp"
#include "wirecast/core/ValidBytecast.hpp"
#include "wirecast/layout/Schema.hpp"

#include <array>
#include <cassert>
#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace wirecast::layout {

namespace detail {

template<class E, class = void>
struct HasVariantList : std::false_type {};

template<class E>
struct HasVariantList<E, std::void_t<decltype(EnumSchema<E>::variants)>> : std::true_type {};

template<class E, class = void>
struct HasEnumName : std::false_type {};

template<class E>
struct HasEnumName<E, std::enable_if_t<std::is_convertible_v<decltype(EnumSchema<E>::name), std::string_view>>>
    : std::true_type {};

template<class E, class = void>
struct HasDeclaredOrder : std::false_type {};

template<class E>
struct HasDeclaredOrder<E, std::enable_if_t<std::is_same_v<std::decay_t<decltype(EnumSchema<E>::order)>,
                                                           core::ByteOrder>>>
    : std::true_type {};

template<class Spec, class E>
struct IsVariantOf : std::false_type {};

template<auto Value, class E>
struct IsVariantOf<EnumeratorSpec<Value>, E> : std::is_same<decltype(Value), E> {};

template<class E, class List>
struct VariantListOf : std::false_type {};

template<class E, class... Specs>
struct VariantListOf<E, std::tuple<Specs...>> : std::conjunction<IsVariantOf<Specs, E>...> {};

template<class E, class Repr>
constexpr core::ByteOrder enumByteOrder() {
    if constexpr (HasDeclaredOrder<E>::value) {
        return EnumSchema<E>::order;
    } else {
        static_assert(!core::config::REQUIRE_EXPLICIT_ENUM_ORDER || sizeof(Repr) == 1,
                      "multi-byte enum schema must declare its byte order (WIRECAST_REQUIRE_EXPLICIT_ENUM_ORDER)");
        return core::nativeByteOrder;
    }
}

template<class Entry, class Repr, class... Specs, std::size_t... I>
constexpr std::array<Entry, sizeof...(Specs)> variantEntries(const std::tuple<Specs...>& variants,
                                                             std::index_sequence<I...>) {
    return {{Entry{static_cast<Repr>(Specs::value), Specs::value, std::get<I>(variants).name}...}};
}

template<class Entry, std::size_t N>
constexpr std::array<Entry, N> sortedByDiscriminant(std::array<Entry, N> entries) {
    for (std::size_t i = 1; i < N; ++i) {
        for (std::size_t j = i; j > 0 && entries[j].discriminant < entries[j - 1].discriminant; --j) {
            Entry tmp = entries[j];
            entries[j] = entries[j - 1];
            entries[j - 1] = tmp;
        }
    }
    return entries;
}

template<class Entry, std::size_t N>
constexpr bool adjacentDistinct(const std::array<Entry, N>& sorted) {
    for (std::size_t i = 1; i < N; ++i) {
        if (sorted[i].discriminant == sorted[i - 1].discriminant) {
            return false;
        }
    }
    return true;
}

} // namespace detail

/**
 * @brief Compile-time table of the variants an EnumSchema declares.
 *
 * Entries are sorted by discriminant; decoding is a binary search. A value
 * outside the table is rejected, even when it fits the backing type.
 */
template<class E>
class DiscriminantTable {
    static_assert(hasEnumSchema<E>, "type has no EnumSchema specialisation");
    static_assert(detail::HasVariantList<E>::value,
                  "EnumSchema must declare static constexpr auto variants = std::make_tuple(enumerator<...>(...), ...)");
    static_assert(detail::HasEnumName<E>::value,
                  "EnumSchema must declare static constexpr std::string_view name");

public:
    using Repr = std::underlying_type_t<E>;

    static_assert(core::isEndianConvertible<Repr> && !std::is_floating_point_v<Repr> &&
                      (sizeof(Repr) == 1 || sizeof(Repr) == 2 || sizeof(Repr) == 4 || sizeof(Repr) == 8),
                  "enum backing type must be an 8, 16, 32 or 64-bit integer");

    using VariantList = std::decay_t<decltype(EnumSchema<E>::variants)>;
    static_assert(detail::VariantListOf<E, VariantList>::value,
                  "EnumSchema variants must be enumerator<> entries of the same enum");

    struct Entry {
        Repr discriminant;
        E value;
        std::string_view name;
    };

    static constexpr std::size_t size = std::tuple_size_v<VariantList>;
    static_assert(size > 0, "EnumSchema declares no variants");

    static constexpr std::array<Entry, size> entries = detail::sortedByDiscriminant(
        detail::variantEntries<Entry, Repr>(EnumSchema<E>::variants, std::make_index_sequence<size>{}));

    static_assert(detail::adjacentDistinct(entries), "EnumSchema declares two variants with the same discriminant");

    static constexpr std::string_view typeName() { return EnumSchema<E>::name; }

    static constexpr Repr encode(E value) { return static_cast<Repr>(value); }

    static constexpr const Entry* find(Repr discriminant) {
        std::size_t lo = 0;
        std::size_t hi = size;
        while (lo < hi) {
            const std::size_t mid = lo + (hi - lo) / 2;
            if (entries[mid].discriminant == discriminant) {
                return &entries[mid];
            }
            if (entries[mid].discriminant < discriminant) {
                lo = mid + 1;
            } else {
                hi = mid;
            }
        }
        return nullptr;
    }

    static constexpr bool contains(Repr discriminant) { return find(discriminant) != nullptr; }

    // Empty for values no variant declares.
    static constexpr std::string_view nameOf(E value) {
        const Entry* entry = find(encode(value));
        return entry ? entry->name : std::string_view{};
    }

    static expected<E, core::EnumFromBytesError> decode(Repr discriminant) {
        if (const Entry* entry = find(discriminant)) {
            return entry->value;
        }
        return unexpected(core::EnumFromBytesError(core::Discriminant::of(discriminant), typeName()));
    }
};

/**
 * @brief Generated layout of an enum described by EnumSchema<E>.
 *
 * Raw is the backing integer when it is one byte wide, otherwise the backing
 * integer in an EndianValue of the schema's declared order. A schema without
 * an order uses the host order, unless WIRECAST_REQUIRE_EXPLICIT_ENUM_ORDER
 * asks for it to be spelled out.
 */
template<class E>
class EnumLayout {
public:
    using Table = DiscriminantTable<E>;
    using Repr = typename Table::Repr;
    using Error = core::EnumFromBytesError;

    static constexpr core::ByteOrder order = detail::enumByteOrder<E, Repr>();
    static constexpr bool orderDeclared = detail::HasDeclaredOrder<E>::value;

    using Raw = std::conditional_t<sizeof(Repr) == 1, Repr, core::EndianValue<Repr, order>>;

    // Enumerators missing from the schema still encode; their bytes never decode.
    static Raw toRaw(E value) {
        assert(Table::contains(Table::encode(value)) && "enumerator missing from EnumSchema variants");
        if constexpr (sizeof(Repr) == 1) {
            return Table::encode(value);
        } else {
            return Raw(Table::encode(value));
        }
    }

    static expected<E, Error> tryFromRaw(const Raw& raw) {
        if constexpr (sizeof(Repr) == 1) {
            return Table::decode(raw);
        } else {
            return Table::decode(raw.get());
        }
    }
};

} // namespace wirecast::layout

// ============================================================================
// Conversion trait set for enums with a schema: total encode, checked decode
// ============================================================================

namespace wirecast::core {

template<class E>
struct RawTraits<E, std::enable_if_t<layout::hasEnumSchema<E>>> {
    using Raw = typename layout::EnumLayout<E>::Raw;
    using Error = EnumFromBytesError;

    static Raw toRaw(E value) { return layout::EnumLayout<E>::toRaw(value); }
    static expected<E, Error> tryFromRaw(const Raw& raw) { return layout::EnumLayout<E>::tryFromRaw(raw); }
};

template<class E>
struct AssociatedByteArray<E, std::enable_if_t<layout::hasEnumSchema<E>>> {
    using type = ByteArrayOf<typename layout::EnumLayout<E>::Raw>;
};

template<class E>
struct IntoByteArray<E, std::enable_if_t<layout::hasEnumSchema<E>>> {
    static ByteArrayOf<E> into(E value) {
        using Raw = typename layout::EnumLayout<E>::Raw;
        return IntoByteArray<Raw>::into(layout::EnumLayout<E>::toRaw(value));
    }
};

template<class E>
struct TryFromByteArray<E, std::enable_if_t<layout::hasEnumSchema<E>>> {
    using Error = EnumFromBytesError;

    static expected<E, Error> tryFrom(const ByteArrayOf<E>& bytes) {
        using Raw = typename layout::EnumLayout<E>::Raw;
        return layout::EnumLayout<E>::tryFromRaw(FromByteArray<Raw>::from(bytes));
    }
};

} // namespace wirecast::core
