#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

// Declarative layout vocabulary.
//
//   namespace wirecast::layout {
//   template<> struct LayoutSchema<Header> {
//       static constexpr auto fields = std::make_tuple(
//           field<&Header::version>("version"),
//           field<&Header::length>("length", bigEndian),
//           field<&Header::kind>("kind", tryTransparent));
//   };
//   template<> struct EnumSchema<Kind> {
//       static constexpr std::string_view name = "Kind";
//       static constexpr core::ByteOrder order = core::ByteOrder::Big;
//       static constexpr auto variants = std::make_tuple(
//           enumerator<Kind::Ping>("Ping"),
//           enumerator<Kind::Data>("Data"));
//   };
//   }
//
// Fields are laid out in the order listed, back to back.

namespace wirecast::layout {

// ============================================================================
// Field attributes
// ============================================================================

struct PlainTag {};
struct LittleEndianTag {};
struct BigEndianTag {};
struct TransparentTag {};
struct TryTransparentTag {};

inline constexpr PlainTag plain{};
inline constexpr LittleEndianTag littleEndian{};
inline constexpr BigEndianTag bigEndian{};
inline constexpr TransparentTag transparent{};
inline constexpr TryTransparentTag tryTransparent{};

template<class Tag>
inline constexpr bool isFieldTag = std::is_same_v<Tag, PlainTag> ||
                                   std::is_same_v<Tag, LittleEndianTag> ||
                                   std::is_same_v<Tag, BigEndianTag> ||
                                   std::is_same_v<Tag, TransparentTag> ||
                                   std::is_same_v<Tag, TryTransparentTag>;

namespace detail {

template<class P>
struct MemberPointerTraits {
    static constexpr bool valid = false;
};

template<class C, class M>
struct MemberPointerTraits<M C::*> {
    static constexpr bool valid = !std::is_function_v<M>;
    using Owner = C;
    using Member = M;
};

// Identity of a schema slot, used to reject a member listed twice.
template<auto MemberPtr>
struct MemberSlot {};

template<std::size_t I>
struct ElementSlot {};

template<class T, class = void>
struct TupleSize : std::integral_constant<std::size_t, 0> {};

template<class T>
struct TupleSize<T, std::void_t<decltype(std::tuple_size<T>::value)>> : std::tuple_size<T> {};

constexpr std::size_t decimalLength(std::size_t v) {
    std::size_t n = 1;
    while (v >= 10) {
        v /= 10;
        ++n;
    }
    return n;
}

template<std::size_t I>
constexpr std::array<char, decimalLength(I)> decimalDigits() {
    std::array<char, decimalLength(I)> out{};
    std::size_t v = I;
    for (std::size_t i = out.size(); i > 0; --i) {
        out[i - 1] = static_cast<char>('0' + v % 10);
        v /= 10;
    }
    return out;
}

template<std::size_t I>
inline constexpr std::array<char, decimalLength(I)> indexDigits = decimalDigits<I>();

struct UndeclaredSchema {};

} // namespace detail

// ============================================================================
// Field descriptors
// ============================================================================

// A named data member, addressed by member pointer.
template<auto MemberPtr, class Tag>
struct FieldSpec {
    using Traits = detail::MemberPointerTraits<decltype(MemberPtr)>;
    static_assert(Traits::valid, "field<> takes a pointer to a data member");

    using Owner = typename Traits::Owner;
    using TagType = Tag;
    using Slot = detail::MemberSlot<MemberPtr>;

    template<class T>
    static constexpr bool belongsTo = std::is_same_v<Owner, T>;

    template<class T>
    using MemberType = typename Traits::Member;

    static const typename Traits::Member& get(const Owner& obj) { return obj.*MemberPtr; }
    static typename Traits::Member& get(Owner& obj) { return obj.*MemberPtr; }

    std::string_view name;
};

// Element I of a tuple-like type (std::pair, std::tuple). Named by its index.
template<std::size_t I, class Tag>
struct ElementSpec {
    using TagType = Tag;
    using Slot = detail::ElementSlot<I>;

    template<class T>
    static constexpr bool belongsTo = I < detail::TupleSize<T>::value;

    template<class T>
    using MemberType = std::tuple_element_t<I, T>;

    template<class T>
    static decltype(auto) get(T& obj) { return std::get<I>(obj); }

    std::string_view name;
};

template<auto MemberPtr, class Tag = PlainTag>
constexpr FieldSpec<MemberPtr, Tag> field(std::string_view name, Tag = Tag{}) {
    static_assert(isFieldTag<Tag>,
                  "unknown field attribute: expected plain, littleEndian, bigEndian, transparent or tryTransparent");
    return FieldSpec<MemberPtr, Tag>{name};
}

template<std::size_t I, class Tag = PlainTag>
constexpr ElementSpec<I, Tag> element(Tag = Tag{}) {
    static_assert(isFieldTag<Tag>,
                  "unknown field attribute: expected plain, littleEndian, bigEndian, transparent or tryTransparent");
    return ElementSpec<I, Tag>{std::string_view(detail::indexDigits<I>.data(), detail::indexDigits<I>.size())};
}

// ============================================================================
// Enum variants
// ============================================================================

template<auto Value>
struct EnumeratorSpec {
    using EnumType = decltype(Value);
    static constexpr EnumType value = Value;

    std::string_view name;
};

template<auto Value>
constexpr EnumeratorSpec<Value> enumerator(std::string_view name) {
    static_assert(std::is_enum_v<decltype(Value)>, "enumerator<> takes an enumerator");
    return EnumeratorSpec<Value>{name};
}

// ============================================================================
// Schema holders
// ============================================================================
// Specialise for each user type. The primary templates mark "no schema".

template<class T>
struct LayoutSchema : detail::UndeclaredSchema {};

template<class E>
struct EnumSchema : detail::UndeclaredSchema {};

template<class T>
struct HasLayoutSchema
    : std::bool_constant<!std::is_base_of_v<detail::UndeclaredSchema, LayoutSchema<T>>> {};

template<class E>
struct HasEnumSchema
    : std::bool_constant<std::is_enum_v<E> &&
                         !std::is_base_of_v<detail::UndeclaredSchema, EnumSchema<E>>> {};

template<class T>
inline constexpr bool hasLayoutSchema = HasLayoutSchema<T>::value;

template<class E>
inline constexpr bool hasEnumSchema = HasEnumSchema<E>::value;

} // namespace wirecast::layout
