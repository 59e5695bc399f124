#pragma once

#include "wirecast/core/ByteArray.hpp"
#include "wirecast/core/ByteConvert.hpp"
#include "wirecast/core/ValidBytecast.hpp"

#include <array>
#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

namespace wirecast::layout {

namespace detail {

template<class... Fields>
constexpr std::array<std::size_t, sizeof...(Fields)> layoutOffsets() {
    std::array<std::size_t, sizeof...(Fields)> out{};
    constexpr std::size_t sizes[] = {core::byteSizeOf<Fields>..., 0};
    std::size_t at = 0;
    for (std::size_t i = 0; i < sizeof...(Fields); ++i) {
        out[i] = at;
        at += sizes[i];
    }
    return out;
}

} // namespace detail

/**
 * @brief Byte-exact companion of a user type: one slot per schema field.
 *
 * The byte form is the fields' byte arrays concatenated in declared order. No
 * padding is inserted, whatever the in-memory layout of the tuple happens to be.
 * Fields must convert infallibly; the layout carries the safety marker exactly
 * when all of its fields do.
 */
template<class... Fields>
class RawLayout {
public:
    static_assert((core::hasIntoByteArray<Fields> && ...),
                  "every raw field needs an infallible byte-array encoding");
    static_assert((core::hasFromByteArray<Fields> && ...),
                  "every raw field needs an infallible byte-array decoding");

    static constexpr std::size_t fieldCount = sizeof...(Fields);
    static constexpr std::size_t byteSize = (std::size_t{0} + ... + core::byteSizeOf<Fields>);
    static constexpr std::array<std::size_t, sizeof...(Fields)> offsets = detail::layoutOffsets<Fields...>();

    using Bytes = core::ByteArray<byteSize>;
    using Tuple = std::tuple<Fields...>;

    RawLayout() = default;
    explicit RawLayout(Tuple fields) : fields_(std::move(fields)) {}

    template<std::size_t I>
    const std::tuple_element_t<I, Tuple>& get() const { return std::get<I>(fields_); }

    template<std::size_t I>
    std::tuple_element_t<I, Tuple>& get() { return std::get<I>(fields_); }

    const Tuple& fields() const { return fields_; }

    Bytes toBytes() const { return toBytes(std::index_sequence_for<Fields...>{}); }

    static RawLayout fromBytes(const Bytes& bytes) {
        return fromBytes(bytes, std::index_sequence_for<Fields...>{});
    }

    friend bool operator==(const RawLayout& a, const RawLayout& b) { return a.fields_ == b.fields_; }
    friend bool operator!=(const RawLayout& a, const RawLayout& b) { return !(a == b); }

private:
    template<std::size_t... I>
    Bytes toBytes(std::index_sequence<I...>) const {
        Bytes out{};
        (core::detail::writeAt<offsets[I]>(out, core::IntoByteArray<Fields>::into(std::get<I>(fields_))), ...);
        return out;
    }

    template<std::size_t... I>
    static RawLayout fromBytes(const Bytes& bytes, std::index_sequence<I...>) {
        (void)bytes;
        return RawLayout(Tuple(
            core::FromByteArray<Fields>::from(core::detail::readAt<offsets[I], core::byteSizeOf<Fields>>(bytes))...));
    }

    Tuple fields_;
};

} // namespace wirecast::layout

namespace wirecast::core {

template<class... Fields>
struct AssociatedByteArray<layout::RawLayout<Fields...>> {
    using type = typename layout::RawLayout<Fields...>::Bytes;
};

template<class... Fields>
struct IntoByteArray<layout::RawLayout<Fields...>> {
    static typename layout::RawLayout<Fields...>::Bytes into(const layout::RawLayout<Fields...>& raw) {
        return raw.toBytes();
    }
};

template<class... Fields>
struct FromByteArray<layout::RawLayout<Fields...>> {
    static layout::RawLayout<Fields...> from(const typename layout::RawLayout<Fields...>::Bytes& bytes) {
        return layout::RawLayout<Fields...>::fromBytes(bytes);
    }
};

template<class... Fields>
struct ValidBytecastMarker<layout::RawLayout<Fields...>> : std::conjunction<ValidBytecastMarker<Fields>...> {};

} // namespace wirecast::core
