#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

namespace wirecast::core {

// Wire representation of every convertible type: N contiguous bytes, N fixed at
// compile time.
template<std::size_t N>
using ByteArray = std::array<std::uint8_t, N>;

// Minimal read-only byte slice (stand-in for std::span<const std::uint8_t>)
struct ByteView {
    const std::uint8_t* ptr = nullptr;
    std::size_t len = 0;

    constexpr ByteView() = default;
    constexpr ByteView(const std::uint8_t* p, std::size_t n) : ptr(p), len(n) {}

    template<class Container>
    explicit ByteView(const Container& c)
    : ptr(reinterpret_cast<const std::uint8_t*>(c.data())), len(c.size()) {
        static_assert(sizeof(*c.data()) == 1, "ByteView needs a container of bytes");
    }

    constexpr std::size_t size() const { return len; }
    constexpr bool empty() const { return len == 0; }
    constexpr const std::uint8_t* data() const { return ptr; }
    constexpr const std::uint8_t& operator[](std::size_t i) const { return ptr[i]; }

    constexpr const std::uint8_t* begin() const { return ptr; }
    constexpr const std::uint8_t* end() const { return ptr + len; }

    ByteView subspan(std::size_t offset) const {
        if (offset > len) return {};
        return ByteView(ptr + offset, len - offset);
    }

    ByteView subspan(std::size_t offset, std::size_t count) const {
        if (offset > len || count > len - offset) return {};
        return ByteView(ptr + offset, count);
    }
};

// Writable counterpart of ByteView.
struct MutableByteView {
    std::uint8_t* ptr = nullptr;
    std::size_t len = 0;

    constexpr MutableByteView() = default;
    constexpr MutableByteView(std::uint8_t* p, std::size_t n) : ptr(p), len(n) {}

    constexpr std::size_t size() const { return len; }
    constexpr bool empty() const { return len == 0; }
    constexpr std::uint8_t* data() const { return ptr; }
    constexpr std::uint8_t& operator[](std::size_t i) const { return ptr[i]; }

    constexpr std::uint8_t* begin() const { return ptr; }
    constexpr std::uint8_t* end() const { return ptr + len; }

    constexpr operator ByteView() const { return ByteView(ptr, len); }
};

// ============================================================================
// Fixed byte buffer trait
// ============================================================================
// Specialised for ByteArray<N> and, recursively, for std::array<Buffer, M>.
// The primary template is empty: "not a fixed byte buffer".
template<class A, class Enable = void>
struct FixedByteBuffer {};

namespace detail {

template<class A, class = void>
struct IsFixedByteBuffer : std::false_type {};

template<class A>
struct IsFixedByteBuffer<A, std::void_t<decltype(FixedByteBuffer<A>::size)>> : std::true_type {};

} // namespace detail

template<class A>
inline constexpr bool isFixedByteBuffer = detail::IsFixedByteBuffer<A>::value;

template<std::size_t N>
struct FixedByteBuffer<ByteArray<N>> {
    static constexpr std::size_t size = N;

    static constexpr ByteArray<N> zeroed() { return ByteArray<N>{}; }

    static ByteView asSlice(const ByteArray<N>& a) { return ByteView(a.data(), N); }
    static MutableByteView asMutableSlice(ByteArray<N>& a) { return MutableByteView(a.data(), N); }
};

// An array of M buffers of K bytes each is itself a buffer of M*K bytes whose
// slice views cover the whole block.
template<class Inner, std::size_t M>
struct FixedByteBuffer<std::array<Inner, M>,
                       std::enable_if_t<!std::is_same_v<Inner, std::uint8_t> &&
                                        detail::IsFixedByteBuffer<Inner>::value>> {
    static constexpr std::size_t size = M * FixedByteBuffer<Inner>::size;

    static_assert(size == 0 || sizeof(std::array<Inner, M>) == size,
                  "nested byte buffers must be laid out contiguously");

    static constexpr std::array<Inner, M> zeroed() { return std::array<Inner, M>{}; }

    static ByteView asSlice(const std::array<Inner, M>& a) {
        if constexpr (size == 0) {
            return {};
        } else {
            return ByteView(reinterpret_cast<const std::uint8_t*>(a.data()), size);
        }
    }

    static MutableByteView asMutableSlice(std::array<Inner, M>& a) {
        if constexpr (size == 0) {
            return {};
        } else {
            return MutableByteView(reinterpret_cast<std::uint8_t*>(a.data()), size);
        }
    }
};

template<class A>
constexpr A zeroed() {
    static_assert(isFixedByteBuffer<A>, "zeroed() needs a fixed byte buffer type");
    return FixedByteBuffer<A>::zeroed();
}

template<class A>
ByteView asSlice(const A& buffer) {
    return FixedByteBuffer<A>::asSlice(buffer);
}

template<class A>
MutableByteView asMutableSlice(A& buffer) {
    return FixedByteBuffer<A>::asMutableSlice(buffer);
}

// "01 02 0a ff" style dump used by diagnostics and tests.
std::string toHexLine(ByteView bytes);

namespace detail {

// Copies src into dst starting at Offset. Bounds are checked at compile time.
template<std::size_t Offset, std::size_t N, std::size_t M>
constexpr void writeAt(ByteArray<M>& dst, const ByteArray<N>& src) {
    static_assert(Offset + N <= M, "write past the end of the byte array");
    for (std::size_t i = 0; i < N; ++i) {
        dst[Offset + i] = src[i];
    }
}

template<std::size_t Offset, std::size_t N, std::size_t M>
constexpr ByteArray<N> readAt(const ByteArray<M>& src) {
    static_assert(Offset + N <= M, "read past the end of the byte array");
    ByteArray<N> out{};
    for (std::size_t i = 0; i < N; ++i) {
        out[i] = src[Offset + i];
    }
    return out;
}

} // namespace detail

} // namespace wirecast::core
