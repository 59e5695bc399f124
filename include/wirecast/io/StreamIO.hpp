#pragma once

#include "wirecast/core/ByteArray.hpp"
#include "wirecast/core/ByteConvert.hpp"
#include "wirecast/core/Expected.hpp"
#include "wirecast/io/IoError.hpp"
#include "wirecast/io/TryByteableError.hpp"

#include <istream>
#include <ostream>
#include <system_error>

// Blocking helpers that move exactly byteSizeOf<T> bytes through an iostream
// and hand them to the conversion trait set. A short read is an error; the
// value is never decoded from a partially filled buffer.

namespace wirecast::io {

// Fills all of dst or reports why not (IoErrc::UnexpectedEof / StreamFailure).
std::error_code readExact(std::istream& in, core::MutableByteView dst);

// Writes all of src or reports IoErrc::StreamFailure.
std::error_code writeAll(std::ostream& out, core::ByteView src);

template<class T>
expected<T> readByteable(std::istream& in) {
    static_assert(core::hasFromByteArray<T>, "readByteable needs an infallibly decoded type; use readTryByteable");
    auto bytes = core::zeroed<core::ByteArrayOf<T>>();
    if (auto ec = readExact(in, core::asMutableSlice(bytes))) {
        return unexpected(ec);
    }
    return core::fromByteArray<T>(bytes);
}

template<class T>
expected<void> writeByteable(std::ostream& out, const T& value) {
    static_assert(core::hasIntoByteArray<T>, "writeByteable needs an infallibly encoded type; use writeTryByteable");
    const auto bytes = core::intoByteArray(value);
    if (auto ec = writeAll(out, core::asSlice(bytes))) {
        return unexpected(ec);
    }
    return {};
}

template<class T>
expected<T, TryByteableError<core::TryFromErrorOf<T>>> readTryByteable(std::istream& in) {
    using Error = TryByteableError<core::TryFromErrorOf<T>>;
    auto bytes = core::zeroed<core::ByteArrayOf<T>>();
    if (auto ec = readExact(in, core::asMutableSlice(bytes))) {
        return unexpected(Error::fromIo(ec));
    }
    auto decoded = core::tryFromByteArray<T>(bytes);
    if (!decoded) {
        return unexpected(Error::fromConversion(std::move(decoded.error())));
    }
    return std::move(*decoded);
}

template<class T>
expected<void, TryByteableError<core::TryIntoErrorOf<T>>> writeTryByteable(std::ostream& out, const T& value) {
    using Error = TryByteableError<core::TryIntoErrorOf<T>>;
    auto encoded = core::tryIntoByteArray(value);
    if (!encoded) {
        return unexpected(Error::fromConversion(std::move(encoded.error())));
    }
    if (auto ec = writeAll(out, core::asSlice(*encoded))) {
        return unexpected(Error::fromIo(ec));
    }
    return {};
}

} // namespace wirecast::io
