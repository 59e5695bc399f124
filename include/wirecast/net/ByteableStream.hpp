#pragma once

#include "wirecast/core/ByteArray.hpp"
#include "wirecast/core/ByteConvert.hpp"
#include "wirecast/core/Expected.hpp"
#include "wirecast/io/TryByteableError.hpp"
#include "wirecast/log/Log.hpp"
#include "wirecast/net/Deadline.hpp"
#include "wirecast/net/NetConfig.hpp"
#include "wirecast/net/TimeoutConfig.hpp"

#include <chrono>
#include <memory>
#include <system_error>
#include <utility>

// Asio counterparts of the iostream helpers. Every variant transfers exactly
// byteSizeOf<T> bytes before converting; asio::read/async_read already loop
// until the buffer is full, so a short transfer only surfaces as an error code
// (asio::error::eof when the peer closes early).

namespace wirecast::net {

namespace detail {

template<class T>
using TryReadResult = expected<T, io::TryByteableError<core::TryFromErrorOf<T>>>;

template<class T>
using TryWriteResult = expected<void, io::TryByteableError<core::TryIntoErrorOf<T>>>;

inline void logTransferError(const char* what, std::size_t size, const std::error_code& ec) {
    logError("[wirecast] ", what, " of ", size, " bytes failed: ", ec.message(), "\n");
}

// Reads exactly bytes.size() bytes with a deadline. The stream's executor must be
// driven by a running io_context (see NetService).
template<class AsyncReadStream, class Bytes>
std::error_code read_exact(AsyncReadStream& stream, Bytes& bytes, std::chrono::milliseconds timeout) {
    return with_deadline(stream.get_executor(), TimeoutConfig::sanitize(timeout),
        [&](auto completion) {
            asio::async_read(stream, asio::buffer(bytes),
                [completion](const std::error_code& ec, std::size_t) { completion(ec); });
        },
        [&] {
            std::error_code ignored;
            stream.cancel(ignored);
        });
}

template<class AsyncWriteStream, class Bytes>
std::error_code write_all(AsyncWriteStream& stream, const Bytes& bytes, std::chrono::milliseconds timeout) {
    return with_deadline(stream.get_executor(), TimeoutConfig::sanitize(timeout),
        [&](auto completion) {
            asio::async_write(stream, asio::buffer(bytes),
                [completion](const std::error_code& ec, std::size_t) { completion(ec); });
        },
        [&] {
            std::error_code ignored;
            stream.cancel(ignored);
        });
}

} // namespace detail

// Selects the deadline overloads with TimeoutConfig::defaultTimeout().
struct deadline_t {
    explicit deadline_t() = default;
};
inline constexpr deadline_t deadline{};

// ============================================================================
// Blocking, no deadline
// ============================================================================

template<class T, class SyncReadStream>
expected<T> read_byteable(SyncReadStream& stream) {
    static_assert(core::hasFromByteArray<T>, "read_byteable needs an infallibly decoded type; use read_try_byteable");
    auto bytes = core::zeroed<core::ByteArrayOf<T>>();
    std::error_code ec;
    asio::read(stream, asio::buffer(bytes), ec);
    if (ec) {
        detail::logTransferError("read", bytes.size(), ec);
        return unexpected(ec);
    }
    return core::fromByteArray<T>(bytes);
}

template<class T, class SyncWriteStream>
expected<void> write_byteable(SyncWriteStream& stream, const T& value) {
    static_assert(core::hasIntoByteArray<T>, "write_byteable needs an infallibly encoded type; use write_try_byteable");
    const auto bytes = core::intoByteArray(value);
    std::error_code ec;
    asio::write(stream, asio::buffer(bytes), ec);
    if (ec) {
        detail::logTransferError("write", bytes.size(), ec);
        return unexpected(ec);
    }
    return {};
}

template<class T, class SyncReadStream>
detail::TryReadResult<T> read_try_byteable(SyncReadStream& stream) {
    using Error = io::TryByteableError<core::TryFromErrorOf<T>>;
    auto bytes = core::zeroed<core::ByteArrayOf<T>>();
    std::error_code ec;
    asio::read(stream, asio::buffer(bytes), ec);
    if (ec) {
        detail::logTransferError("read", bytes.size(), ec);
        return unexpected(Error::fromIo(ec));
    }
    auto decoded = core::tryFromByteArray<T>(bytes);
    if (!decoded) {
        return unexpected(Error::fromConversion(std::move(decoded.error())));
    }
    return std::move(*decoded);
}

template<class T, class SyncWriteStream>
detail::TryWriteResult<T> write_try_byteable(SyncWriteStream& stream, const T& value) {
    using Error = io::TryByteableError<core::TryIntoErrorOf<T>>;
    auto encoded = core::tryIntoByteArray(value);
    if (!encoded) {
        return unexpected(Error::fromConversion(std::move(encoded.error())));
    }
    std::error_code ec;
    asio::write(stream, asio::buffer(*encoded), ec);
    if (ec) {
        detail::logTransferError("write", encoded->size(), ec);
        return unexpected(Error::fromIo(ec));
    }
    return {};
}

// ============================================================================
// Blocking with a deadline (needs a running io_context)
// ============================================================================

template<class T, class AsyncReadStream>
expected<T> read_byteable(AsyncReadStream& stream, std::chrono::milliseconds timeout) {
    static_assert(core::hasFromByteArray<T>, "read_byteable needs an infallibly decoded type; use read_try_byteable");
    auto bytes = core::zeroed<core::ByteArrayOf<T>>();
    if (auto ec = detail::read_exact(stream, bytes, timeout)) {
        return unexpected(ec);
    }
    return core::fromByteArray<T>(bytes);
}

template<class T, class AsyncWriteStream>
expected<void> write_byteable(AsyncWriteStream& stream, const T& value, std::chrono::milliseconds timeout) {
    static_assert(core::hasIntoByteArray<T>, "write_byteable needs an infallibly encoded type; use write_try_byteable");
    const auto bytes = core::intoByteArray(value);
    if (auto ec = detail::write_all(stream, bytes, timeout)) {
        return unexpected(ec);
    }
    return {};
}

template<class T, class AsyncReadStream>
detail::TryReadResult<T> read_try_byteable(AsyncReadStream& stream, std::chrono::milliseconds timeout) {
    using Error = io::TryByteableError<core::TryFromErrorOf<T>>;
    auto bytes = core::zeroed<core::ByteArrayOf<T>>();
    if (auto ec = detail::read_exact(stream, bytes, timeout)) {
        return unexpected(Error::fromIo(ec));
    }
    auto decoded = core::tryFromByteArray<T>(bytes);
    if (!decoded) {
        return unexpected(Error::fromConversion(std::move(decoded.error())));
    }
    return std::move(*decoded);
}

template<class T, class AsyncWriteStream>
detail::TryWriteResult<T> write_try_byteable(AsyncWriteStream& stream, const T& value,
                                             std::chrono::milliseconds timeout) {
    using Error = io::TryByteableError<core::TryIntoErrorOf<T>>;
    auto encoded = core::tryIntoByteArray(value);
    if (!encoded) {
        return unexpected(Error::fromConversion(std::move(encoded.error())));
    }
    if (auto ec = detail::write_all(stream, *encoded, timeout)) {
        return unexpected(Error::fromIo(ec));
    }
    return {};
}

template<class T, class AsyncReadStream>
expected<T> read_byteable(AsyncReadStream& stream, deadline_t) {
    return read_byteable<T>(stream, TimeoutConfig::defaultTimeout());
}

template<class T, class AsyncWriteStream>
expected<void> write_byteable(AsyncWriteStream& stream, const T& value, deadline_t) {
    return write_byteable(stream, value, TimeoutConfig::defaultTimeout());
}

template<class T, class AsyncReadStream>
detail::TryReadResult<T> read_try_byteable(AsyncReadStream& stream, deadline_t) {
    return read_try_byteable<T>(stream, TimeoutConfig::defaultTimeout());
}

template<class T, class AsyncWriteStream>
detail::TryWriteResult<T> write_try_byteable(AsyncWriteStream& stream, const T& value, deadline_t) {
    return write_try_byteable(stream, value, TimeoutConfig::defaultTimeout());
}

// ============================================================================
// Asynchronous
// ============================================================================
// The handler is called once on the stream's executor with the result. The
// byte buffer lives in shared storage until the operation completes.

template<class T, class AsyncReadStream, class Handler>
void async_read_byteable(AsyncReadStream& stream, Handler&& handler) {
    static_assert(core::hasFromByteArray<T>, "async_read_byteable needs an infallibly decoded type");
    auto bytes = std::make_shared<core::ByteArrayOf<T>>(core::zeroed<core::ByteArrayOf<T>>());
    asio::async_read(stream, asio::buffer(*bytes),
        [bytes, handler = std::forward<Handler>(handler)](const std::error_code& ec, std::size_t) mutable {
            if (ec) {
                detail::logTransferError("async read", bytes->size(), ec);
                handler(expected<T>(unexpected(ec)));
                return;
            }
            handler(expected<T>(core::fromByteArray<T>(*bytes)));
        });
}

template<class T, class AsyncReadStream, class Handler>
void async_read_try_byteable(AsyncReadStream& stream, Handler&& handler) {
    using Error = io::TryByteableError<core::TryFromErrorOf<T>>;
    auto bytes = std::make_shared<core::ByteArrayOf<T>>(core::zeroed<core::ByteArrayOf<T>>());
    asio::async_read(stream, asio::buffer(*bytes),
        [bytes, handler = std::forward<Handler>(handler)](const std::error_code& ec, std::size_t) mutable {
            if (ec) {
                detail::logTransferError("async read", bytes->size(), ec);
                handler(detail::TryReadResult<T>(unexpected(Error::fromIo(ec))));
                return;
            }
            auto decoded = core::tryFromByteArray<T>(*bytes);
            if (!decoded) {
                handler(detail::TryReadResult<T>(unexpected(Error::fromConversion(std::move(decoded.error())))));
                return;
            }
            handler(detail::TryReadResult<T>(std::move(*decoded)));
        });
}

template<class T, class AsyncWriteStream, class Handler>
void async_write_byteable(AsyncWriteStream& stream, const T& value, Handler&& handler) {
    static_assert(core::hasIntoByteArray<T>, "async_write_byteable needs an infallibly encoded type");
    auto bytes = std::make_shared<core::ByteArrayOf<T>>(core::intoByteArray(value));
    asio::async_write(stream, asio::buffer(*bytes),
        [bytes, handler = std::forward<Handler>(handler)](const std::error_code& ec, std::size_t) mutable {
            if (ec) {
                detail::logTransferError("async write", bytes->size(), ec);
                handler(expected<void>(unexpected(ec)));
                return;
            }
            handler(expected<void>());
        });
}

} // namespace wirecast::net
