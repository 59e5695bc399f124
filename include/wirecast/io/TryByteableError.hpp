#pragma once

#include <ostream>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace wirecast::io {

/**
 * @brief Error of a fallible read or write: either the bytes never moved (I/O)
 * or they did but did not convert (conversion error E, unchanged).
 */
template<class E>
class TryByteableError {
    static_assert(!std::is_same_v<E, std::error_code>, "conversion errors must be distinct from I/O errors");

public:
    static TryByteableError fromIo(std::error_code ec) { return TryByteableError(std::move(ec)); }
    static TryByteableError fromConversion(E error) { return TryByteableError(std::move(error)); }

    bool isIo() const { return std::holds_alternative<std::error_code>(value_); }
    bool isConversion() const { return !isIo(); }

    const std::error_code& ioError() const { return std::get<std::error_code>(value_); }
    const E& conversionError() const { return std::get<E>(value_); }

private:
    explicit TryByteableError(std::error_code ec) : value_(std::in_place_index<0>, std::move(ec)) {}
    explicit TryByteableError(E error) : value_(std::in_place_index<1>, std::move(error)) {}

    std::variant<std::error_code, E> value_;
};

template<class E>
std::ostream& operator<<(std::ostream& os, const TryByteableError<E>& error) {
    if (error.isIo()) {
        return os << "I/O error: " << error.ioError().message();
    }
    return os << "Conversion error: " << error.conversionError();
}

} // namespace wirecast::io
