#pragma once

#include <system_error>
#include <type_traits>

namespace wirecast::io {

// Failures of the iostream helpers, reported as std::error_code in the
// "wirecast.io" category.
enum class IoErrc {
    UnexpectedEof = 1,  // the stream ended before the whole byte array arrived
    StreamFailure,      // the stream went bad (read or write error)
};

const std::error_category& ioCategory() noexcept;

std::error_code make_error_code(IoErrc e) noexcept;

} // namespace wirecast::io

namespace std {
template<>
struct is_error_code_enum<wirecast::io::IoErrc> : true_type {};
} // namespace std
