#pragma once

// Build-time switches and platform facts shared by the conversion engine.

// Native byte order. Every supported toolchain either defines __BYTE_ORDER__ or
// targets a little-endian Windows platform.
#if defined(__BYTE_ORDER__) && defined(__ORDER_LITTLE_ENDIAN__) && defined(__ORDER_BIG_ENDIAN__)
#  define WIRECAST_NATIVE_LITTLE_ENDIAN (__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__)
#elif defined(_WIN32)
#  define WIRECAST_NATIVE_LITTLE_ENDIAN 1
#else
#  error "wirecast: cannot determine host byte order"
#endif

// When set to 1, an enum schema whose backing type is wider than one byte must
// declare its byte order; leaving it out becomes a compile error instead of
// silently meaning "native".
#ifndef WIRECAST_REQUIRE_EXPLICIT_ENUM_ORDER
#  define WIRECAST_REQUIRE_EXPLICIT_ENUM_ORDER 0
#endif

#if defined(__SIZEOF_INT128__)
#  define WIRECAST_HAS_INT128 1
#else
#  define WIRECAST_HAS_INT128 0
#endif

namespace wirecast::core::config {

constexpr bool NATIVE_LITTLE_ENDIAN = WIRECAST_NATIVE_LITTLE_ENDIAN != 0;
constexpr bool REQUIRE_EXPLICIT_ENUM_ORDER = WIRECAST_REQUIRE_EXPLICIT_ENUM_ORDER != 0;

} // namespace wirecast::core::config
