#pragma once

// Conversion engine: byte buffers, endian wrappers, the conversion trait set,
// the safety marker and the layout generator. The iostream helpers and the
// Asio helpers (wirecast/net/ByteableStream.hpp) are included separately.

#include "wirecast/core/ByteArray.hpp"
#include "wirecast/core/ByteableVia.hpp"
#include "wirecast/core/ByteConvert.hpp"
#include "wirecast/core/CheckedPrimitives.hpp"
#include "wirecast/core/Config.hpp"
#include "wirecast/core/Discriminant.hpp"
#include "wirecast/core/Endian.hpp"
#include "wirecast/core/Expected.hpp"
#include "wirecast/core/RawTraits.hpp"
#include "wirecast/core/ValidBytecast.hpp"
#include "wirecast/layout/EnumLayout.hpp"
#include "wirecast/layout/RawLayout.hpp"
#include "wirecast/layout/Schema.hpp"
#include "wirecast/layout/StructLayout.hpp"

namespace wirecast {
using core::BigEndian;
using core::ByteArray;
using core::ByteOrder;
using core::EnumFromBytesError;
using core::LittleEndian;
using core::NativeEndian;
using core::byteSizeOf;
using core::fromByteArray;
using core::intoByteArray;
using core::tryFromByteArray;
using core::tryIntoByteArray;
} // namespace wirecast
