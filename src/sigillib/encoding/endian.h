// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <bit>
#include <concepts>
#include <utility>

#include "sigillib/util/throw.h"

namespace sigil::encoding {

// Wire integers are little-endian. On little-endian targets these are no-ops.
template <std::integral T>
inline constexpr T NativeToLittleEndian(T native) {
  if constexpr (std::endian::native == std::endian::big)
    return std::byteswap(native);
  else
    return native;
}

template <std::integral T>
inline constexpr T LittleEndianToNative(T le) {
  return NativeToLittleEndian(le);
}

// Converts between integer types, throwing std::out_of_range if the value does not fit.
template <std::integral To, std::integral From>
To NarrowOrThrow(From value) {
  if (!std::in_range<To>(value))
    util::ThrowOutOfRange("Value ", value, " does not fit in ", sizeof(To), " bytes.");
  return static_cast<To>(value);
}

}  // namespace sigil::encoding
