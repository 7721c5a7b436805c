// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <concepts>
#include <span>

#include "sigillib/protocol/script/lang/minimal.h"
#include "sigillib/protocol/script/lang/types.h"
#include "sigillib/protocol/script/runtime/throw.h"

namespace sigil::protocol::script::runtime {

template <std::signed_integral T, int kMaxNumBytes>
inline T Decode(lang::Bytes bytes) {
  if (std::ssize(bytes) > kMaxNumBytes)
    Throw(lang::Error::NumberOverflow, "Could not decode a buffer of size ", bytes.size(),
          " bytes (max ", kMaxNumBytes, ").");
  return lang::DecodeMinimalInt<T>(bytes).value;
}

// Decodes up to 4 bytes and returns the result in a 32-bit signed integer.
// Non-minimal encodings are accepted.
inline int32_t DecodeInt32(lang::Bytes bytes) {
  return Decode<int32_t, 4>(bytes);
}

}  // namespace sigil::protocol::script::runtime
