// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <array>
#include <cassert>
#include <concepts>
#include <cstdint>
#include <span>
#include <type_traits>

namespace sigil::protocol::script::lang {

namespace detail {

// Returns the negative of an unsigned input.
// Safe for all input values up to 0x80...00.
template <std::unsigned_integral U>
inline constexpr auto Negate(U value) noexcept {
  using T = std::make_signed_t<U>;
  return T(~value + 1);
}

// Returns the unsigned absolute value of any integer.
// Unlike std::abs, safe for extreme values, i.e. Abs : (int8_t)-128 --> (uint8_t)128.
template <std::integral T>
inline constexpr auto Abs(T value) noexcept {
  using U = std::make_unsigned_t<T>;
  // Uses twos-complement conversion to avoid UB on INT_MIN.
  return value < T{0} ? U(~U(value) + 1) : U(value);
}

}  // namespace detail

template <std::integral T>
struct MinimalIntEncoded {
  void Append(uint8_t value) {
    assert(size < std::ssize(bytes));
    bytes[size++] = value;
  }
  operator std::span<const uint8_t>() const {
    return {bytes.data(), size_t(size)};
  }
  std::array<uint8_t, sizeof(T) + 1> bytes = {};
  int size = 0;
};

// Encodes the integer in the minimum number of bytes using little-endian ordering.
// Negatives are encoded as absolute values with a high-order sign bit.
template <std::integral T>
MinimalIntEncoded<T> EncodeMinimalInt(T value) {
  MinimalIntEncoded<T> x;
  if (value == 0) return x;
  for (auto remainder = detail::Abs(value); remainder > 0; remainder >>= 8)
    x.Append(remainder & 0xFF);
  if (x.bytes[x.size - 1] & 0x80) x.Append(0);  // Adds a byte to disambiguate sign bit.
  if (value < 0) x.bytes[x.size - 1] |= 0x80;   // Sets the sign bit for negatives.
  return x;
}

template <typename T>
struct MinimalIntDecoded {
  operator T() const {
    return value;
  }
  T value;        // The decoded integer value.
  bool minimal;   // Whether the encoding was minimal.
};

// Decodes an integer from its little-endian sign-magnitude encoding.
template <std::signed_integral T>
MinimalIntDecoded<T> DecodeMinimalInt(std::span<const uint8_t> bytes) {
  using U = std::make_unsigned_t<T>;
  MinimalIntDecoded<T> result = {0, true};
  if (bytes.empty()) return result;
  assert(bytes.size() <= sizeof(T));
  const int last = static_cast<int>(std::ssize(bytes)) - 1;
  const bool negative = (bytes[last] & 0x80) != 0;
  if ((bytes[last] & 0x7F) == 0) {
    // The high byte exists for sign disambiguation only. Therefore another byte
    // must precede it with its high bit set.
    result.minimal = last > 0 && (bytes[last - 1] & 0x80) != 0;
  }
  U absval = 0;
  for (int pos = last; pos >= 0; --pos) {
    const uint8_t mask = pos == last ? 0x7F : 0xFF;  // Mask out the sign bit only.
    absval = U(absval << 8) | (bytes[pos] & mask);
  }
  result.value = negative ? detail::Negate(absval) : T(absval);
  return result;
}

}  // namespace sigil::protocol::script::lang
