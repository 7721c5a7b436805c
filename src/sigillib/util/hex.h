// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
// Hexadecimal encoding and decoding, at run time and for compile-time string literals.

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace sigil {
namespace util {

// Returns the lowercase hex string of the bytes, in memory order.
inline std::string ToHex(std::span<const uint8_t> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (const uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

// Parses a hex string of even length into bytes in memory order. Whitespace is not permitted.
inline std::optional<std::vector<uint8_t>> ParseHex(std::string_view hex) {
  auto Nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  if (hex.size() % 2 != 0) return std::nullopt;
  std::vector<uint8_t> out(hex.size() / 2);
  for (size_t i = 0; i < out.size(); ++i) {
    const int hi = Nibble(hex[2 * i]);
    const int lo = Nibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out[i] = static_cast<uint8_t>(hi << 4 | lo);
  }
  return out;
}

// ---- Hex digit decoder ----
template <char C>
inline consteval uint8_t HexValue() {
  constexpr bool valid = (C >= '0' && C <= '9') || (C >= 'a' && C <= 'f') || (C >= 'A' && C <= 'F');
  static_assert(valid, "Invalid hex digit.");

  if constexpr (C >= '0' && C <= '9')
    return C - '0';
  else if constexpr (C >= 'a' && C <= 'f')
    return C - 'a' + 10;
  else
    return C - 'A' + 10;
}

// ---- Index sequence helper ----
template <size_t N, typename F>
inline consteval auto ApplyToSequence(F&& f) {
  return [&]<size_t... I>(std::index_sequence<I...>) {
    // Forward as template parameters
    return f.template operator()<I...>();
  }(std::make_index_sequence<N>{});
}

// ---- Hex decoder engine ----
template <char... Cs>
inline consteval auto DecodeHexString(bool reverse = true) {
  static_assert(sizeof...(Cs) % 2 == 0, "Hex string must have even length.");
  constexpr char str[] = {Cs...};
  constexpr int length = sizeof...(Cs) / 2;
  return [&]<size_t... I>(std::index_sequence<I...>) {
    std::array<uint8_t, length> result = {};
    ((result[reverse ? length - 1 - I : I] = HexValue<str[2 * I]>() << 4 |
                                             HexValue<str[2 * I + 1]>()),
     ...);
    return result;
  }(std::make_index_sequence<length>{});
}

// ---- Hex digit filtering ----

template <char c>
inline consteval bool IsWhitespace() {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

// Forward declaration of recursive metafunction.
template <typename Accum, char... Cs>
struct FilterHexImpl;

// Base case: no input chars left, output array is the accumulated chars.
template <char... Accum>
struct FilterHexImpl<std::integer_sequence<char, Accum...>> {
  inline static constexpr std::array<char, sizeof...(Accum)> value{Accum...};
};

// Recursive case: skip whitespace, keep other characters, recurse on Tail.
template <char... Accum, char Head, char... Tail>
struct FilterHexImpl<std::integer_sequence<char, Accum...>, Head, Tail...> {
  using Next = std::conditional_t<IsWhitespace<Head>(), std::integer_sequence<char, Accum...>,
                                  std::integer_sequence<char, Accum..., Head>>;
  inline static constexpr auto value = FilterHexImpl<Next, Tail...>::value;
};

template <char... Cs>
inline consteval auto StripWhitespace() {
  return FilterHexImpl<std::integer_sequence<char>, Cs...>::value;
}

// ---- HexLiteral wrapper ----
template <int kChars>
struct HexLiteral {
  std::array<char, kChars> chars;

  consteval HexLiteral(const char (&input)[kChars]) : chars{} {
    std::copy(input, input + kChars, chars.begin());
  }
};

}  // namespace util

// _bytes: variable-length, memory order, strips whitespace, returns std::array<uint8_t, N>.
template <util::HexLiteral H>
inline consteval auto operator""_bytes() {
  constexpr auto& chars = H.chars;
  return util::ApplyToSequence<chars.size() - 1>([&]<size_t... I>() {
    constexpr auto filtered = util::StripWhitespace<chars[I]...>();
    return util::ApplyToSequence<filtered.size()>(
        [&]<size_t... J>() { return util::DecodeHexString<filtered[J]...>(/*reverse=*/false); });
  });
}

}  // namespace sigil
