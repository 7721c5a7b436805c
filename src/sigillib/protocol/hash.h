// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <cstring>
#include <functional>
#include <iomanip>
#include <ios>
#include <ostream>

namespace sigil::protocol {

// Represents a 256-bit hash, as a 32-byte array in little-endian order.
struct Hash : public std::array<uint8_t, 32> {
  using Base = std::array<uint8_t, 32>;
  constexpr Hash() : Base{} {}
  constexpr Hash(std::array<uint8_t, 32> x) : Base{x} {}
  bool IsNull() const {
    return *this == Hash{};
  }
  explicit operator bool() const { return !IsNull(); }
  std::strong_ordering operator<=>(const Hash& b) const {
    return std::memcmp(data(), b.data(), sizeof(Hash)) <=> 0;
  }
  bool operator==(const Hash& b) const {
    return std::memcmp(data(), b.data(), sizeof(Hash)) == 0;
  }
  // Writes the hash in display order, i.e. most significant byte first.
  friend std::ostream& operator <<(std::ostream& os, const protocol::Hash& hash) {
    const std::ios_base::fmtflags flags(os.flags());
    for (int i = sizeof(hash) - 1; i >= 0; --i)
      os << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    os.flags(flags);
    return os;
  }
};

}  // namespace sigil::protocol

namespace std {

template <>
struct hash<sigil::protocol::Hash> {
  size_t operator()(const sigil::protocol::Hash& h) const noexcept {
    static_assert(sizeof(sigil::protocol::Hash) == 32);
    size_t result;
    std::memcpy(&result, h.data(), sizeof(result));
    return result;
  }
};

}  // namespace std
