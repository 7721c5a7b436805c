// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>

#include "sigillib/encoding/endian.h"
#include "sigillib/util/throw.h"

namespace sigil::encoding {

// Reads wire-format fields from a borrowed byte buffer. Every read either consumes exactly the
// bytes it needs or throws std::out_of_range without advancing.
class Reader {
 public:
  explicit Reader(std::span<const uint8_t> buffer) : buffer_(buffer) {}

  size_t GetPos() const {
    return pos_;
  }

  size_t Remaining() const {
    return buffer_.size() - pos_;
  }

  bool IsEOF() const {
    return Remaining() == 0;
  }

  uint8_t ReadByte() {
    return Take(1)[0];
  }

  std::span<const uint8_t> ReadBytes(size_t len) {
    return Take(len);
  }

  void ReadBytes(std::span<uint8_t> out) {
    std::ranges::copy(Take(out.size()), out.begin());
  }

  // Reads a CompactSize length followed by that many bytes, e.g. a script.
  std::span<const uint8_t> ReadVarBytes() {
    return Take(ReadVarInt<size_t>());
  }

  template <std::integral T>
  T ReadLE() {
    T value;
    std::memcpy(&value, Take(sizeof(T)).data(), sizeof(T));
    return LittleEndianToNative(value);
  }

  template <std::integral T>
  void ReadLE4(T& t) {
    t = NarrowOrThrow<T>(ReadLE<uint32_t>());
  }

  // Eight bytes, two's complement when T is signed.
  template <std::integral T>
  void ReadLE8(T& t) {
    const uint64_t raw = ReadLE<uint64_t>();
    if constexpr (std::signed_integral<T>)
      t = NarrowOrThrow<T>(static_cast<int64_t>(raw));
    else
      t = NarrowOrThrow<T>(raw);
  }

  // Bitcoin CompactSize: one byte below 0xFD, else a marker and 2, 4 or 8 bytes.
  template <std::unsigned_integral T = uint64_t>
  T ReadVarInt() {
    switch (const uint8_t prefix = ReadByte()) {
      case 0xFD:
        return NarrowOrThrow<T>(ReadLE<uint16_t>());
      case 0xFE:
        return NarrowOrThrow<T>(ReadLE<uint32_t>());
      case 0xFF:
        return NarrowOrThrow<T>(ReadLE<uint64_t>());
      default:
        return prefix;
    }
  }

 private:
  std::span<const uint8_t> Take(size_t len) {
    if (len > Remaining())
      util::ThrowOutOfRange("Read of ", len, " bytes exceeds buffer size at offset ", pos_, ".");
    const auto span = buffer_.subspan(pos_, len);
    pos_ += len;
    return span;
  }

  std::span<const uint8_t> buffer_;
  size_t pos_ = 0;
};

}  // namespace sigil::encoding
