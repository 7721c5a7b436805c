// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <concepts>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>
#include <vector>

#include "sigillib/encoding/endian.h"

namespace sigil::encoding {

// Appends wire-format fields to an owned, growable buffer.
// Each Write method returns the offset at which its field begins.
class Writer {
 public:
  size_t WriteByte(uint8_t byte) {
    const size_t pos = GetPos();
    buffer_.push_back(byte);
    return pos;
  }

  size_t WriteBytes(std::span<const uint8_t> bytes) {
    const size_t pos = GetPos();
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    return pos;
  }

  // Writes a CompactSize length followed by the bytes themselves.
  size_t WriteVarBytes(std::span<const uint8_t> bytes) {
    const size_t pos = WriteVarInt(bytes.size());
    WriteBytes(bytes);
    return pos;
  }

  template <std::integral T>
  size_t WriteLE(T value) {
    const T le = NativeToLittleEndian(value);
    uint8_t bytes[sizeof(T)];
    std::memcpy(bytes, &le, sizeof(T));
    return WriteBytes(bytes);
  }

  template <std::integral T>
  size_t WriteLE4(T value) {
    return WriteLE(NarrowOrThrow<uint32_t>(value));
  }

  // Eight bytes, two's complement for signed values.
  template <std::integral T>
  size_t WriteLE8(T value) {
    return WriteLE(static_cast<uint64_t>(value));
  }

  template <std::unsigned_integral T>
  size_t WriteVarInt(T value) {
    if (value < 0xFD) return WriteByte(static_cast<uint8_t>(value));
    size_t pos;
    if (value <= 0xFFFF) {
      pos = WriteByte(0xFD);
      WriteLE(static_cast<uint16_t>(value));
    } else if (value <= 0xFFFFFFFF) {
      pos = WriteByte(0xFE);
      WriteLE(static_cast<uint32_t>(value));
    } else {
      pos = WriteByte(0xFF);
      WriteLE(static_cast<uint64_t>(value));
    }
    return pos;
  }

  size_t GetPos() const {
    return buffer_.size();
  }

  const std::vector<uint8_t>& Buffer() const {
    return buffer_;
  }

  std::vector<uint8_t> ReleaseBuffer() {
    return std::move(buffer_);
  }

  void Clear() {
    buffer_.clear();
  }

 private:
  std::vector<uint8_t> buffer_;
};

}  // namespace sigil::encoding
