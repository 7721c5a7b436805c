// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <cassert>
#include <compare>
#include <cstdint>

namespace sigil::protocol::script::lang {

// The set of script opcodes known to the interpreter.
enum class Op : uint8_t {
  // Pushes nothing / empty / null / zero.
  PushEmpty = 0x00,        // Pushes the empty set.

  // Pushes arbitrary data.
  PushSize1 = 0x01,       // Pushes the next one byte of data.
  // ... contiguous up to ...
  PushSize20 = 0x14,      // Pushes the next 20 bytes of data, e.g. a Hash160.
  PushSize33 = 0x21,      // Pushes the next 33 bytes of data, e.g. a compressed public key.
  PushSize65 = 0x41,      // Pushes the next 65 bytes of data, e.g. an uncompressed public key.
  PushSizeMax = 0x4b,     // Pushes the next 75 bytes of data. (= Push1 + 74)
  PushData1 = 0x4c,       // Not supported: length-prefixed pushes.
  PushData2 = 0x4d,
  PushData4 = 0x4e,

  // Pushes immediate integer constants.
  PushConstNegative1 = 0x4f,  // Pushes the immediate integer -1.
  PushConst0 = PushEmpty,     // Pushes the immediate value zero.
  PushConst1 = 0x51,          // Pushes the immediate integer 1.
  // ... contiguous up to ...
  PushConst16 = 0x60,         // Pushes the immediate integer 16.
  PushConstMin = PushConstNegative1,
  PushConstMax = PushConst16,

  // Pushes immediate Boolean constants.
  PushFalse = PushConst0,     // Pushes the immediate Boolean FALSE.
  PushTrue = PushConst1,      // Pushes the immediate Boolean TRUE.

  // Control operations.
  Nop = 0x61,
  Verify = 0x69,
  Return = 0x6a,

  // Stack operations.
  Drop2 = 0x6d,
  Duplicate2 = 0x6e,
  Depth = 0x74,
  Drop = 0x75,
  Duplicate = 0x76,
  Nip = 0x77,
  Over = 0x78,
  Swap = 0x7c,
  Size = 0x82,

  // Bitwise operations.
  Equal = 0x87,
  EqualVerify = 0x88,

  // Arithmetic operations.
  Add1 = 0x8b,
  Sub1 = 0x8c,
  Negate = 0x8f,
  Not = 0x91,
  NotEqual0 = 0x92,
  Add = 0x93,
  Sub = 0x94,
  NumEqual = 0x9c,
  NumEqualVerify = 0x9d,
  LessThan = 0x9f,
  GreaterThan = 0xa0,
  Min = 0xa3,
  Max = 0xa4,

  // Hashing opcodes.
  Ripemd160 = 0xa6,
  Sha256 = 0xa8,
  Hash160 = 0xa9,
  Hash256 = 0xaa,
  CodeSeparator = 0xab,

  // Check signature opcodes.
  CheckSig = 0xac,
  CheckSigVerify = 0xad,
  CheckMultiSig = 0xae,
  CheckMultiSigVerify = 0xaf
};

inline constexpr int kImmediateMin = -1;

inline constexpr uint8_t ToByte(Op op) {
  return uint8_t(op);
}

inline constexpr std::strong_ordering operator <=>(Op lhs, Op rhs) {
  return ToByte(lhs) <=> ToByte(rhs);
}

inline constexpr int operator -(Op lhs, Op rhs) {
  return ToByte(lhs) - ToByte(rhs);
}

inline constexpr Op operator +(Op lhs, int rhs) {
  return Op(ToByte(lhs) + rhs);
}

inline constexpr Op& operator++(Op& op) {
  return op = op + 1;
}

inline constexpr bool IsImmediate(int value) {
  return value >= kImmediateMin && value <= kImmediateMin + (Op::PushConstMax - Op::PushConstMin);
}

inline constexpr bool IsImmediate(Op opcode) {
  return opcode >= Op::PushConstMin && opcode <= Op::PushConstMax;
}

inline constexpr Op ImmediateToOp(int value) {
  assert(IsImmediate(value));
  return value == 0 ? Op::PushConst0 : Op::PushConstMin + (value - kImmediateMin);
}

// Returns true for the opcodes whose byte value is itself the length of the data that follows.
inline constexpr bool IsPushSize(uint8_t byte) {
  return byte >= ToByte(Op::PushSize1) && byte <= ToByte(Op::PushSizeMax);
}

}  // namespace sigil::protocol::script::lang
