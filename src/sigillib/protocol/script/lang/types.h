// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <cstdint>
#include <ostream>
#include <span>
#include <string_view>

#include "sigillib/protocol/script/lang/op.h"

namespace sigil::protocol::script::lang {

using Bytes = std::span<const uint8_t>;

enum class Error {
  // Parse errors: the byte stream is not a representable program.
  UnsupportedOpcode,
  TruncatedPush,

  // Execution faults: the program is well-formed but fails to run to completion.
  StackUnderflow,
  NumberOverflow,
  InvalidPubkeyCount,
  InvalidSignatureCount
};

inline std::string_view ToString(Error error) {
  switch (error) {
    case Error::UnsupportedOpcode:
      return "unsupported opcode";
    case Error::TruncatedPush:
      return "truncated push";
    case Error::StackUnderflow:
      return "stack underflow";
    case Error::NumberOverflow:
      return "number overflow";
    case Error::InvalidPubkeyCount:
      return "invalid public key count";
    case Error::InvalidSignatureCount:
      return "invalid signature count";
  }
  return "unknown error";
}

// One decoded element of a script byte stream: an opcode byte, and for a push, its payload.
struct Instruction {
  uint8_t opcode;
  Bytes data;  // Empty unless the opcode is a push size.
  int offset;  // Offset of the opcode byte within the stream.
};

// Describes why a byte stream could not be parsed into a program.
struct ParseError {
  Error error;
  int offset;      // Offset of the offending opcode in the concatenated stream.
  uint8_t opcode;  // The offending opcode byte.

  bool operator ==(const ParseError&) const = default;
};

inline std::ostream& operator <<(std::ostream& os, const ParseError& e) {
  return os << ToString(e.error) << " (opcode 0x" << std::hex << int(e.opcode) << std::dec
            << " at offset " << e.offset << ")";
}

}  // namespace sigil::protocol::script::lang
