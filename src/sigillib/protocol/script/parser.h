// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <optional>
#include <span>

#include "sigillib/protocol/script/lang/op.h"
#include "sigillib/protocol/script/lang/types.h"

namespace sigil::protocol::script {

// Tokenizes a script byte stream into instructions. A byte in [1, 75] is a push of that many
// following bytes; any other byte is a bare opcode, whether or not it is supported.
class Parser {
 public:
  using Iterator = lang::Bytes::iterator;

  Parser(lang::Bytes bytes) : script_(bytes), cursor_(bytes.begin()) {}

  // Returns the next instruction, or nullopt at the end of the stream or after a push that
  // runs past the end, in which case Error() is set.
  std::optional<lang::Instruction> Next() {
    if (cursor_ >= script_.end()) return std::nullopt;

    const auto it_opcode = cursor_;
    const uint8_t opcode = *it_opcode;
    const int offset = int(it_opcode - script_.begin());
    const int payload_bytes = lang::IsPushSize(opcode) ? opcode : 0;
    const auto it_payload = it_opcode + 1;
    if (payload_bytes > script_.end() - it_payload) {
      error_ = lang::ParseError{lang::Error::TruncatedPush, offset, opcode};
      cursor_ = script_.end();
      return std::nullopt;
    }
    cursor_ = it_payload + payload_bytes;
    return lang::Instruction{.opcode = opcode,
      .data = {payload_bytes > 0 ? &*it_payload : nullptr, size_t(payload_bytes)},
      .offset = offset};
  }

  std::optional<uint8_t> Peek() const {
    if (cursor_ >= script_.end()) return std::nullopt;
    return *cursor_;
  }

  const std::optional<lang::ParseError>& Error() const {
    return error_;
  }

  lang::Bytes Script() const {
    return script_;
  }

 private:
  lang::Bytes script_;
  Iterator cursor_;
  std::optional<lang::ParseError> error_;
};

}  // namespace sigil::protocol::script
