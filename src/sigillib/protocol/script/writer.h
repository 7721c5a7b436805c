// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <vector>

#include "sigillib/protocol/script/lang/minimal.h"
#include "sigillib/protocol/script/lang/op.h"
#include "sigillib/util/throw.h"

namespace sigil::protocol::script {

// Assembles script bytes, e.g. Writer{}.Then(Op::Duplicate).Then(Op::Hash160).PushData(h).
class Writer {
 public:
  operator std::span<const uint8_t>() const {
    return bytes_;
  }

  const std::vector<uint8_t>& Script() const {
    return bytes_;
  }

  // Writes an instruction to push the given data onto the execution stack.
  // Only direct pushes of up to 75 bytes are representable.
  Writer& PushData(std::span<const uint8_t> data) {
    using lang::Op;
    if (data.empty())
      *this << Op::PushConst0;
    else if (data.size() <= ToByte(Op::PushSizeMax))
      *this << Op::PushSize1 + int(data.size() - 1) << data;
    else
      util::ThrowInvalidArgument("Push of ", data.size(), " bytes exceeds the ",
                                 int(ToByte(Op::PushSizeMax)), " byte limit.");
    return *this;
  }

  // Writes an instruction to push the given integer onto the execution stack.
  Writer& PushInt(int32_t value) {
    // If the value is in [-1, 16], push as immediate data in an opcode.
    if (lang::IsImmediate(value))
      *this << lang::ImmediateToOp(value);
    else
      PushData(lang::EncodeMinimalInt(value));
    return *this;
  }

  Writer& Then(lang::Op opcode) {
    return *this << opcode;
  }

  // Writes a raw byte, e.g. an opcode that the interpreter does not support.
  Writer& Raw(uint8_t byte) {
    return *this << byte;
  }

 private:
  Writer& operator<<(uint8_t value) {
    bytes_.push_back(value);
    return *this;
  }

  Writer& operator<<(lang::Op opcode) {
    return *this << ToByte(opcode);
  }

  Writer& operator<<(std::span<const uint8_t> data) {
    bytes_.insert(bytes_.end(), data.begin(), data.end());
    return *this;
  }

  std::vector<uint8_t> bytes_;
};

}  // namespace sigil::protocol::script
