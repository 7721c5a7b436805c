// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>

#include "sigillib/protocol/script/lang/op.h"
#include "sigillib/protocol/script/runtime/operation.h"

namespace sigil::protocol::script::runtime {

// The process-wide table of named opcodes, keyed by opcode byte. Built once on first use and
// read-only afterwards, so lookups are safe from any thread.
class Catalog {
 public:
  static const Catalog& Instance();

  // Returns the operation registered for the byte, or nullptr if none is.
  std::shared_ptr<const Opcode> Lookup(uint8_t byte) const {
    return table_[byte];
  }

  std::shared_ptr<const Opcode> Lookup(lang::Op op) const {
    return Lookup(lang::ToByte(op));
  }

  bool Contains(uint8_t byte) const {
    return table_[byte] != nullptr;
  }

  void Register(lang::Op op, std::string name, Handler handler);

 private:
  Catalog() = default;
  std::array<std::shared_ptr<const Opcode>, 256> table_;
};

// Each opcode family registers its handlers. Defined in ops/*.cpp.
void RegisterPushOps(Catalog& catalog);
void RegisterControlOps(Catalog& catalog);
void RegisterStackOps(Catalog& catalog);
void RegisterBitwiseOps(Catalog& catalog);
void RegisterArithmeticOps(Catalog& catalog);
void RegisterCryptoOps(Catalog& catalog);

}  // namespace sigil::protocol::script::runtime
