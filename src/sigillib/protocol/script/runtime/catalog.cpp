// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include "sigillib/protocol/script/runtime/catalog.h"

#include <memory>
#include <utility>

#include "sigillib/protocol/script/lang/op.h"
#include "sigillib/util/throw.h"

namespace sigil::protocol::script::runtime {

const Catalog& Catalog::Instance() {
  static const Catalog kCatalog = [] {
    Catalog catalog;
    RegisterPushOps(catalog);
    RegisterControlOps(catalog);
    RegisterStackOps(catalog);
    RegisterBitwiseOps(catalog);
    RegisterArithmeticOps(catalog);
    RegisterCryptoOps(catalog);
    return catalog;
  }();
  return kCatalog;
}

void Catalog::Register(lang::Op op, std::string name, Handler handler) {
  const uint8_t byte = lang::ToByte(op);
  if (lang::IsPushSize(byte))
    util::ThrowInvalidArgument("Opcode byte ", int(byte), " is reserved for data pushes.");
  if (table_[byte] != nullptr)
    util::ThrowLogicError("Opcode byte ", int(byte), " registered twice (", name, ").");
  table_[byte] = std::make_shared<const Opcode>(op, std::move(name), handler);
}

}  // namespace sigil::protocol::script::runtime
