// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include "sigillib/protocol/script/lang/op.h"
#include "sigillib/protocol/script/runtime/catalog.h"
#include "sigillib/protocol/script/runtime/context.h"
#include "sigillib/protocol/script/runtime/ops/verify.h"

namespace sigil::protocol::script::runtime {

// Op::Nop
static bool OnNop(Context&) {
  return true;
}

// Op::Verify
static bool OnVerify(Context& context) {
  return PopVerify(context);
}

// Op::Return marks the output as unspendable.
static bool OnReturn(Context&) {
  return false;
}

void RegisterControlOps(Catalog& catalog) {
  catalog.Register(lang::Op::Nop, "OP_NOP", &OnNop);
  catalog.Register(lang::Op::Verify, "OP_VERIFY", &OnVerify);
  catalog.Register(lang::Op::Return, "OP_RETURN", &OnReturn);
}

}  // namespace sigil::protocol::script::runtime
