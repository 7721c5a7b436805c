// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include <cstdint>
#include <utility>

#include "sigillib/protocol/script/lang/op.h"
#include "sigillib/protocol/script/lang/types.h"
#include "sigillib/protocol/script/runtime/catalog.h"
#include "sigillib/protocol/script/runtime/context.h"
#include "sigillib/util/throw.h"

namespace sigil::protocol::script::runtime {

// Op::PushEmpty
static bool OnPushEmpty(Context& context) {
  context.Push(lang::Bytes{});
  return true;
}

// Op::PushConstNegative1 ... Op::PushConst16
template <int8_t N>
static bool OnPushConst(Context& context) {
  context.Stack().PushInt(N);
  return true;
}

// Registers OP_1 ... OP_16.
template <int8_t... I>
static void RegisterPushConsts(Catalog& catalog, std::integer_sequence<int8_t, I...>) {
  (catalog.Register(lang::ImmediateToOp(I + 1), util::ToString("OP_", I + 1),
                    &OnPushConst<I + 1>),
   ...);
}

void RegisterPushOps(Catalog& catalog) {
  catalog.Register(lang::Op::PushEmpty, "OP_0", &OnPushEmpty);
  catalog.Register(lang::Op::PushConstNegative1, "OP_1NEGATE", &OnPushConst<-1>);
  RegisterPushConsts(catalog, std::make_integer_sequence<int8_t, 16>{});
}

}  // namespace sigil::protocol::script::runtime
