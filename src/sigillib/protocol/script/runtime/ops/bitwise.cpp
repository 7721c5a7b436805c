// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include <algorithm>

#include "sigillib/protocol/script/lang/types.h"
#include "sigillib/protocol/script/runtime/catalog.h"
#include "sigillib/protocol/script/runtime/context.h"
#include "sigillib/protocol/script/runtime/ops/verify.h"

namespace sigil::protocol::script::runtime {

using lang::Op;

template <typename Fn>
inline void BinaryBitwise(Context& context, Fn&& f) {
  auto& stack = context.Stack();

  // Retrieve the stack items as references to the internal data.
  const auto x1 = stack.At(1);
  const auto x2 = stack.At(0);

  // Compute the binary function.
  const bool out = f(x1, x2);

  // Pop the inputs and push the output.
  stack.Pop(2).Push(out);
}

// Op::Equal
static bool OnEqual(Context& context) {
  BinaryBitwise(context, [](const auto& a, const auto& b) {
    return std::ranges::equal(a, b);
  });
  return true;
}

// Op::EqualVerify
static bool OnEqualVerify(Context& context) {
  return OnEqual(context) && PopVerify(context);
}

void RegisterBitwiseOps(Catalog& catalog) {
  catalog.Register(Op::Equal, "OP_EQUAL", &OnEqual);
  catalog.Register(Op::EqualVerify, "OP_EQUALVERIFY", &OnEqualVerify);
}

}  // namespace sigil::protocol::script::runtime
