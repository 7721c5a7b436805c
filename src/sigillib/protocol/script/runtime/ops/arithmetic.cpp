// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include <algorithm>
#include <cstdint>

#include "sigillib/protocol/script/lang/types.h"
#include "sigillib/protocol/script/runtime/catalog.h"
#include "sigillib/protocol/script/runtime/context.h"
#include "sigillib/protocol/script/runtime/ops/verify.h"

namespace sigil::protocol::script::runtime {

using lang::Op;

template <typename Fn>
inline void UnaryInt32(Context& context, Fn&& f) {
  auto& stack = context.Stack();
  const int64_t x = stack.Int32(0);
  const int64_t out = f(x);
  stack.Pop().PushInt(out);
}

template <typename Fn>
inline void BinaryInt32(Context& context, Fn&& f) {
  auto& stack = context.Stack();

  // Decode the stack items into integer format.
  const int64_t x1 = stack.Int32(1);
  const int64_t x2 = stack.Int32(0);

  // Compute the binary function.
  const int64_t out = f(x1, x2);

  // Pop the inputs and push the output.
  stack.Pop(2).PushInt(out);
}

// Op::Add1
static bool OnAdd1(Context& context) {
  UnaryInt32(context, [](int64_t a) { return a + 1; });
  return true;
}

// Op::Sub1
static bool OnSub1(Context& context) {
  UnaryInt32(context, [](int64_t a) { return a - 1; });
  return true;
}

// Op::Negate
static bool OnNegate(Context& context) {
  UnaryInt32(context, [](int64_t a) { return -a; });
  return true;
}

// Op::Not
static bool OnNot(Context& context) {
  UnaryInt32(context, [](int64_t a) { return int64_t{a == 0}; });
  return true;
}

// Op::NotEqual0
static bool OnNotEqual0(Context& context) {
  UnaryInt32(context, [](int64_t a) { return int64_t{a != 0}; });
  return true;
}

// Op::Add
static bool OnAdd(Context& context) {
  BinaryInt32(context, [](int64_t a, int64_t b) { return a + b; });
  return true;
}

// Op::Sub
static bool OnSub(Context& context) {
  BinaryInt32(context, [](int64_t a, int64_t b) { return a - b; });
  return true;
}

// Op::NumEqual
static bool OnNumEqual(Context& context) {
  BinaryInt32(context, [](int64_t a, int64_t b) { return int64_t{a == b}; });
  return true;
}

// Op::NumEqualVerify
static bool OnNumEqualVerify(Context& context) {
  return OnNumEqual(context) && PopVerify(context);
}

// Op::LessThan
static bool OnLessThan(Context& context) {
  BinaryInt32(context, [](int64_t a, int64_t b) { return int64_t{a < b}; });
  return true;
}

// Op::GreaterThan
static bool OnGreaterThan(Context& context) {
  BinaryInt32(context, [](int64_t a, int64_t b) { return int64_t{a > b}; });
  return true;
}

// Op::Min
static bool OnMin(Context& context) {
  BinaryInt32(context, [](int64_t a, int64_t b) { return std::min(a, b); });
  return true;
}

// Op::Max
static bool OnMax(Context& context) {
  BinaryInt32(context, [](int64_t a, int64_t b) { return std::max(a, b); });
  return true;
}

void RegisterArithmeticOps(Catalog& catalog) {
  catalog.Register(Op::Add1, "OP_1ADD", &OnAdd1);
  catalog.Register(Op::Sub1, "OP_1SUB", &OnSub1);
  catalog.Register(Op::Negate, "OP_NEGATE", &OnNegate);
  catalog.Register(Op::Not, "OP_NOT", &OnNot);
  catalog.Register(Op::NotEqual0, "OP_0NOTEQUAL", &OnNotEqual0);
  catalog.Register(Op::Add, "OP_ADD", &OnAdd);
  catalog.Register(Op::Sub, "OP_SUB", &OnSub);
  catalog.Register(Op::NumEqual, "OP_NUMEQUAL", &OnNumEqual);
  catalog.Register(Op::NumEqualVerify, "OP_NUMEQUALVERIFY", &OnNumEqualVerify);
  catalog.Register(Op::LessThan, "OP_LESSTHAN", &OnLessThan);
  catalog.Register(Op::GreaterThan, "OP_GREATERTHAN", &OnGreaterThan);
  catalog.Register(Op::Min, "OP_MIN", &OnMin);
  catalog.Register(Op::Max, "OP_MAX", &OnMax);
}

}  // namespace sigil::protocol::script::runtime
