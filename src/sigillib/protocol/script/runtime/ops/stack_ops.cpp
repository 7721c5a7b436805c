// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include <cstdint>
#include <vector>

#include "sigillib/protocol/script/lang/op.h"
#include "sigillib/protocol/script/runtime/catalog.h"
#include "sigillib/protocol/script/runtime/context.h"
#include "sigillib/protocol/script/runtime/stack.h"

namespace sigil::protocol::script::runtime {

namespace detail {
inline static std::vector<uint8_t> Copy(lang::Bytes bytes) {
  return {bytes.begin(), bytes.end()};
}
}  // namespace detail

// Op::Drop2
static bool OnDrop2(Context& context) {
  context.Stack().Pop(2);
  return true;
}

// Op::Duplicate2: (x1 x2 -- x1 x2 x1 x2)
static bool OnDuplicate2(Context& context) {
  auto& stack = context.Stack();
  const auto x1 = detail::Copy(stack.At(1));
  const auto x2 = detail::Copy(stack.At(0));
  stack.Push(x1).Push(x2);
  return true;
}

// Op::Depth
static bool OnDepth(Context& context) {
  auto& stack = context.Stack();
  stack.PushInt(stack.Size());
  return true;
}

// Op::Drop
static bool OnDrop(Context& context) {
  context.Stack().Pop();
  return true;
}

// Op::Duplicate
static bool OnDuplicate(Context& context) {
  context.Stack().Push(context.Stack().Top());
  return true;
}

// Op::Nip: (x1 x2 -- x2)
static bool OnNip(Context& context) {
  const auto x2 = context.Pop();
  context.Stack().Pop();
  context.Push(x2);
  return true;
}

// Op::Over: (x1 x2 -- x1 x2 x1)
static bool OnOver(Context& context) {
  context.Stack().Push(context.Stack().At(1));
  return true;
}

// Op::Swap: (x1 x2 -- x2 x1)
static bool OnSwap(Context& context) {
  const auto x2 = context.Pop();
  const auto x1 = context.Pop();
  context.Push(x2);
  context.Push(x1);
  return true;
}

// Op::Size pushes the byte length of the top item, leaving the item in place.
static bool OnSize(Context& context) {
  auto& stack = context.Stack();
  stack.PushInt(static_cast<int32_t>(stack.Top().size()));
  return true;
}

void RegisterStackOps(Catalog& catalog) {
  catalog.Register(lang::Op::Drop2, "OP_2DROP", &OnDrop2);
  catalog.Register(lang::Op::Duplicate2, "OP_2DUP", &OnDuplicate2);
  catalog.Register(lang::Op::Depth, "OP_DEPTH", &OnDepth);
  catalog.Register(lang::Op::Drop, "OP_DROP", &OnDrop);
  catalog.Register(lang::Op::Duplicate, "OP_DUP", &OnDuplicate);
  catalog.Register(lang::Op::Nip, "OP_NIP", &OnNip);
  catalog.Register(lang::Op::Over, "OP_OVER", &OnOver);
  catalog.Register(lang::Op::Swap, "OP_SWAP", &OnSwap);
  catalog.Register(lang::Op::Size, "OP_SIZE", &OnSize);
}

}  // namespace sigil::protocol::script::runtime
