// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include "sigillib/protocol/script/runtime/context.h"

namespace sigil::protocol::script::runtime {

// Pops the top item and succeeds only if it is truthy. Throws on an empty stack.
inline bool PopVerify(Context& context) {
  const bool ok = context.Stack().TopAsBool();
  context.Stack().Pop();
  return ok;
}

}  // namespace sigil::protocol::script::runtime
