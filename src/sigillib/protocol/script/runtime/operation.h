// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "sigillib/protocol/script/lang/op.h"
#include "sigillib/protocol/script/lang/types.h"
#include "sigillib/protocol/script/runtime/context.h"
#include "sigillib/util/hex.h"
#include "sigillib/util/throw.h"

namespace sigil::protocol::script::runtime {

// One step of a parsed program. Operations are immutable and hold no per-run state, so a
// single instance may be shared by any number of programs and concurrent executions.
class Operation {
 public:
  virtual ~Operation() = default;

  // Applies the operation to the context. Returns false for a logical failure. Faults such as
  // stack underflow are thrown as runtime::Exception.
  virtual bool Execute(Context& context) const = 0;

  // A one-line human-readable rendering, e.g. "OP_DUP".
  virtual std::string ToString() const = 0;
};

using Handler = bool (*)(Context& context);

// A named catalog operation, dispatched to a stateless handler function.
class Opcode final : public Operation {
 public:
  Opcode(lang::Op op, std::string name, Handler handler)
      : op_(op), name_(std::move(name)), handler_(handler) {}

  bool Execute(Context& context) const override {
    return handler_(context);
  }

  std::string ToString() const override {
    return name_;
  }

  lang::Op Op() const {
    return op_;
  }

 private:
  lang::Op op_;
  std::string name_;
  Handler handler_;
};

// Pushes a literal of 1 to 75 bytes. Always succeeds.
class DataPush final : public Operation {
 public:
  explicit DataPush(lang::Bytes data) : data_(data.begin(), data.end()) {}

  bool Execute(Context& context) const override {
    context.Push(data_);
    return true;
  }

  std::string ToString() const override {
    return util::ToString("PUSH(", data_.size(), ") ", util::ToHex(data_));
  }

  lang::Bytes Data() const {
    return data_;
  }

 private:
  std::vector<uint8_t> data_;
};

}  // namespace sigil::protocol::script::runtime
