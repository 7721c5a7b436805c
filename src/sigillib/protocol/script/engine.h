// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sigillib/consensus/utxo.h"
#include "sigillib/protocol/script/lang/types.h"
#include "sigillib/protocol/script/runtime/operation.h"
#include "sigillib/protocol/script/runtime/stack.h"
#include "sigillib/protocol/transaction.h"
#include "sigillib/util/expected.h"

namespace sigil::protocol::script {

// A parsed script program: the unlocking script followed by the locking script, as one ordered
// sequence of operations, together with the payment address found in it (if any).
//
// An Engine is immutable once parsed. Each call to Execute runs in a fresh runtime::Context,
// so one Engine may be executed repeatedly and from several threads at once.
class Engine {
 public:
  using Program = std::vector<std::shared_ptr<const runtime::Operation>>;

  // Called after each operation with its zero-based step index, the operation, whether it
  // succeeded, and the stack as it was left.
  using Tracer = std::function<void(int step, const runtime::Operation& operation, bool ok,
                                    const runtime::Stack& stack)>;

  explicit Engine(Program program, std::string address = {})
      : program_(std::move(program)), address_(std::move(address)) {}

  // Decodes the concatenation of the unlocking and locking scripts into a program.
  // Fails on an unsupported opcode or a push that runs past the end of the stream.
  // A failure of the crypto library while deriving the address propagates as
  // std::runtime_error.
  static util::Expected<Engine, lang::ParseError> Parse(lang::Bytes unlocking,
                                                        lang::Bytes locking);

  const Program& Operations() const {
    return program_;
  }

  // The address of the first 20-byte or 65-byte push in the program, or "" if there is none.
  const std::string& ExtractedAddress() const {
    return address_;
  }

  // Runs the program against the given input of the transaction. Returns true iff every
  // operation succeeds and the item left on top of the stack is truthy. Script faults yield
  // false; only a failure of the crypto library itself escapes, as std::runtime_error.
  bool Execute(const protocol::Transaction& transaction, int input_index,
               const consensus::UtxoSnapshot& utxos, const Tracer& tracer = {}) const;

  // A listing of the program, one operation per line between BEGIN and END markers.
  std::string Describe() const;

 private:
  Program program_;
  std::string address_;
};

}  // namespace sigil::protocol::script
