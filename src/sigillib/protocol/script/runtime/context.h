// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <cstdint>
#include <vector>

#include "sigillib/consensus/utxo.h"
#include "sigillib/protocol/hash.h"
#include "sigillib/protocol/script/lang/types.h"
#include "sigillib/protocol/script/runtime/stack.h"
#include "sigillib/protocol/transaction.h"

namespace sigil::protocol::script::runtime {

// The mutable state of one script execution: the operand stack, plus read-only access to the
// transaction under validation and the outputs it spends. A Context is created per run and
// never shared.
class Context {
 public:
  Context(const protocol::Transaction& transaction, int input_index,
          const consensus::UtxoSnapshot& utxos)
      : transaction_(transaction), input_index_(input_index), utxos_(utxos) {}
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  void Push(lang::Bytes bytes) {
    stack_.Push(bytes);
  }

  // Removes and returns the top item. Throws a StackUnderflow fault if the stack is empty.
  std::vector<uint8_t> Pop() {
    const lang::Bytes top = stack_.Top();
    std::vector<uint8_t> item(top.begin(), top.end());
    stack_.Pop();
    return item;
  }

  lang::Bytes Top() const {
    return stack_.Top();
  }

  runtime::Stack& Stack() {
    return stack_;
  }
  const runtime::Stack& Stack() const {
    return stack_;
  }

  const protocol::Transaction& Transaction() const {
    return transaction_;
  }

  int InputIndex() const {
    return input_index_;
  }

  // Looks up a previously unspent output. Returns nullptr when it is not in the snapshot.
  const protocol::Output* Utxo(const protocol::OutPoint& outpoint) const {
    return utxos_.Find(outpoint);
  }

  const protocol::Output* Utxo(const protocol::Hash& hash, uint32_t index) const {
    return Utxo(protocol::OutPoint{hash, index});
  }

  // The output spent by the input under validation, or nullptr if unknown.
  const protocol::Output* SpentOutput() const {
    if (input_index_ < 0 || input_index_ >= transaction_.InputCount()) return nullptr;
    return Utxo(transaction_.Input(input_index_).previous_output);
  }

 private:
  runtime::Stack stack_;
  const protocol::Transaction& transaction_;
  const int input_index_;
  const consensus::UtxoSnapshot& utxos_;
};

}  // namespace sigil::protocol::script::runtime
