// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sigillib/protocol/transaction.h"

namespace sigil::consensus {

// An immutable-by-convention snapshot of the previously unspent outputs that a verification
// may consult, keyed by outpoint (txid and output index).
class UtxoSnapshot {
 public:
  // Adds or replaces the output at the given outpoint.
  void Add(const protocol::OutPoint& outpoint, protocol::Output output) {
    outputs_.insert_or_assign(outpoint, std::move(output));
  }

  // Adds every output of the given transaction, indexed under its txid.
  void AddOutputs(const protocol::Transaction& tx) {
    const protocol::Hash txid = tx.GetHash();
    for (int i = 0; i < tx.OutputCount(); ++i)
      Add({txid, static_cast<uint32_t>(i)}, tx.Output(i));
  }

  // Returns the output at the given outpoint, or nullptr if it is not in the snapshot.
  const protocol::Output* Find(const protocol::OutPoint& outpoint) const {
    const auto it = outputs_.find(outpoint);
    return it == outputs_.end() ? nullptr : &it->second;
  }

  int Size() const {
    return static_cast<int>(outputs_.size());
  }

  bool Empty() const {
    return outputs_.empty();
  }

 private:
  std::unordered_map<protocol::OutPoint, protocol::Output> outputs_;
};

}  // namespace sigil::consensus
