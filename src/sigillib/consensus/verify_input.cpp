// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include "sigillib/consensus/verify_input.h"

#include "sigillib/protocol/script/engine.h"
#include "sigillib/util/log.h"
#include "sigillib/util/throw.h"

namespace sigil::consensus {

util::Expected<bool, protocol::script::lang::ParseError> VerifyInput(
    const protocol::Transaction& transaction, int input_index, const UtxoSnapshot& utxos) {
  if (input_index < 0 || input_index >= transaction.InputCount())
    util::ThrowOutOfRange("Input index ", input_index, " out of range for transaction with ",
                          transaction.InputCount(), " inputs.");

  const auto& input = transaction.Input(input_index);
  const protocol::Output* spent = utxos.Find(input.previous_output);
  if (spent == nullptr) {
    LogDebug("Input ", input_index, " spends unknown output ", input.previous_output.hash, ":",
             input.previous_output.index, ".");
    return false;
  }

  const auto engine = protocol::script::Engine::Parse(input.signature_script, spent->pk_script);
  if (!engine) return engine.Error();
  return engine->Execute(transaction, input_index, utxos);
}

}  // namespace sigil::consensus
