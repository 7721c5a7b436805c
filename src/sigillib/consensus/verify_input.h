// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include "sigillib/consensus/utxo.h"
#include "sigillib/protocol/script/lang/types.h"
#include "sigillib/protocol/transaction.h"
#include "sigillib/util/expected.h"

namespace sigil::consensus {

// Verifies that input `input_index` of the transaction is authorized to spend the output it
// references, by running its unlocking script against that output's locking script.
//
// Returns false when the spent output is not in the snapshot or the scripts fail, and the
// parse error when the scripts are malformed. Throws std::out_of_range for a bad input index.
[[nodiscard]] util::Expected<bool, protocol::script::lang::ParseError> VerifyInput(
    const protocol::Transaction& transaction, int input_index, const UtxoSnapshot& utxos);

}  // namespace sigil::consensus
