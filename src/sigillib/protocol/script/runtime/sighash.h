// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <cstdint>

#include "sigillib/crypto/hash.h"
#include "sigillib/protocol/script/lang/types.h"
#include "sigillib/protocol/transaction.h"

namespace sigil::protocol::script::runtime {

// Signature hash types, carried in the final byte of a script signature.
enum SigHashType : uint32_t {
  SigHashAll = 1,
  SigHashNone = 2,
  SigHashSingle = 3,
  SigHashAnyoneCanPay = 0x80
};

// Computes the legacy (pre-segwit) signature hash of the transaction for the given input,
// where script_code is the locking script of the output being spent.
//
// An input index beyond the inputs, or SIGHASH_SINGLE with no matching output, yields the
// historical 256-bit value one rather than an error.
crypto::bytes32_t SignatureHash(const protocol::Transaction& transaction, int input_index,
                                lang::Bytes script_code, uint32_t hash_type);

}  // namespace sigil::protocol::script::runtime
