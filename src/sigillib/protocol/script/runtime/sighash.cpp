// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include "sigillib/protocol/script/runtime/sighash.h"

#include <utility>

#include "sigillib/encoding/writer.h"
#include "sigillib/util/log.h"

namespace sigil::protocol::script::runtime {

namespace {

constexpr crypto::bytes32_t kOne = {1};

}  // namespace

crypto::bytes32_t SignatureHash(const protocol::Transaction& transaction, int input_index,
                                lang::Bytes script_code, uint32_t hash_type) {
  if (input_index < 0 || input_index >= transaction.InputCount()) {
    LogDebug("Signature hash input index ", input_index, " out of range.");
    return kOne;
  }
  const uint32_t base_type = hash_type & 0x1f;
  const bool anyone_can_pay = (hash_type & SigHashAnyoneCanPay) != 0;
  if (base_type == SigHashSingle && input_index >= transaction.OutputCount()) {
    LogDebug("SIGHASH_SINGLE input ", input_index, " has no matching output.");
    return kOne;
  }

  // Blank every input script except the one being signed, which takes the script code.
  protocol::Transaction copy = transaction;
  for (int i = 0; i < copy.InputCount(); ++i) copy.Input(i).signature_script.clear();
  copy.Input(input_index).signature_script.assign(script_code.begin(), script_code.end());

  if (base_type == SigHashNone || base_type == SigHashSingle) {
    // Other inputs are free to update their sequence numbers.
    for (int i = 0; i < copy.InputCount(); ++i)
      if (i != input_index) copy.Input(i).sequence = 0;

    if (base_type == SigHashNone) {
      copy.ResizeOutputs(0);
    } else {
      // Keep outputs up to the signed index, blanking all but the last.
      copy.ResizeOutputs(input_index + 1);
      for (int i = 0; i < input_index; ++i) copy.Output(i) = {-1, {}};
    }
  }

  if (anyone_can_pay) {
    protocol::Input signed_input = std::move(copy.Input(input_index));
    copy.ResizeInputs(1);
    copy.Input(0) = std::move(signed_input);
  }

  encoding::Writer writer;
  copy.Serialize(writer);
  writer.WriteLE4(hash_type);
  return crypto::DoubleSha256(writer.Buffer());
}

}  // namespace sigil::protocol::script::runtime
