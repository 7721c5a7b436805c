// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include "sigillib/protocol/transaction.h"

#include "sigillib/crypto/hash.h"
#include "sigillib/encoding/writer.h"

namespace sigil::protocol {

Hash Transaction::GetHash() const {
  encoding::Writer writer;
  Serialize(writer);
  return crypto::DoubleSha256(writer.Buffer());
}

}  // namespace sigil::protocol
