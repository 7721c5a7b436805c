// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include "sigillib/protocol/address.h"

#include <algorithm>
#include <array>

#include "sigillib/crypto/base58.h"
#include "sigillib/crypto/hash.h"

namespace sigil::protocol {

std::string Hash160ToAddress(std::span<const uint8_t, kHash160Size> hash160, uint8_t version) {
  std::array<uint8_t, 1 + kHash160Size> payload;
  payload[0] = version;
  std::copy(hash160.begin(), hash160.end(), payload.begin() + 1);
  return crypto::EncodeBase58Check(payload);
}

std::string PublicKeyToAddress(std::span<const uint8_t> public_key, uint8_t version) {
  return Hash160ToAddress(crypto::Hash160(public_key), version);
}

}  // namespace sigil::protocol
