// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include "sigillib/crypto/hash.h"

#include <openssl/evp.h>

#include "sigillib/util/throw.h"

namespace sigil::crypto {

bytes20_t Ripemd160(std::span<const uint8_t> bytes) {
  bytes20_t digest;
  unsigned int length = 0;
  if (EVP_Digest(bytes.data(), bytes.size(), digest.data(), &length, EVP_ripemd160(), nullptr) != 1 ||
      length != digest.size())
    util::ThrowRuntimeError("RIPEMD-160 digest failed.");
  return digest;
}

}  // namespace sigil::crypto
