// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <cstdint>
#include <span>

#include "sigillib/crypto/hash.h"

namespace sigil::crypto {

// Returns true iff `signature` is a valid DER-encoded secp256k1 ECDSA signature of `digest`
// under `public_key`, given in SEC1 encoding (33-byte compressed or 65-byte uncompressed).
// Malformed keys and signatures verify as false.
bool VerifyEcdsa(std::span<const uint8_t> public_key, std::span<const uint8_t> signature,
                 const bytes32_t& digest);

}  // namespace sigil::crypto
