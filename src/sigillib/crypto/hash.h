// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <array>
#include <cstdint>
#include <span>

#include "sigillib/crypto/sha256.h"

namespace sigil::crypto {

using bytes32_t = std::array<uint8_t, 32>;
using bytes20_t = std::array<uint8_t, 20>;

inline bytes32_t Sha256(std::span<const uint8_t> bytes) {
  return SHA256::Hash(bytes);
}

// Double SHA-256, as used for transaction ids, signature hashes and address checksums.
inline bytes32_t DoubleSha256(std::span<const uint8_t> bytes) {
  return Sha256(Sha256(bytes));
}

// RIPEMD-160, computed by OpenSSL libcrypto. Throws std::runtime_error if libcrypto cannot
// provide the digest, which is a fault of the environment rather than of any input.
bytes20_t Ripemd160(std::span<const uint8_t> bytes);

// RIPEMD-160 of SHA-256, the public key fingerprint from which payment addresses are derived.
inline bytes20_t Hash160(std::span<const uint8_t> bytes) {
  return Ripemd160(Sha256(bytes));
}

}  // namespace sigil::crypto
