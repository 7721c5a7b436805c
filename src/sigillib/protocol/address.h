// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace sigil::protocol {

// The Base58Check version byte of mainnet pay-to-public-key-hash addresses.
inline constexpr uint8_t kPubkeyHashAddressVersion = 0x00;

// Size in bytes of a Hash160 public key fingerprint.
inline constexpr int kHash160Size = 20;

// Size in bytes of an uncompressed SEC1 public key.
inline constexpr int kUncompressedPubkeySize = 65;

// Encodes a 20-byte Hash160 fingerprint as a payment address.
std::string Hash160ToAddress(std::span<const uint8_t, kHash160Size> hash160,
                             uint8_t version = kPubkeyHashAddressVersion);

// Derives the payment address of a public key, i.e. the address of its Hash160.
std::string PublicKeyToAddress(std::span<const uint8_t> public_key,
                               uint8_t version = kPubkeyHashAddressVersion);

}  // namespace sigil::protocol
