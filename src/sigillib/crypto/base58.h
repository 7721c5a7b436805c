// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sigil::crypto {

// Encodes bytes as Base58. Leading zero bytes map to leading '1' characters.
std::string EncodeBase58(std::span<const uint8_t> bytes);

// Decodes a Base58 string, or returns nullopt if it contains a character outside the alphabet.
std::optional<std::vector<uint8_t>> DecodeBase58(std::string_view text);

// Appends the first four bytes of the double SHA-256 of `payload` and Base58-encodes the result.
std::string EncodeBase58Check(std::span<const uint8_t> payload);

// Decodes a Base58Check string and returns the payload without its checksum, or nullopt if the
// encoding or the checksum is invalid.
std::optional<std::vector<uint8_t>> DecodeBase58Check(std::string_view text);

}  // namespace sigil::crypto
