// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include "sigillib/crypto/base58.h"

#include <algorithm>
#include <array>

#include "sigillib/crypto/hash.h"

namespace sigil::crypto {

namespace {

constexpr char kAlphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
constexpr size_t kChecksumBytes = 4;

constexpr std::array<int8_t, 256> MakeDigitTable() {
  std::array<int8_t, 256> table = {};
  for (auto& entry : table) entry = -1;
  for (int i = 0; i < 58; ++i) table[uint8_t(kAlphabet[i])] = int8_t(i);
  return table;
}

constexpr auto kDigitTable = MakeDigitTable();

}  // namespace

std::string EncodeBase58(std::span<const uint8_t> bytes) {
  const auto first_nonzero = std::find_if(bytes.begin(), bytes.end(), [](uint8_t b) { return b != 0; });
  const size_t zeros = static_cast<size_t>(first_nonzero - bytes.begin());

  // Big-endian base-58 digits. log(256) / log(58) < 1.38.
  std::vector<uint8_t> digits((bytes.size() - zeros) * 138 / 100 + 1, 0);
  for (auto it = first_nonzero; it != bytes.end(); ++it) {
    int carry = *it;
    for (auto digit = digits.rbegin(); digit != digits.rend(); ++digit) {
      carry += 256 * *digit;
      *digit = uint8_t(carry % 58);
      carry /= 58;
    }
  }

  auto digit = std::find_if(digits.begin(), digits.end(), [](uint8_t d) { return d != 0; });
  std::string text(zeros, '1');
  text.reserve(zeros + static_cast<size_t>(digits.end() - digit));
  for (; digit != digits.end(); ++digit) text.push_back(kAlphabet[*digit]);
  return text;
}

std::optional<std::vector<uint8_t>> DecodeBase58(std::string_view text) {
  const size_t ones = std::min(text.find_first_not_of('1'), text.size());

  // Big-endian base-256 digits. log(58) / log(256) < 0.733.
  std::vector<uint8_t> bytes((text.size() - ones) * 733 / 1000 + 1, 0);
  for (size_t i = ones; i < text.size(); ++i) {
    int carry = kDigitTable[uint8_t(text[i])];
    if (carry < 0) return std::nullopt;
    for (auto byte = bytes.rbegin(); byte != bytes.rend(); ++byte) {
      carry += 58 * *byte;
      *byte = uint8_t(carry & 0xFF);
      carry >>= 8;
    }
  }

  const auto first_nonzero = std::find_if(bytes.begin(), bytes.end(), [](uint8_t b) { return b != 0; });
  std::vector<uint8_t> result(ones, 0);
  result.insert(result.end(), first_nonzero, bytes.end());
  return result;
}

std::string EncodeBase58Check(std::span<const uint8_t> payload) {
  std::vector<uint8_t> data(payload.begin(), payload.end());
  const auto checksum = DoubleSha256(payload);
  data.insert(data.end(), checksum.begin(), checksum.begin() + kChecksumBytes);
  return EncodeBase58(data);
}

std::optional<std::vector<uint8_t>> DecodeBase58Check(std::string_view text) {
  auto data = DecodeBase58(text);
  if (!data || data->size() < kChecksumBytes) return std::nullopt;

  const auto payload_end = data->end() - kChecksumBytes;
  const auto checksum = DoubleSha256({data->data(), data->size() - kChecksumBytes});
  if (!std::equal(payload_end, data->end(), checksum.begin())) return std::nullopt;

  data->erase(payload_end, data->end());
  return data;
}

}  // namespace sigil::crypto
