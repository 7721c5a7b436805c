#pragma once

// SHA-256
// Implemented from FIPS 180-4:
// https://nvlpubs.nist.gov/nistpubs/FIPS/NIST.FIPS.180-4.pdf

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <span>

namespace sigil::crypto {

namespace SHA256 {
using hash256_t = std::array<uint8_t, 32>;

// Compute the SHA-256 hash of an arbitrary byte stream
hash256_t Hash(std::span<const uint8_t> bytes);
}  // namespace SHA256

/* Implementation follows */

namespace SHA256 {
namespace Detail {
using State = std::array<uint32_t, 8>;
inline constexpr State kInitialHash = {0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
                                       0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19};
inline constexpr std::array<uint32_t, 64> kRoundConstants = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2};

using Schedule = std::array<uint32_t, 64>;
using Block = std::array<uint32_t, 16>;  // 512-bit message block

template <uint8_t Count>
inline uint32_t ROTR(uint32_t x) {
  return (x >> Count) | (x << (32 - Count));
}

template <uint8_t Count>
inline uint32_t SHR(uint32_t x) {
  return x >> Count;
}

inline uint32_t Ch(uint32_t x, uint32_t y, uint32_t z) {
  return (x & y) ^ (~x & z);
}

inline uint32_t Maj(uint32_t x, uint32_t y, uint32_t z) {
  return (x & y) ^ (x & z) ^ (y & z);
}

inline uint32_t Sigma_0(uint32_t x) {
  return ROTR<2>(x) ^ ROTR<13>(x) ^ ROTR<22>(x);
}

inline uint32_t Sigma_1(uint32_t x) {
  return ROTR<6>(x) ^ ROTR<11>(x) ^ ROTR<25>(x);
}

inline uint32_t sigma_0(uint32_t x) {
  return ROTR<7>(x) ^ ROTR<18>(x) ^ SHR<3>(x);
}

inline uint32_t sigma_1(uint32_t x) {
  return ROTR<17>(x) ^ ROTR<19>(x) ^ SHR<10>(x);
}

// Reads a big-endian 32-bit word from an unaligned byte pointer.
inline uint32_t LoadBigEndian(const uint8_t* p) {
  return uint32_t(p[0]) << 24 | uint32_t(p[1]) << 16 | uint32_t(p[2]) << 8 | uint32_t(p[3]);
}

inline void StoreBigEndian(uint32_t x, uint8_t* p) {
  p[0] = uint8_t(x >> 24);
  p[1] = uint8_t(x >> 16);
  p[2] = uint8_t(x >> 8);
  p[3] = uint8_t(x);
}

inline void ProcessBlock(const Block& M, Schedule& W, State& H) {
  // Prepare the message schedule {W_t}
  for (int t = 0; t < 16; ++t) W[t] = M[t];
  for (int t = 16; t < 64; ++t)
    W[t] = sigma_1(W[t - 2]) + W[t - 7] + sigma_0(W[t - 15]) + W[t - 16];

  // Initialize the working variables a-h with the previous hash value
  auto a = H[0], b = H[1], c = H[2], d = H[3], e = H[4], f = H[5], g = H[6], h = H[7];

  for (int t = 0; t < 64; ++t) {
    const uint32_t T1 = h + Sigma_1(e) + Ch(e, f, g) + kRoundConstants[t] + W[t];
    const uint32_t T2 = Sigma_0(a) + Maj(a, b, c);
    h = g;
    g = f;
    f = e;
    e = d + T1;
    d = c;
    c = b;
    b = a;
    a = T1 + T2;
  }

  // Update the hash value
  H[0] += a;
  H[1] += b;
  H[2] += c;
  H[3] += d;
  H[4] += e;
  H[5] += f;
  H[6] += g;
  H[7] += h;
}

inline Block LoadBlock(const uint8_t* bytes) {
  Block block;
  for (int i = 0; i < 16; ++i) block[i] = LoadBigEndian(bytes + 4 * i);
  return block;
}
}  // namespace Detail

inline hash256_t Hash(std::span<const uint8_t> bytes) {
  using namespace Detail;
  constexpr size_t kBlockBytes = 64;

  Schedule W;
  State H = kInitialHash;

  // All the full 512-bit blocks are processed in streaming fashion.
  size_t processed = 0;
  for (; bytes.size() - processed >= kBlockBytes; processed += kBlockBytes)
    ProcessBlock(LoadBlock(bytes.data() + processed), W, H);

  // The tail is padded with a one bit, zeros, and the 64-bit message length in bits,
  // spilling into a second block when fewer than 9 bytes remain.
  std::array<uint8_t, 2 * kBlockBytes> tail = {};
  const size_t remaining = bytes.size() - processed;
  if (remaining > 0) std::memcpy(tail.data(), bytes.data() + processed, remaining);
  tail[remaining] = 0x80;
  const size_t tail_bytes = remaining + 9 <= kBlockBytes ? kBlockBytes : 2 * kBlockBytes;
  const uint64_t length_bits = uint64_t(bytes.size()) << 3;
  StoreBigEndian(uint32_t(length_bits >> 32), &tail[tail_bytes - 8]);
  StoreBigEndian(uint32_t(length_bits), &tail[tail_bytes - 4]);
  for (size_t offset = 0; offset < tail_bytes; offset += kBlockBytes)
    ProcessBlock(LoadBlock(tail.data() + offset), W, H);

  hash256_t result;
  for (int i = 0; i < 8; ++i) StoreBigEndian(H[i], &result[4 * i]);
  return result;
}

}  // namespace SHA256

}  // namespace sigil::crypto
