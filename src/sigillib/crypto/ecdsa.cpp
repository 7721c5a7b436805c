// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include "sigillib/crypto/ecdsa.h"

#include <memory>

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include "sigillib/util/log.h"

namespace sigil::crypto {

namespace {

struct PkeyDeleter {
  void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

// Builds a public-key-only EVP_PKEY on secp256k1 from SEC1 bytes, or null if the point is invalid.
PkeyPtr MakePublicKey(std::span<const uint8_t> public_key) {
  char group[] = "secp256k1";
  OSSL_PARAM params[] = {
      OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, group, 0),
      OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY,
                                        const_cast<uint8_t*>(public_key.data()),
                                        public_key.size()),
      OSSL_PARAM_construct_end()};

  PkeyCtxPtr ctx{EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr)};
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0) return nullptr;

  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_fromdata(ctx.get(), &pkey, EVP_PKEY_PUBLIC_KEY, params) <= 0)
    return nullptr;
  return PkeyPtr{pkey};
}

}  // namespace

bool VerifyEcdsa(std::span<const uint8_t> public_key, std::span<const uint8_t> signature,
                 const bytes32_t& digest) {
  if (public_key.empty() || signature.empty()) return false;

  const PkeyPtr pkey = MakePublicKey(public_key);
  if (!pkey) {
    LogDebug("Rejected public key of ", public_key.size(), " bytes.");
    return false;
  }
  const PkeyCtxPtr ctx{EVP_PKEY_CTX_new(pkey.get(), nullptr)};
  if (!ctx || EVP_PKEY_verify_init(ctx.get()) <= 0) return false;

  // The digest is verified as given, without hashing it again.
  return EVP_PKEY_verify(ctx.get(), signature.data(), signature.size(), digest.data(),
                         digest.size()) == 1;
}

}  // namespace sigil::crypto
