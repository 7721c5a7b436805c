// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include <algorithm>
#include <cstdint>
#include <vector>

#include "sigillib/crypto/ecdsa.h"
#include "sigillib/crypto/hash.h"
#include "sigillib/protocol/script/lang/types.h"
#include "sigillib/protocol/script/runtime/catalog.h"
#include "sigillib/protocol/script/runtime/context.h"
#include "sigillib/protocol/script/runtime/ops/verify.h"
#include "sigillib/protocol/script/runtime/sighash.h"
#include "sigillib/protocol/script/runtime/throw.h"
#include "sigillib/util/log.h"

namespace sigil::protocol::script::runtime {

using lang::Op;

namespace detail {

inline constexpr int kMaxPubkeysPerMultisig = 20;

// Replaces the top item with its hash.
template <typename Fn>
inline void UnaryHash(Context& context, Fn&& f) {
  const auto digest = f(context.Top());
  context.Stack().Pop().Push(digest);
}

// Verifies one script signature (DER signature followed by a hash-type byte) against a public
// key, over the legacy signature hash of the input under validation.
static bool CheckSignature(const Context& context, lang::Bytes signature,
                           lang::Bytes public_key) {
  if (signature.empty()) return false;
  const protocol::Output* spent = context.SpentOutput();
  if (spent == nullptr) {
    LogDebug("No unspent output found for input ", context.InputIndex(), ".");
    return false;
  }
  const uint32_t hash_type = signature.back();
  const auto digest = SignatureHash(context.Transaction(), context.InputIndex(),
                                    spent->pk_script, hash_type);
  return crypto::VerifyEcdsa(public_key, signature.first(signature.size() - 1), digest);
}

// Pops `count` items and returns them in push order, i.e. deepest first.
static std::vector<std::vector<uint8_t>> PopItems(Context& context, int count) {
  std::vector<std::vector<uint8_t>> items(count);
  for (int i = count - 1; i >= 0; --i) items[i] = context.Pop();
  return items;
}

}  // namespace detail

// Op::Ripemd160
static bool OnRipemd160(Context& context) {
  detail::UnaryHash(context, [](lang::Bytes x) { return crypto::Ripemd160(x); });
  return true;
}

// Op::Sha256
static bool OnSha256(Context& context) {
  detail::UnaryHash(context, [](lang::Bytes x) { return crypto::Sha256(x); });
  return true;
}

// Op::Hash160
static bool OnHash160(Context& context) {
  detail::UnaryHash(context, [](lang::Bytes x) { return crypto::Hash160(x); });
  return true;
}

// Op::Hash256
static bool OnHash256(Context& context) {
  detail::UnaryHash(context, [](lang::Bytes x) { return crypto::DoubleSha256(x); });
  return true;
}

// Op::CodeSeparator has no effect: the script code is always the whole locking script.
static bool OnCodeSeparator(Context&) {
  return true;
}

// Op::CheckSig: (sig pubkey -- bool)
static bool OnCheckSig(Context& context) {
  const auto public_key = context.Pop();
  const auto signature = context.Pop();
  context.Stack().Push(detail::CheckSignature(context, signature, public_key));
  return true;
}

// Op::CheckSigVerify
static bool OnCheckSigVerify(Context& context) {
  return OnCheckSig(context) && PopVerify(context);
}

// Op::CheckMultiSig: (dummy sig_1 ... sig_m m pubkey_1 ... pubkey_n n -- bool)
// Signatures must appear in the same order as their public keys.
static bool OnCheckMultiSig(Context& context) {
  const int key_count = context.Stack().Int32();
  if (key_count < 0 || key_count > detail::kMaxPubkeysPerMultisig)
    Throw(lang::Error::InvalidPubkeyCount, "Public key count ", key_count, " out of range.");
  context.Stack().Pop();
  const auto public_keys = detail::PopItems(context, key_count);

  const int sig_count = context.Stack().Int32();
  if (sig_count < 0 || sig_count > key_count)
    Throw(lang::Error::InvalidSignatureCount, "Signature count ", sig_count,
          " out of range for ", key_count, " keys.");
  context.Stack().Pop();
  const auto signatures = detail::PopItems(context, sig_count);

  // Historical off-by-one: one more item is consumed.
  context.Stack().Pop();

  int isig = 0, ikey = 0;
  while (isig < sig_count) {
    // Fail early once the remaining keys cannot cover the remaining signatures.
    if (sig_count - isig > key_count - ikey) break;
    if (detail::CheckSignature(context, signatures[isig], public_keys[ikey])) ++isig;
    ++ikey;
  }
  context.Stack().Push(isig == sig_count);
  return true;
}

// Op::CheckMultiSigVerify
static bool OnCheckMultiSigVerify(Context& context) {
  return OnCheckMultiSig(context) && PopVerify(context);
}

void RegisterCryptoOps(Catalog& catalog) {
  catalog.Register(Op::Ripemd160, "OP_RIPEMD160", &OnRipemd160);
  catalog.Register(Op::Sha256, "OP_SHA256", &OnSha256);
  catalog.Register(Op::Hash160, "OP_HASH160", &OnHash160);
  catalog.Register(Op::Hash256, "OP_HASH256", &OnHash256);
  catalog.Register(Op::CodeSeparator, "OP_CODESEPARATOR", &OnCodeSeparator);
  catalog.Register(Op::CheckSig, "OP_CHECKSIG", &OnCheckSig);
  catalog.Register(Op::CheckSigVerify, "OP_CHECKSIGVERIFY", &OnCheckSigVerify);
  catalog.Register(Op::CheckMultiSig, "OP_CHECKMULTISIG", &OnCheckMultiSig);
  catalog.Register(Op::CheckMultiSigVerify, "OP_CHECKMULTISIGVERIFY", &OnCheckMultiSigVerify);
}

}  // namespace sigil::protocol::script::runtime
