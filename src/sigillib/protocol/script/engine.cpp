// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include "sigillib/protocol/script/engine.h"

#include <memory>
#include <sstream>
#include <vector>

#include "sigillib/protocol/address.h"
#include "sigillib/protocol/script/lang/op.h"
#include "sigillib/protocol/script/parser.h"
#include "sigillib/protocol/script/runtime/catalog.h"
#include "sigillib/protocol/script/runtime/context.h"
#include "sigillib/protocol/script/runtime/throw.h"
#include "sigillib/util/log.h"

namespace sigil::protocol::script {

namespace {

// Returns the address encoded by a push payload, or "" if the payload is not key-shaped.
std::string AddressOfPush(lang::Bytes data) {
  if (std::ssize(data) == kHash160Size)
    return Hash160ToAddress(std::span<const uint8_t, kHash160Size>{data.data(), data.size()});
  if (std::ssize(data) == kUncompressedPubkeySize)
    return PublicKeyToAddress(data);
  return {};
}

}  // namespace

util::Expected<Engine, lang::ParseError> Engine::Parse(lang::Bytes unlocking,
                                                       lang::Bytes locking) {
  std::vector<uint8_t> stream;
  stream.reserve(unlocking.size() + locking.size());
  stream.insert(stream.end(), unlocking.begin(), unlocking.end());
  stream.insert(stream.end(), locking.begin(), locking.end());

  const auto& catalog = runtime::Catalog::Instance();
  Program program;
  std::string address;
  Parser parser{stream};
  while (const auto instruction = parser.Next()) {
    if (lang::IsPushSize(instruction->opcode)) {
      if (address.empty()) address = AddressOfPush(instruction->data);
      program.push_back(std::make_shared<const runtime::DataPush>(instruction->data));
      continue;
    }
    auto operation = catalog.Lookup(instruction->opcode);
    if (operation == nullptr) {
      const lang::ParseError error{lang::Error::UnsupportedOpcode, instruction->offset,
                                   instruction->opcode};
      LogDebug("Script parse failed: ", error);
      return error;
    }
    program.push_back(std::move(operation));
  }
  if (parser.Error()) {
    LogDebug("Script parse failed: ", *parser.Error());
    return *parser.Error();
  }
  return Engine{std::move(program), std::move(address)};
}

bool Engine::Execute(const protocol::Transaction& transaction, int input_index,
                     const consensus::UtxoSnapshot& utxos, const Tracer& tracer) const {
  runtime::Context context{transaction, input_index, utxos};
  for (int step = 0; step < std::ssize(program_); ++step) {
    const runtime::Operation& operation = *program_[step];
    bool ok = false;
    try {
      ok = operation.Execute(context);
    } catch (const runtime::Exception& e) {
      LogDebug("Step ", step, " (", operation.ToString(), ") faulted: ", e.what());
    }
    if (tracer) tracer(step, operation, ok, context.Stack());
    if (!ok) {
      LogDebug("Script failed at step ", step, " (", operation.ToString(), ").");
      return false;
    }
  }

  // The program is accepted only if an implicit final OP_VERIFY succeeds.
  const auto verify = runtime::Catalog::Instance().Lookup(lang::Op::Verify);
  try {
    return verify->Execute(context);
  } catch (const runtime::Exception& e) {
    LogDebug("Final verify faulted: ", e.what());
    return false;
  }
}

std::string Engine::Describe() const {
  std::ostringstream oss;
  oss << "-- BEGIN ----";
  for (const auto& operation : program_) oss << "\n" << operation->ToString();
  oss << "\n-- END ----";
  return oss.str();
}

}  // namespace sigil::protocol::script
