// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sigil/command_line_parser.h"
#include "sigil/options.h"
#include "sigillib/consensus/utxo.h"
#include "sigillib/encoding/reader.h"
#include "sigillib/protocol/script/engine.h"
#include "sigillib/protocol/transaction.h"
#include "sigillib/util/hex.h"
#include "sigillib/util/log.h"
#include "sigillib/util/notify.h"

using namespace sigil;

namespace {

enum ExitCode { kValid = 0, kInvalid = 1, kParseError = 2, kUsageError = 3 };

std::optional<std::vector<uint8_t>> DecodeHexOption(const char* name, const std::string& hex) {
  auto bytes = util::ParseHex(hex);
  if (!bytes) std::cerr << "Error: --" << name << " is not a valid hex string.\n";
  return bytes;
}

// Prints execution trace notifications to stdout, and passes log notifications through.
void TraceSink(util::NotificationPayload payload) {
  if (payload.type != util::NotificationType::Trace) {
    util::DefaultLogSink::Log(std::move(payload));
    return;
  }
  const auto* step = payload.map.Find<int64_t>("step");
  const auto* op = payload.map.Find<std::string>("op");
  const auto* ok = payload.map.Find<int64_t>("ok");
  const auto* depth = payload.map.Find<int64_t>("depth");
  const auto* top = payload.map.Find<std::string>("top");
  if (!step || !op || !ok || !depth || !top) return;
  std::cout << "  [" << *step << "] " << *op << (*ok ? "" : "  FAILED") << "  depth=" << *depth
            << "  top=" << (top->empty() ? "<empty>" : *top) << "\n";
}

void NotifyStep(int step, const protocol::script::runtime::Operation& operation, bool ok,
                const protocol::script::runtime::Stack& stack) {
  util::NotifyTrace("script/step", {{"step", int64_t{step}},
                                    {"op", operation.ToString()},
                                    {"ok", int64_t{ok}},
                                    {"depth", int64_t{stack.Size()}},
                                    {"top", stack.Empty() ? std::string{} : util::ToHex(stack.Top())}});
}

}  // namespace

int main(int argc, char** argv) {
  Options options;
  tool::CommandLineParser parser("Sigil", "0.1.0");
  parser.AddOption("unlocking", &options.unlocking, "Unlocking script in hex (default: the input's script from --tx)");
  parser.AddOption("locking", &options.locking, "Locking script of the spent output in hex");
  parser.AddOption("tx", &options.tx, "Spending transaction in hex; enables verification");
  parser.AddOption("input", &options.input, "Index of the input of --tx to verify");
  parser.AddOption("amount", &options.amount, "Value of the spent output in satoshis");
  parser.AddFlag("trace", &options.trace, "Print every execution step");
  parser.AddOption("logfile", &options.logfile, "Append log output to the given file");
  parser.AddFlag("quiet", &options.quiet, "Do not write log output to stdout");

  switch (parser.Parse(argc, argv)) {
    case tool::CommandLineParser::Result::Proceed:
      break;
    case tool::CommandLineParser::Result::Exit:
      return kValid;
    case tool::CommandLineParser::Result::Error:
      return kUsageError;
  }

  if (!options.logfile.empty()) util::DefaultLogSink::Instance().SetOutputFile(options.logfile);
  if (options.quiet) util::DefaultLogSink::Instance().EnableStdout(false);
  if (options.trace) util::SetNotificationSink(&TraceSink);

  const auto locking = DecodeHexOption("locking", options.locking);
  const auto unlocking_option = DecodeHexOption("unlocking", options.unlocking);
  if (!locking || !unlocking_option) return kUsageError;

  // Decode the spending transaction, if one was given.
  std::optional<protocol::Transaction> tx;
  if (!options.tx.empty()) {
    const auto tx_bytes = DecodeHexOption("tx", options.tx);
    if (!tx_bytes) return kUsageError;
    try {
      encoding::Reader reader{*tx_bytes};
      tx.emplace().Deserialize(reader);
      if (!reader.IsEOF()) util::ThrowRuntimeError(reader.Remaining(), " trailing bytes after transaction.");
    } catch (const std::exception& e) {
      std::cerr << "Error: --tx could not be decoded: " << e.what() << "\n";
      return kUsageError;
    }
    if (options.input < 0 || options.input >= tx->InputCount()) {
      std::cerr << "Error: --input " << options.input << " is out of range for a transaction with "
                << tx->InputCount() << " inputs.\n";
      return kUsageError;
    }
  }

  // Without an explicit unlocking script, take it from the transaction input.
  std::vector<uint8_t> unlocking = *unlocking_option;
  if (options.unlocking.empty() && tx) {
    const auto script = tx->SignatureScript(options.input);
    unlocking.assign(script.begin(), script.end());
  }

  const auto engine = protocol::script::Engine::Parse(unlocking, *locking);
  if (!engine) {
    std::cerr << "Parse error: " << engine.Error() << "\n";
    return kParseError;
  }
  std::cout << engine->Describe() << "\n";
  if (!engine->ExtractedAddress().empty())
    std::cout << "Address: " << engine->ExtractedAddress() << "\n";
  if (!tx) return kValid;

  // Verify against a snapshot holding just the spent output.
  consensus::UtxoSnapshot utxos;
  utxos.Add(tx->Input(options.input).previous_output, {options.amount, *locking});
  LogInfo("Verifying input ", options.input, " of transaction ", tx->GetHash(), ".");
  protocol::script::Engine::Tracer tracer;
  if (options.trace) tracer = &NotifyStep;
  const bool valid = engine->Execute(*tx, options.input, utxos, tracer);
  std::cout << "Result: " << (valid ? "VALID" : "INVALID") << "\n";

  util::SetNotificationSink(&util::DefaultLogSink::Log);
  return valid ? kValid : kInvalid;
}
