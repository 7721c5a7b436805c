// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include "sigillib/protocol/script/engine.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "sigillib/consensus/utxo.h"
#include "sigillib/crypto/hash.h"
#include "sigillib/protocol/address.h"
#include "sigillib/protocol/script/lang/op.h"
#include "sigillib/protocol/script/runtime/catalog.h"
#include "sigillib/protocol/script/writer.h"
#include "sigillib/protocol/transaction.h"
#include "sigillib/util/hex.h"
#include "testutil/keys.h"

namespace sigil::protocol::script {
namespace {

using lang::Op;

constexpr auto kGenesisLockingScript =
    "41 04678afdb0fe5548271967f1a67130b7105cd6a828e03909a67962e0ea1f61deb6"
    "49f6bc3f4cef38c4f35504e51ec112de5c384df7ba0b8d578a4c702b6bf11d5f ac"_bytes;

std::vector<uint8_t> Filled(int size, uint8_t value) {
  return std::vector<uint8_t>(size, value);
}

Engine ParseOrFail(lang::Bytes unlocking, lang::Bytes locking) {
  auto engine = Engine::Parse(unlocking, locking);
  EXPECT_TRUE(engine.IsSuccess()) << engine.Error();
  return engine ? std::move(*engine) : Engine{Engine::Program{}};
}

bool RunAlone(const Engine& engine) {
  const protocol::Transaction tx;
  const consensus::UtxoSnapshot utxos;
  return engine.Execute(tx, 0, utxos);
}

// An operation that always fails without faulting.
class FailingOperation : public runtime::Operation {
 public:
  bool Execute(runtime::Context&) const override {
    return false;
  }
  std::string ToString() const override {
    return "FAIL";
  }
};

// An operation that records whether it was ever reached.
class SentinelOperation : public runtime::Operation {
 public:
  bool Execute(runtime::Context& context) const override {
    reached = true;
    context.Stack().PushInt(1);
    return true;
  }
  std::string ToString() const override {
    return "SENTINEL";
  }
  mutable bool reached = false;
};

TEST(EngineParseTest, EmptyScriptsGiveEmptyProgram) {
  const auto engine = ParseOrFail({}, {});
  EXPECT_TRUE(engine.Operations().empty());
  EXPECT_EQ(engine.ExtractedAddress(), "");
  EXPECT_EQ(engine.Describe(), "-- BEGIN ----\n-- END ----");
  // An empty final stack is never accepted.
  EXPECT_FALSE(RunAlone(engine));
}

TEST(EngineParseTest, ConcatenatesUnlockingBeforeLocking) {
  const auto engine = ParseOrFail("01 02"_bytes, "01 04"_bytes);
  ASSERT_EQ(engine.Operations().size(), 2u);
  EXPECT_EQ(engine.Operations()[0]->ToString(), "PUSH(1) 02");
  EXPECT_EQ(engine.Operations()[1]->ToString(), "PUSH(1) 04");
}

TEST(EngineParseTest, DescribeListsOperations) {
  const auto engine =
      ParseOrFail(Writer{}.PushInt(2).PushInt(3), Writer{}.Then(Op::Add).PushInt(5).Then(Op::NumEqual));
  EXPECT_EQ(engine.Describe(),
            "-- BEGIN ----\nOP_2\nOP_3\nOP_ADD\nOP_5\nOP_NUMEQUAL\n-- END ----");
  EXPECT_TRUE(RunAlone(engine));
}

TEST(EngineParseTest, SharesCatalogOperations) {
  const auto engine = ParseOrFail({}, Writer{}.Then(Op::Duplicate).Then(Op::Duplicate));
  ASSERT_EQ(engine.Operations().size(), 2u);
  EXPECT_EQ(engine.Operations()[0], engine.Operations()[1]);
  EXPECT_EQ(engine.Operations()[0], runtime::Catalog::Instance().Lookup(Op::Duplicate));
}

TEST(EngineParseTest, UnsupportedOpcodeReportsOffset) {
  const auto engine = Engine::Parse("51"_bytes, "51 ba"_bytes);
  ASSERT_FALSE(engine);
  EXPECT_EQ(engine.Error(), (lang::ParseError{lang::Error::UnsupportedOpcode, 2, 0xba}));

  EXPECT_EQ(Engine::Parse({}, "ff"_bytes).Error(),
            (lang::ParseError{lang::Error::UnsupportedOpcode, 0, 0xff}));
}

TEST(EngineParseTest, LengthPrefixedPushIsUnsupported) {
  const auto engine = Engine::Parse({}, "4c 01 aa"_bytes);
  ASSERT_FALSE(engine);
  EXPECT_EQ(engine.Error(), (lang::ParseError{lang::Error::UnsupportedOpcode, 0, 0x4c}));
}

TEST(EngineParseTest, TruncatedPushAcrossScripts) {
  // The five-byte push starts in the unlocking script and runs past the end of the locking one.
  const auto engine = Engine::Parse("05 01 02"_bytes, "03 04"_bytes);
  ASSERT_FALSE(engine);
  EXPECT_EQ(engine.Error(), (lang::ParseError{lang::Error::TruncatedPush, 0, 0x05}));
}

TEST(EngineParseTest, PushCrossingBoundaryIsOnePush) {
  const auto engine = ParseOrFail("03 01 02"_bytes, "03"_bytes);
  ASSERT_EQ(engine.Operations().size(), 1u);
  EXPECT_EQ(engine.Operations()[0]->ToString(), "PUSH(3) 010203");
}

TEST(EngineAddressTest, NoKeyShapedPushMeansNoAddress) {
  const auto engine = ParseOrFail(Writer{}.PushData(Filled(19, 0xAA)),
                                  Writer{}.PushData(Filled(33, 0x02)).Then(Op::Drop));
  EXPECT_EQ(engine.ExtractedAddress(), "");
}

TEST(EngineAddressTest, TwentyBytePushIsHash160) {
  const auto engine = ParseOrFail({}, Writer{}.PushData(Filled(20, 0xAA)));
  ASSERT_EQ(engine.Operations().size(), 1u);
  EXPECT_EQ(engine.Operations()[0]->ToString(), "PUSH(20) " + std::string(40, 'a'));
  const auto* push = dynamic_cast<const runtime::DataPush*>(engine.Operations()[0].get());
  ASSERT_NE(push, nullptr);
  EXPECT_TRUE(std::ranges::equal(push->Data(), Filled(20, 0xAA)));
  EXPECT_EQ(engine.ExtractedAddress(), "1GZQKjsC97yasxRj1wtYf5rC61AxpR1zmr");
}

TEST(EngineAddressTest, GenesisPublicKey) {
  const auto engine = ParseOrFail({}, kGenesisLockingScript);
  EXPECT_EQ(engine.ExtractedAddress(), "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa");
}

TEST(EngineAddressTest, FirstKeyShapedPushWins) {
  const auto hash = Writer{}.PushData(Filled(20, 0xAA));
  EXPECT_EQ(ParseOrFail(hash, kGenesisLockingScript).ExtractedAddress(),
            "1GZQKjsC97yasxRj1wtYf5rC61AxpR1zmr");
  EXPECT_EQ(ParseOrFail(kGenesisLockingScript, hash).ExtractedAddress(),
            "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa");
}

TEST(EngineAddressTest, FirstOfTwoHashPushesWins) {
  const auto unlocking = Writer{}.PushData(Filled(20, 0xAA)).Then(Op::Drop).PushInt(1);
  const auto locking = Writer{}.Then(Op::Duplicate).PushData(Filled(20, 0x00)).Then(Op::Drop2);
  EXPECT_EQ(ParseOrFail(unlocking, locking).ExtractedAddress(),
            "1GZQKjsC97yasxRj1wtYf5rC61AxpR1zmr");
  EXPECT_EQ(ParseOrFail(locking, unlocking).ExtractedAddress(), "1111111111111111111114oLvT2");
}

TEST(EngineExecuteTest, FinalTopMustBeTruthy) {
  EXPECT_TRUE(RunAlone(ParseOrFail({}, Writer{}.PushInt(1))));
  EXPECT_TRUE(RunAlone(ParseOrFail({}, Writer{}.PushData("00 01"_bytes))));
  EXPECT_FALSE(RunAlone(ParseOrFail({}, Writer{}.PushInt(0))));
  EXPECT_FALSE(RunAlone(ParseOrFail({}, Writer{}.PushData("00 00 00"_bytes))));
  EXPECT_FALSE(RunAlone(ParseOrFail({}, Writer{}.PushData("00 80"_bytes))));
  // Only the top item counts.
  EXPECT_TRUE(RunAlone(ParseOrFail(Writer{}.PushInt(0), Writer{}.PushInt(1))));
  EXPECT_FALSE(RunAlone(ParseOrFail(Writer{}.PushInt(1), Writer{}.PushInt(0))));
}

TEST(EngineExecuteTest, StopsAtFirstFailure) {
  auto sentinel = std::make_shared<SentinelOperation>();
  const Engine engine{{std::make_shared<FailingOperation>(), sentinel}};
  EXPECT_FALSE(RunAlone(engine));
  EXPECT_FALSE(sentinel->reached);
}

TEST(EngineExecuteTest, StopsAtFirstFault) {
  auto sentinel = std::make_shared<SentinelOperation>();
  const Engine engine{{runtime::Catalog::Instance().Lookup(Op::Drop), sentinel}};
  EXPECT_FALSE(RunAlone(engine));
  EXPECT_FALSE(sentinel->reached);
}

TEST(EngineExecuteTest, RunsEveryOperationOnSuccess) {
  auto sentinel = std::make_shared<SentinelOperation>();
  const Engine engine{{runtime::Catalog::Instance().Lookup(Op::Nop), sentinel}};
  EXPECT_TRUE(RunAlone(engine));
  EXPECT_TRUE(sentinel->reached);
}

TEST(EngineExecuteTest, ReturnFails) {
  EXPECT_FALSE(RunAlone(ParseOrFail(Writer{}.PushInt(1), Writer{}.Then(Op::Return))));
}

TEST(EngineExecuteTest, TracerSeesEveryStep) {
  const auto engine = ParseOrFail(Writer{}.PushInt(7), Writer{}.Then(Op::Duplicate).Then(
      Op::Add).Then(Op::Drop).Then(Op::Drop));
  std::vector<std::string> steps;
  std::vector<int> depths;
  bool last_ok = true;
  const protocol::Transaction tx;
  const consensus::UtxoSnapshot utxos;
  EXPECT_FALSE(engine.Execute(tx, 0, utxos,
                              [&](int step, const runtime::Operation& op, bool ok,
                                  const runtime::Stack& stack) {
                                EXPECT_EQ(step, std::ssize(steps));
                                steps.push_back(op.ToString());
                                depths.push_back(stack.Size());
                                last_ok = ok;
                              }));
  // The faulting step is reported too, then execution stops.
  EXPECT_EQ(steps, (std::vector<std::string>{"OP_7", "OP_DUP", "OP_ADD", "OP_DROP", "OP_DROP"}));
  EXPECT_EQ(depths, (std::vector<int>{1, 2, 1, 0, 0}));
  EXPECT_FALSE(last_ok);
}

TEST(EngineExecuteTest, ExecutionIsRepeatable) {
  const auto engine = ParseOrFail(Writer{}.PushInt(2), Writer{}.PushInt(2).Then(Op::NumEqual));
  const protocol::Transaction tx;
  const consensus::UtxoSnapshot utxos;
  std::vector<std::thread> threads;
  std::vector<char> results(4, 0);
  for (size_t i = 0; i < results.size(); ++i)
    threads.emplace_back([&, i] {
      for (int n = 0; n < 100; ++n) results[i] = engine.Execute(tx, 0, utxos);
    });
  for (auto& thread : threads) thread.join();
  for (const char result : results) EXPECT_TRUE(result);
}

// Spends a pay-to-public-key-hash output with a freshly generated key.
class PayToPubkeyHashTest : public ::testing::Test {
 protected:
  void Fund(bool compressed) {
    public_key_ = key_.PublicKey(compressed);
    locking_ = Writer{}
                   .Then(Op::Duplicate)
                   .Then(Op::Hash160)
                   .PushData(crypto::Hash160(public_key_))
                   .Then(Op::EqualVerify)
                   .Then(Op::CheckSig)
                   .Script();
    funding_.AddInput(protocol::OutPoint::Null(), {0x51});
    funding_.AddOutput(50'000, locking_);
    utxos_.AddOutputs(funding_);

    spending_.AddInput({funding_.GetHash(), 0});
    spending_.AddOutput(40'000, Filled(3, 0x51));
  }

  std::vector<uint8_t> Unlocking() const {
    return Writer{}.PushData(key_.SignInput(spending_, 0, locking_)).PushData(public_key_).Script();
  }

  bool Verify(lang::Bytes unlocking) const {
    return ParseOrFail(unlocking, locking_).Execute(spending_, 0, utxos_);
  }

  test::TestKey key_;
  std::vector<uint8_t> public_key_;
  std::vector<uint8_t> locking_;
  protocol::Transaction funding_;
  protocol::Transaction spending_;
  consensus::UtxoSnapshot utxos_;
};

TEST_F(PayToPubkeyHashTest, ValidSignatureIsAccepted) {
  Fund(false);
  const auto unlocking = Unlocking();
  EXPECT_TRUE(Verify(unlocking));
  EXPECT_EQ(ParseOrFail(unlocking, locking_).ExtractedAddress(),
            PublicKeyToAddress(public_key_));
}

TEST_F(PayToPubkeyHashTest, CompressedKeyIsAccepted) {
  Fund(true);
  EXPECT_TRUE(Verify(Unlocking()));
}

TEST_F(PayToPubkeyHashTest, TamperedTransactionIsRejected) {
  Fund(false);
  const auto unlocking = Unlocking();
  spending_.Output(0).value += 1;
  EXPECT_FALSE(Verify(unlocking));
}

TEST_F(PayToPubkeyHashTest, WrongKeyIsRejected) {
  Fund(false);
  const test::TestKey other;
  const auto unlocking = Writer{}
                             .PushData(other.SignInput(spending_, 0, locking_))
                             .PushData(other.PublicKey())
                             .Script();
  // The key hash check fails before the signature is examined.
  EXPECT_FALSE(Verify(unlocking));
}

TEST_F(PayToPubkeyHashTest, MissingSpentOutputIsRejected) {
  Fund(false);
  const auto unlocking = Unlocking();
  utxos_ = {};
  EXPECT_FALSE(Verify(unlocking));
}

TEST_F(PayToPubkeyHashTest, EmptySignatureIsRejected) {
  Fund(false);
  EXPECT_FALSE(Verify(Writer{}.PushData({}).PushData(public_key_)));
}

TEST(MultiSigTest, TwoOfThree) {
  const test::TestKey keys[3];
  Writer locking;
  locking.PushInt(2);
  for (const auto& key : keys) locking.PushData(key.PublicKey(true));
  locking.PushInt(3).Then(Op::CheckMultiSig);

  protocol::Transaction funding;
  funding.AddInput(protocol::OutPoint::Null(), {0x51});
  funding.AddOutput(10'000, locking.Script());
  consensus::UtxoSnapshot utxos;
  utxos.AddOutputs(funding);

  protocol::Transaction spending;
  spending.AddInput({funding.GetHash(), 0});
  spending.AddOutput(9'000, Filled(1, 0x51));

  const auto sign = [&](int i) { return keys[i].SignInput(spending, 0, locking.Script()); };
  const auto verify = [&](const Writer& unlocking) {
    return ParseOrFail(unlocking, locking).Execute(spending, 0, utxos);
  };

  // The leading empty push is consumed by the extra pop.
  EXPECT_TRUE(verify(Writer{}.PushInt(0).PushData(sign(0)).PushData(sign(2))));
  EXPECT_TRUE(verify(Writer{}.PushInt(0).PushData(sign(1)).PushData(sign(2))));
  // Signatures must appear in key order.
  EXPECT_FALSE(verify(Writer{}.PushInt(0).PushData(sign(2)).PushData(sign(0))));
  EXPECT_FALSE(verify(Writer{}.PushInt(0).PushData(sign(1)).PushData(sign(1))));
  // Without the dummy item the stack underflows.
  EXPECT_FALSE(verify(Writer{}.PushData(sign(0)).PushData(sign(1))));
}

}  // namespace
}  // namespace sigil::protocol::script
