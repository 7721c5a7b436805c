// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include "sigillib/protocol/transaction.h"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "sigillib/encoding/reader.h"
#include "sigillib/encoding/writer.h"
#include "sigillib/util/hex.h"
#include "testutil/genesis.h"

namespace sigil::protocol {
namespace {

Transaction ParseGenesisCoinbase() {
  encoding::Reader reader{test::kGenesisCoinbase};
  Transaction tx;
  tx.Deserialize(reader);
  EXPECT_TRUE(reader.IsEOF());
  return tx;
}

TEST(TransactionTest, DeserializesGenesisCoinbase) {
  const Transaction tx = ParseGenesisCoinbase();
  EXPECT_EQ(tx.Version(), 1u);
  ASSERT_EQ(tx.InputCount(), 1);
  ASSERT_EQ(tx.OutputCount(), 1);
  EXPECT_TRUE(tx.Input(0).previous_output.IsNull());
  EXPECT_EQ(tx.SignatureScript(0).size(), 77u);
  EXPECT_EQ(tx.Input(0).sequence, 0xFFFFFFFFu);
  EXPECT_EQ(tx.Output(0).value, 50'0000'0000);
  EXPECT_EQ(tx.PkScript(0).size(), 67u);
  EXPECT_EQ(tx.LockTime(), 0u);
}

TEST(TransactionTest, HashIsDisplayedByteReversed) {
  std::ostringstream oss;
  oss << ParseGenesisCoinbase().GetHash();
  EXPECT_EQ(oss.str(), "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b");
}

TEST(TransactionTest, SerializeReproducesWireBytes) {
  encoding::Writer writer;
  ParseGenesisCoinbase().Serialize(writer);
  EXPECT_EQ(util::ToHex(writer.Buffer()), util::ToHex(test::kGenesisCoinbase));
}

TEST(TransactionTest, BuildsTransactionsIncrementally) {
  Transaction tx;
  tx.SetVersion(2);
  tx.SetLockTime(500);
  tx.AddInput({Hash{}, 3}, {0x51}, 0xFFFFFFFE);
  tx.AddOutput(1234, {0x76, 0xa9});
  ASSERT_EQ(tx.InputCount(), 1);
  EXPECT_EQ(tx.Input(0).previous_output.index, 3u);
  EXPECT_EQ(tx.Input(0).sequence, 0xFFFFFFFEu);
  EXPECT_EQ(tx.Output(0), (Output{1234, {0x76, 0xa9}}));

  encoding::Writer writer;
  tx.Serialize(writer);
  encoding::Reader reader{writer.Buffer()};
  Transaction copy;
  copy.Deserialize(reader);
  EXPECT_EQ(copy.GetHash(), tx.GetHash());
  EXPECT_EQ(copy.LockTime(), 500u);
}

TEST(TransactionTest, AccessorsCheckBounds) {
  const Transaction tx = ParseGenesisCoinbase();
  EXPECT_THROW(tx.Input(1), std::out_of_range);
  EXPECT_THROW(tx.Output(-1), std::out_of_range);
}

TEST(TransactionTest, RejectsWitnessSerialization) {
  // Version, then the segwit marker and flag.
  const auto bytes = "01000000 0001 01"_bytes;
  encoding::Reader reader{bytes};
  Transaction tx;
  EXPECT_THROW(tx.Deserialize(reader), std::runtime_error);
}

TEST(TransactionTest, RejectsTruncatedData) {
  const auto bytes = "01000000 01 0000"_bytes;
  encoding::Reader reader{bytes};
  Transaction tx;
  EXPECT_THROW(tx.Deserialize(reader), std::out_of_range);
}

TEST(OutPointTest, HashesAsCompositeKey) {
  Hash a{};
  Hash b{};
  b[0] = 1;
  std::unordered_set<OutPoint> set = {{a, 0}, {a, 1}, {b, 0}};
  EXPECT_EQ(set.size(), 3u);
  EXPECT_TRUE(set.contains({a, 1}));
  EXPECT_FALSE(set.contains({b, 1}));
  EXPECT_TRUE(OutPoint::Null().IsNull());
  EXPECT_FALSE((OutPoint{a, 0}).IsNull());
}

}  // namespace
}  // namespace sigil::protocol
