// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include "sigillib/protocol/script/parser.h"

#include <gtest/gtest.h>

#include <vector>

namespace sigil::protocol::script {
namespace {

using lang::Op;

void ExpectNext(Parser& p, uint8_t expected_opcode, std::initializer_list<uint8_t> expected_data) {
  auto ins = p.Next();
  ASSERT_TRUE(ins.has_value()) << "expected another instruction";
  EXPECT_EQ(ins->opcode, expected_opcode);
  ASSERT_EQ(ins->data.size(), expected_data.size());
  size_t i = 0;
  for (uint8_t b : expected_data) {
    EXPECT_EQ(ins->data[i++], b);
  }
}

TEST(ScriptParserTest, ParsesMixedSequence) {
  // Script bytes:
  //   0x02 <AA BB>           (small push of 2 bytes)
  //   0xAC                   (CHECKSIG)
  //   0x00                   (OP_0, which carries no data)
  //   0x01 <FF>
  std::vector<uint8_t> script = {0x02, 0xAA, 0xBB, 0xAC, 0x00, 0x01, 0xFF};
  Parser p{script};

  ExpectNext(p, 0x02, {0xAA, 0xBB});
  ExpectNext(p, ToByte(Op::CheckSig), {});
  ExpectNext(p, ToByte(Op::PushEmpty), {});
  ExpectNext(p, 0x01, {0xFF});
  EXPECT_FALSE(p.Next().has_value());
  EXPECT_FALSE(p.Error().has_value());
}

TEST(ScriptParserTest, RecordsOffsets) {
  std::vector<uint8_t> script = {0x01, 0x00, 0x76, 0x02, 0x01, 0x02, 0x87};
  Parser p{script};
  std::vector<int> offsets;
  while (const auto ins = p.Next()) offsets.push_back(ins->offset);
  EXPECT_EQ(offsets, (std::vector<int>{0, 2, 3, 6}));
}

TEST(ScriptParserTest, EmptyScriptYieldsEofImmediately) {
  std::vector<uint8_t> script;
  Parser p{script};
  EXPECT_FALSE(p.Next().has_value());
  EXPECT_FALSE(p.Error().has_value());
}

TEST(ScriptParserTest, TruncatedPushIsAnError) {
  // Push of 5 bytes but only 2 data bytes present.
  std::vector<uint8_t> script = {0x76, 0x05, 0xAA, 0xBB};
  Parser p{script};

  ExpectNext(p, ToByte(Op::Duplicate), {});
  EXPECT_FALSE(p.Next().has_value());
  ASSERT_TRUE(p.Error().has_value());
  EXPECT_EQ(*p.Error(), (lang::ParseError{lang::Error::TruncatedPush, 1, 0x05}));
  EXPECT_FALSE(p.Next().has_value());
}

TEST(ScriptParserTest, LengthPrefixedPushesAreBareOpcodes) {
  // PUSHDATA1 is not a push in this grammar, so its operand bytes are opcodes too.
  std::vector<uint8_t> script = {ToByte(Op::PushData1), 0x4b};
  Parser p{script};
  ExpectNext(p, ToByte(Op::PushData1), {});
  EXPECT_FALSE(p.Next().has_value());
  ASSERT_TRUE(p.Error().has_value());
  EXPECT_EQ(p.Error()->error, lang::Error::TruncatedPush);
}

TEST(ScriptParserTest, PeekDoesNotAdvance) {
  std::vector<uint8_t> script = {0x01, 0xAA, 0xAC};
  Parser p{script};

  auto first = p.Peek();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, 0x01);

  ExpectNext(p, 0x01, {0xAA});
  EXPECT_EQ(p.Peek(), 0xAC);
  ExpectNext(p, 0xAC, {});
  EXPECT_FALSE(p.Peek().has_value());
}

}  // namespace
}  // namespace sigil::protocol::script
