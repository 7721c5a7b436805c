// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "sigillib/encoding/reader.h"
#include "sigillib/encoding/writer.h"
#include "sigillib/util/hex.h"

namespace sigil::encoding {
namespace {

TEST(WriterTest, WritesLittleEndianIntegers) {
  Writer writer;
  writer.WriteLE4(0x01020304u);
  writer.WriteLE8(int64_t{-2});
  writer.WriteByte(0xAB);
  EXPECT_EQ(util::ToHex(writer.Buffer()), "04030201" "feffffffffffffff" "ab");
}

TEST(WriterTest, WritesVarIntsAtEachWidth) {
  Writer writer;
  writer.WriteVarInt(0xFCu);
  writer.WriteVarInt(0xFDu);
  writer.WriteVarInt(0x10000u);
  writer.WriteVarInt(uint64_t{0x100000000});
  EXPECT_EQ(util::ToHex(writer.Buffer()), "fc" "fdfd00" "fe00000100" "ff0000000001000000");
}

TEST(WriterTest, WriteLE4RejectsValuesThatDoNotFit) {
  Writer writer;
  EXPECT_THROW(writer.WriteLE4(int64_t{1} << 40), std::out_of_range);
  EXPECT_THROW(writer.WriteLE4(-1), std::out_of_range);
}

TEST(ReaderTest, ReadsWhatWasWritten) {
  Writer writer;
  writer.WriteLE4(7u);
  writer.WriteVarInt(300u);
  writer.WriteBytes("c0ffee"_bytes);
  const auto buffer = writer.ReleaseBuffer();

  Reader reader{buffer};
  uint32_t four = 0;
  reader.ReadLE4(four);
  EXPECT_EQ(four, 7u);
  EXPECT_EQ(reader.ReadVarInt<size_t>(), 300u);
  EXPECT_EQ(reader.Remaining(), 3u);
  const auto bytes = reader.ReadBytes(3);
  EXPECT_EQ(util::ToHex(bytes), "c0ffee");
  EXPECT_TRUE(reader.IsEOF());
}

TEST(ReaderTest, ThrowsOnReadPastEnd) {
  const std::vector<uint8_t> buffer = {0x01, 0x02};
  Reader reader{buffer};
  EXPECT_THROW(reader.ReadLE<uint32_t>(), std::out_of_range);
  EXPECT_EQ(reader.GetPos(), 0u);
  EXPECT_THROW(reader.ReadBytes(3), std::out_of_range);
  EXPECT_EQ(reader.ReadByte(), 0x01);
}

TEST(ReaderTest, ReadsLengthPrefixedBytesAndSignedValues) {
  Writer writer;
  writer.WriteVarBytes("76a9"_bytes);
  writer.WriteLE8(int64_t{-1});
  EXPECT_EQ(util::ToHex(writer.Buffer()), "0276a9" "ffffffffffffffff");

  Reader reader{writer.Buffer()};
  EXPECT_EQ(util::ToHex(reader.ReadVarBytes()), "76a9");
  int64_t value = 0;
  reader.ReadLE8(value);
  EXPECT_EQ(value, -1);
  EXPECT_TRUE(reader.IsEOF());
}

TEST(ReaderTest, ThrowsOnTruncatedVarInt) {
  const std::vector<uint8_t> buffer = {0xFE, 0x01, 0x00};
  Reader reader{buffer};
  EXPECT_THROW(reader.ReadVarInt(), std::out_of_range);
}

}  // namespace
}  // namespace sigil::encoding
