// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <limits>
#include <span>
#include <vector>

#include "sigillib/encoding/reader.h"
#include "sigillib/encoding/writer.h"
#include "sigillib/protocol/hash.h"
#include "sigillib/util/throw.h"

namespace sigil::protocol {

// A reference to one output of a previous transaction: its txid and output index.
struct OutPoint {
  Hash hash = {};
  uint32_t index = 0;
  static constexpr uint32_t kNullIndex = std::numeric_limits<uint32_t>::max();

  std::strong_ordering operator <=>(const OutPoint& rhs) const = default;
  bool operator ==(const OutPoint& rhs) const = default;

  static OutPoint Null() { return {{}, kNullIndex}; }

  bool IsNull() const {
    return !hash && index == kNullIndex;
  }

  void Serialize(encoding::Writer& writer) const {
    writer.WriteBytes(hash);
    writer.WriteLE4(index);
  }

  void Deserialize(encoding::Reader& reader) {
    reader.ReadBytes(hash);
    reader.ReadLE4(index);
  }
};

struct Input {
  OutPoint previous_output;
  std::vector<uint8_t> signature_script;
  uint32_t sequence = 0xFFFFFFFF;

  void Serialize(encoding::Writer& writer) const {
    previous_output.Serialize(writer);
    writer.WriteVarBytes(signature_script);
    writer.WriteLE4(sequence);
  }

  void Deserialize(encoding::Reader& reader) {
    previous_output.Deserialize(reader);
    const auto script = reader.ReadVarBytes();
    signature_script.assign(script.begin(), script.end());
    reader.ReadLE4(sequence);
  }
};

struct Output {
  int64_t value = 0;
  std::vector<uint8_t> pk_script;

  bool operator ==(const Output& rhs) const = default;

  void Serialize(encoding::Writer& writer) const {
    writer.WriteLE8(value);
    writer.WriteVarBytes(pk_script);
  }

  void Deserialize(encoding::Reader& reader) {
    reader.ReadLE8(value);
    const auto script = reader.ReadVarBytes();
    pk_script.assign(script.begin(), script.end());
  }
};

// A transaction in the legacy (non-witness) serialization.
class Transaction {
 public:
  uint32_t Version() const {
    return version_;
  }
  int InputCount() const {
    return static_cast<int>(std::ssize(inputs_));
  }
  int OutputCount() const {
    return static_cast<int>(std::ssize(outputs_));
  }
  const struct Input& Input(int index) const {
    return inputs_.at(index);
  }
  struct Input& Input(int index) {
    return inputs_.at(index);
  }
  const struct Output& Output(int index) const {
    return outputs_.at(index);
  }
  struct Output& Output(int index) {
    return outputs_.at(index);
  }
  std::span<const uint8_t> SignatureScript(int input) const {
    return Input(input).signature_script;
  }
  std::span<const uint8_t> PkScript(int output) const {
    return Output(output).pk_script;
  }
  std::span<const struct Input> Inputs() const {
    return inputs_;
  }
  std::span<const struct Output> Outputs() const {
    return outputs_;
  }
  uint32_t LockTime() const {
    return lock_time_;
  }

  void SetVersion(uint32_t version) {
    version_ = version;
  }
  void SetLockTime(uint32_t lock_time) {
    lock_time_ = lock_time;
  }
  void ResizeInputs(int count) {
    inputs_.resize(count);
  }
  void ResizeOutputs(int count) {
    outputs_.resize(count);
  }
  struct Input& AddInput(OutPoint previous_output, std::vector<uint8_t> signature_script = {},
                         uint32_t sequence = 0xFFFFFFFF) {
    return inputs_.emplace_back(
        protocol::Input{previous_output, std::move(signature_script), sequence});
  }
  struct Output& AddOutput(int64_t value, std::vector<uint8_t> pk_script) {
    return outputs_.emplace_back(protocol::Output{value, std::move(pk_script)});
  }

  // Computes the txid, which is the double-SHA256 hash of the serialized transaction.
  Hash GetHash() const;

  void Serialize(encoding::Writer& writer) const {
    writer.WriteLE4(version_);
    writer.WriteVarInt(inputs_.size());
    for (const auto& input : inputs_) input.Serialize(writer);
    writer.WriteVarInt(outputs_.size());
    for (const auto& output : outputs_) output.Serialize(writer);
    writer.WriteLE4(lock_time_);
  }

  void Deserialize(encoding::Reader& reader) {
    reader.ReadLE4(version_);

    // A zero input count is the segregated witness marker, which is not supported.
    inputs_.resize(reader.ReadVarInt<size_t>());
    if (inputs_.empty())
      util::ThrowRuntimeError("Transaction has zero inputs or uses witness serialization.");
    for (auto& input : inputs_) input.Deserialize(reader);

    outputs_.resize(reader.ReadVarInt<size_t>());
    for (auto& output : outputs_) output.Deserialize(reader);

    reader.ReadLE4(lock_time_);
  }

 private:
  uint32_t version_ = 1;
  std::vector<struct Input> inputs_;
  std::vector<struct Output> outputs_;
  uint32_t lock_time_ = 0;
};

}  // namespace sigil::protocol

namespace std {

template <>
struct hash<sigil::protocol::OutPoint> {
  size_t operator()(const sigil::protocol::OutPoint& outpoint) const noexcept {
    const size_t h = std::hash<sigil::protocol::Hash>{}(outpoint.hash);
    return h ^ (size_t(outpoint.index) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2));
  }
};

}  // namespace std
