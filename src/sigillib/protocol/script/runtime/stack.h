// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "sigillib/protocol/script/lang/minimal.h"
#include "sigillib/protocol/script/lang/types.h"
#include "sigillib/protocol/script/runtime/decode.h"
#include "sigillib/protocol/script/runtime/throw.h"

namespace sigil::protocol::script::runtime {

// The operand stack. Items are stored back to back in one flat buffer.
// There is no limit on the number or size of items.
class Stack {
 public:
  bool Empty() const {
    return items_.empty();
  }

  int Size() const {
    return std::ssize(items_);
  }

  void Clear() {
    items_.clear();
    data_.clear();
  }

  Stack& Push(lang::Bytes bytes) {
    // The source may alias data_, which can reallocate below.
    const std::vector<uint8_t> copy(bytes.begin(), bytes.end());
    items_.emplace_back(Item{int(std::ssize(data_)), int(std::ssize(copy))});
    data_.insert(data_.end(), copy.begin(), copy.end());
    return *this;
  }

  Stack& Push(bool flag) {
    // True is {0x01} and false is the empty item.
    return flag ? PushInt(1) : Push(lang::Bytes{});
  }

  template <std::integral T>
  Stack& PushInt(T x) {
    const auto encoded = lang::EncodeMinimalInt(x);
    return Push(lang::Bytes{encoded});
  }

  Stack& Pop(int count = 1) {
    if (Size() < count)
      Throw(lang::Error::StackUnderflow, "Pop(", count, ") of stack with ", Size(), " items.");
    items_.resize(items_.size() - count);
    data_.resize(items_.empty() ? 0 : items_.back().offset + items_.back().size);
    return *this;
  }

  lang::Bytes Top() const {
    if (Empty()) Throw(lang::Error::StackUnderflow, "Top() of empty stack.");
    return ItemBytes(items_.back());
  }

  // Interpret the top-of-stack as a Boolean. Throws if stack is empty.
  bool TopAsBool() const {
    return IsTruthy(Top());
  }

  // Interpret the stack item at the given position as a 32-bit integer.
  int32_t Int32(int position = 0) const {
    return DecodeInt32(At(position));
  }

  // Retrieve the stack item at the given position, counting down from the top.
  std::span<const uint8_t> At(int position) const {
    if (position < 0 || position >= Size())
      Throw(lang::Error::StackUnderflow, "Accessed invalid stack position ", position, ".");
    int index = std::ssize(items_) - 1 - position;
    return ItemBytes(items_[index]);
  }

  // Empty, all-zero and negative-zero items are false. Everything else is true.
  static bool IsTruthy(lang::Bytes item) {
    for (int i = 0; i < std::ssize(item); ++i)
      if (item[i] != 0) return i < std::ssize(item) - 1 || item[i] != 0x80;
    return false;
  }

 protected:
  // The location of one item within data_.
  struct Item {
    int offset;
    int size;
  };

  lang::Bytes ItemBytes(const Item& item) const {
    return lang::Bytes{data_}.subspan(item.offset, item.size);
  }

  std::vector<Item> items_;
  std::vector<uint8_t> data_;
};

}  // namespace sigil::protocol::script::runtime
