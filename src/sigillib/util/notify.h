// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#pragma once

#include <cstdint>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sigil::util {

using NotificationValue = std::variant<int64_t, double, std::string>;

class NotificationMap {
 public:
  using Entry = std::pair<std::string_view, NotificationValue>;

  NotificationMap() = default;
  NotificationMap(std::initializer_list<Entry> list) : map_(list) {}
  NotificationMap(const NotificationMap&) = default;
  NotificationMap(NotificationMap&&) = default;
  NotificationMap& operator =(const NotificationMap&) = default;
  NotificationMap& operator =(NotificationMap&&) = default;

  bool Empty() const {
    return map_.empty();
  }
  int Size() const {
    return static_cast<int>(std::ssize(map_));
  }
  void Insert(std::string_view key, NotificationValue value) {
    map_.emplace_back(key, std::move(value));
  }
  template <typename T>
  const T* Find(std::string_view key) const {
    for (const auto& [k, v] : map_)
      if (k == key) return std::get_if<T>(&v);
    return nullptr;
  }

  auto begin() const { return map_.begin(); }
  auto end() const { return map_.end(); }

 private:
  std::vector<Entry> map_;
};

void NotifyLog(NotificationMap values);

enum class NotificationType {
  Log,     // Console messages.
  Trace    // Per-operation script execution traces.
};

struct NotificationPayload {
  NotificationType type;
  std::string path;
  NotificationMap map;
};

void NotifyTrace(std::string path, NotificationMap values);

using NotificationSink = std::function<void(NotificationPayload)>;

// The notification sink is called once per Notify call. Must be thread-safe and non-blocking.
void SetNotificationSink(NotificationSink sink);

// The default notification sink class that writes logs only to stdout and/or appends to file.
class DefaultLogSink {
 public:
  static DefaultLogSink& Instance();
  // Appends log lines to the file, replacing any previous file. An empty name stops file output.
  void SetOutputFile(const std::string& filename);
  void EnableStdout(bool enabled);
  void operator()(NotificationPayload payload);

  static void Log(NotificationPayload payload) {
    Instance()(std::move(payload));
  }

 private:
  DefaultLogSink() = default;

  mutable std::mutex mutex_;
  std::ofstream file_;
  bool to_stdout_ = true;
};

}  // namespace sigil::util
