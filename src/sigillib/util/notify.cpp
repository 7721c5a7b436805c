// Copyright 2025 Toby Sharp
//
// This file is part of the Sigil project. All rights reserved.
// For licensing or usage inquiries, contact: ask@hornetnode.com.
#include "sigillib/util/notify.h"

#include <iostream>
#include <mutex>
#include <string>

#include "sigillib/util/log.h"

namespace sigil::util {

DefaultLogSink& DefaultLogSink::Instance() {
  static DefaultLogSink instance;
  return instance;
}

void DefaultLogSink::SetOutputFile(const std::string& filename) {
  std::lock_guard lock(mutex_);
  if (file_.is_open()) file_.close();
  if (!filename.empty()) file_.open(filename, std::ios::app);
}

void DefaultLogSink::EnableStdout(bool enabled) {
  std::lock_guard lock(mutex_);
  to_stdout_ = enabled;
}

void DefaultLogSink::operator()(NotificationPayload payload) {
  if (payload.type != NotificationType::Log)
    return;

  const auto* level = payload.map.Find<int64_t>("level");
  const auto* message = payload.map.Find<std::string>("msg");
  const auto* time_us = payload.map.Find<int64_t>("time_us");
  if (!level || !message || !time_us) return;

  const std::string full = FormatLogLine(LogLevel(*level), *time_us, *message) + "\n";
  std::lock_guard lock(mutex_);
  if (to_stdout_) std::cout << full;
  if (file_.is_open()) file_ << full << std::flush;
}

namespace {
std::mutex sink_mutex;
NotificationSink notification_sink = &DefaultLogSink::Log;

void Notify(NotificationType type, std::string path, NotificationMap values) {
  NotificationSink sink;
  {
    std::lock_guard lock(sink_mutex);
    sink = notification_sink;
  }
  sink({type, std::move(path), std::move(values)});
}
}  // namespace

void NotifyLog(NotificationMap values) {
  Notify(NotificationType::Log, {}, std::move(values));
}

void NotifyTrace(std::string path, NotificationMap values) {
  Notify(NotificationType::Trace, std::move(path), std::move(values));
}

void SetNotificationSink(NotificationSink sink) {
  std::lock_guard lock(sink_mutex);
  notification_sink = std::move(sink);
}

}  // namespace sigil::util
