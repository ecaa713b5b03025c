// Repository: ReelPlan
// Component: Logger
// Purpose: Tagged log lines for plan intake, composition, the compose CLI
//          and the plan service.
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_UTIL_LOGGER_HPP_
#define REELPLAN_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace reelplan::util {

// Lines carry a bracketed component tag, e.g. "[TimelineComposer] ...".
// Each line is written and flushed under one mutex.
//
// Info  -> stdout: run summaries, degraded assets (clip without narration)
// Debug -> stdout, only when REELPLAN_DEBUG is set: trims, schema details
// Warn  -> stderr: short narration, unreadable audio files
// Error -> stderr: rejected plans, missing images, failed RPCs
//
// The Set*Sink hooks also pass every line of that level to a callback so
// tests can assert on what was logged.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Test-only. Call with nullptr to clear.
  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace reelplan::util

#endif  // REELPLAN_UTIL_LOGGER_HPP_
