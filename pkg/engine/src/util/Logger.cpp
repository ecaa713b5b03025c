// Repository: ReelPlan
// Component: Logger Implementation
// Copyright (c) 2026 ReelPlan

#include "reelplan/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <ostream>
#include <utility>

namespace reelplan::util {

std::mutex Logger::mutex_;
std::function<void(const std::string&)> Logger::info_sink_;
std::function<void(const std::string&)> Logger::warn_sink_;
std::function<void(const std::string&)> Logger::error_sink_;

namespace {

// Caller holds Logger's mutex.
void Emit(std::ostream& out, const std::function<void(const std::string&)>& sink,
          const std::string& line) {
  if (sink) sink(line);
  out << line << '\n';
  out.flush();
}

}  // namespace

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cout, info_sink_, line);
}

void Logger::Debug(const std::string& line) {
  if (std::getenv("REELPLAN_DEBUG") == nullptr) return;
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cout, nullptr, line);
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cerr, warn_sink_, line);
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cerr, error_sink_, line);
}

}  // namespace reelplan::util
