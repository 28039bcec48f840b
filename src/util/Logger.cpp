// Repository: Moshline
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by render stages and workers.
// Copyright (c) 2025 RetroVue

#include "moshline/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace moshline::util {

std::mutex Logger::mutex_;
Logger::Sink Logger::info_sink_;
Logger::Sink Logger::warn_sink_;
Logger::Sink Logger::error_sink_;

// Caller holds mutex_.
void Logger::Emit(std::ostream& stream, const Sink& sink, const std::string& line) {
  if (sink) sink(line);
  stream << line << '\n';
  stream.flush();
}

void Logger::Replace(Sink& slot, Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  slot = std::move(sink);
}

void Logger::SetInfoSink(Sink sink) { Replace(info_sink_, std::move(sink)); }
void Logger::SetWarnSink(Sink sink) { Replace(warn_sink_, std::move(sink)); }
void Logger::SetErrorSink(Sink sink) { Replace(error_sink_, std::move(sink)); }

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cout, info_sink_, line);
}

void Logger::Debug(const std::string& line) {
  if (std::getenv("MOSHLINE_DEBUG") == nullptr) return;
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cout, Sink(), line);
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cerr, warn_sink_, line);
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cerr, error_sink_, line);
}

}  // namespace moshline::util
