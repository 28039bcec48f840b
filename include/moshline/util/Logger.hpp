// Repository: Moshline
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by render stages and workers.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_UTIL_LOGGER_HPP_
#define MOSHLINE_UTIL_LOGGER_HPP_

#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>

namespace moshline::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from the render thread and source decode workers never
// interleave.
//
// Info  -> stdout (normal operational logs)
// Debug -> stdout only when MOSHLINE_DEBUG env is set
// Warn  -> stderr (degraded but recoverable conditions, e.g. missing samples)
// Error -> stderr (fatal render errors)
//
// Test-only: the sinks receive every matching line in addition to the
// stream. Call with nullptr to clear.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetInfoSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetErrorSink(Sink sink);

 private:
  static void Emit(std::ostream& stream, const Sink& sink, const std::string& line);
  static void Replace(Sink& slot, Sink sink);

  static std::mutex mutex_;
  static Sink info_sink_;
  static Sink warn_sink_;
  static Sink error_sink_;
};

}  // namespace moshline::util

#endif  // MOSHLINE_UTIL_LOGGER_HPP_
