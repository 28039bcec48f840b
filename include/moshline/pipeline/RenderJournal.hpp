// Repository: Moshline
// Component: Render Journal
// Purpose: Bounded, per-pipeline event log with CSV export
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_PIPELINE_RENDER_JOURNAL_HPP_
#define MOSHLINE_PIPELINE_RENDER_JOURNAL_HPP_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "moshline/timing/ITimeSource.hpp"

namespace moshline::pipeline {

struct JournalEntry {
  int64_t timestamp_ms = 0;
  std::string message;
  std::string data;
};

// Oldest entries are dropped once `capacity` is reached.
class RenderJournal {
 public:
  RenderJournal(size_t capacity, const timing::ITimeSource& time_source);

  void Record(const std::string& message, const std::string& data = "");

  std::vector<JournalEntry> Entries() const;
  size_t Size() const;
  size_t dropped() const;

  // "timestamp,message,data" header, one quoted row per entry.
  std::string ToCsv() const;

  void Clear();

 private:
  const size_t capacity_;
  const timing::ITimeSource& time_source_;
  mutable std::mutex mutex_;
  std::deque<JournalEntry> entries_;
  size_t dropped_ = 0;
};

// Double embedded quotes and wrap in quotes.
std::string CsvQuote(const std::string& field);

}  // namespace moshline::pipeline

#endif  // MOSHLINE_PIPELINE_RENDER_JOURNAL_HPP_
