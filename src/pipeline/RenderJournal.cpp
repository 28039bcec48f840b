// Repository: Moshline
// Component: Render Journal
// Purpose: Bounded, per-pipeline event log with CSV export
// Copyright (c) 2025 RetroVue

#include "moshline/pipeline/RenderJournal.hpp"

#include <algorithm>
#include <sstream>

namespace moshline::pipeline {

std::string CsvQuote(const std::string& field) {
  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (char c : field) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

RenderJournal::RenderJournal(size_t capacity, const timing::ITimeSource& time_source)
    : capacity_(std::max<size_t>(1, capacity)), time_source_(time_source) {}

void RenderJournal::Record(const std::string& message, const std::string& data) {
  JournalEntry entry{time_source_.NowMs(), message, data};
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.size() >= capacity_) {
    entries_.pop_front();
    ++dropped_;
  }
  entries_.push_back(std::move(entry));
}

std::vector<JournalEntry> RenderJournal::Entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {entries_.begin(), entries_.end()};
}

size_t RenderJournal::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

size_t RenderJournal::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

std::string RenderJournal::ToCsv() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ostringstream oss;
  oss << "timestamp,message,data\n";
  for (const auto& e : entries_) {
    oss << e.timestamp_ms << ',' << CsvQuote(e.message) << ',' << CsvQuote(e.data) << '\n';
  }
  return oss.str();
}

void RenderJournal::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  dropped_ = 0;
}

}  // namespace moshline::pipeline
