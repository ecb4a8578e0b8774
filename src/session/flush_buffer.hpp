#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace coderun {

// Accumulates streamed text fragments per part and hands them to a
// persistence callback at most once per interval. Fragments are joined
// only when flushed, so total work stays linear in the text length.
class DeltaFlushBuffer {
 public:
  using Clock = std::chrono::steady_clock;

  // (part id, full text so far, text appended since the previous flush)
  using FlushCallback = std::function<void(const PartId &, const std::string &, const std::string &)>;

  DeltaFlushBuffer(std::chrono::milliseconds interval, FlushCallback on_flush);

  // Empty fragments are ignored
  void append(const PartId &id, std::string fragment, Clock::time_point now = Clock::now());

  // Flush every dirty part now
  void flush_all();

  // Flush if the scheduled time has come; returns true when a flush ran
  bool flush_due(Clock::time_point now = Clock::now());

  // When the pending flush is scheduled, nullopt when nothing is dirty
  std::optional<Clock::time_point> next_flush_at() const {
    return scheduled_;
  }

  // Full text of the part (flushed or not) and forget it; empty for unknown ids
  std::string finalize(const PartId &id);

  // Full text of the part without flushing
  std::string text(const PartId &id) const;

  bool contains(const PartId &id) const {
    return entries_.count(id) > 0;
  }

  bool dirty() const;

  // Drop everything without flushing
  void clear();

  std::chrono::milliseconds interval() const {
    return interval_;
  }

 private:
  struct Entry {
    std::vector<std::string> chunks;
    size_t flushed_count = 0;  // chunks[flushed_count:] is unflushed
    std::string flushed_text;  // join of chunks[:flushed_count]
  };

  static std::string join_unflushed(const Entry &entry);

  std::chrono::milliseconds interval_;
  FlushCallback on_flush_;

  std::map<PartId, Entry> entries_;
  std::vector<PartId> order_;  // flush in first-append order
  std::optional<Clock::time_point> scheduled_;
};

}  // namespace coderun
