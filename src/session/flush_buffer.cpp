#include "session/flush_buffer.hpp"

#include <algorithm>

namespace coderun {

DeltaFlushBuffer::DeltaFlushBuffer(std::chrono::milliseconds interval, FlushCallback on_flush)
    : interval_(interval), on_flush_(std::move(on_flush)) {}

std::string DeltaFlushBuffer::join_unflushed(const Entry &entry) {
  size_t size = 0;
  for (size_t i = entry.flushed_count; i < entry.chunks.size(); ++i) {
    size += entry.chunks[i].size();
  }

  std::string joined;
  joined.reserve(size);
  for (size_t i = entry.flushed_count; i < entry.chunks.size(); ++i) {
    joined += entry.chunks[i];
  }
  return joined;
}

void DeltaFlushBuffer::append(const PartId &id, std::string fragment, Clock::time_point now) {
  if (fragment.empty()) return;

  auto [it, inserted] = entries_.try_emplace(id);
  if (inserted) {
    order_.push_back(id);
  }
  it->second.chunks.push_back(std::move(fragment));

  if (!scheduled_) {
    scheduled_ = now + interval_;
  }
}

bool DeltaFlushBuffer::dirty() const {
  return std::any_of(entries_.begin(), entries_.end(), [](const auto &kv) {
    return kv.second.flushed_count < kv.second.chunks.size();
  });
}

void DeltaFlushBuffer::flush_all() {
  scheduled_.reset();

  for (const auto &id : order_) {
    auto it = entries_.find(id);
    if (it == entries_.end()) continue;

    auto &entry = it->second;
    if (entry.flushed_count == entry.chunks.size()) continue;

    auto delta = join_unflushed(entry);
    entry.flushed_text += delta;
    entry.flushed_count = entry.chunks.size();

    if (on_flush_) {
      on_flush_(id, entry.flushed_text, delta);
    }
  }
}

bool DeltaFlushBuffer::flush_due(Clock::time_point now) {
  if (!scheduled_ || now < *scheduled_) {
    return false;
  }
  flush_all();
  return true;
}

std::string DeltaFlushBuffer::finalize(const PartId &id) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return "";
  }

  std::string full = it->second.flushed_text + join_unflushed(it->second);
  entries_.erase(it);
  order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());

  if (!dirty()) {
    scheduled_.reset();
  }
  return full;
}

std::string DeltaFlushBuffer::text(const PartId &id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return "";
  }
  return it->second.flushed_text + join_unflushed(it->second);
}

void DeltaFlushBuffer::clear() {
  entries_.clear();
  order_.clear();
  scheduled_.reset();
}

}  // namespace coderun
