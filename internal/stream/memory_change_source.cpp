#include "memory_change_source.hpp"

#include "internal/util/errors.hpp"

namespace rowcast::stream {

MemoryChangeSource::MemoryChangeSource(std::string name) : name_(std::move(name)) {
}

util::Lsn MemoryChangeSource::Append(std::string payload) {
  std::lock_guard lock(mutex_);
  ++last_position_;
  log_.push_back({last_position_, std::move(payload)});
  return last_position_;
}

void MemoryChangeSource::AppendAt(util::Lsn position, std::string payload) {
  std::lock_guard lock(mutex_);
  if (position <= last_position_) {
    throw util::InvalidArgument("position " + util::FormatLsn(position) + " is not after " + util::FormatLsn(last_position_));
  }
  last_position_ = position;
  log_.push_back({position, std::move(payload)});
}

std::vector<PendingChange> MemoryChangeSource::Peek(util::Lsn from, std::size_t max) {
  std::lock_guard            lock(mutex_);
  std::vector<PendingChange> out;
  for (const auto& change : log_) {
    if (out.size() >= max) break;
    if (change.position > from) out.push_back(change);
  }
  return out;
}

void MemoryChangeSource::Advance(util::Lsn to) {
  std::lock_guard lock(mutex_);
  while (!log_.empty() && log_.front().position <= to) {
    log_.pop_front();
  }
}

std::size_t MemoryChangeSource::Retained() const {
  std::lock_guard lock(mutex_);
  return log_.size();
}

} // namespace rowcast::stream
