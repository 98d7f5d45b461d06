#pragma once

#include <deque>
#include <mutex>
#include <string>

#include "internal/stream/change_source.hpp"

namespace rowcast::stream {

// Appendable in-memory log; tests and local demos.
class MemoryChangeSource final : public ChangeSource {
 public:
  explicit MemoryChangeSource(std::string name = "memory");

  // Appends at the next position (last + 1) and returns it.
  util::Lsn Append(std::string payload);

  // Appends at an explicit position; throws util::InvalidArgument unless
  // it is greater than every position appended so far.
  void AppendAt(util::Lsn position, std::string payload);

  std::vector<PendingChange> Peek(util::Lsn from, std::size_t max) override;
  void                       Advance(util::Lsn to) override;
  std::string                Name() const override {
    return name_;
  }

  std::size_t Retained() const;

 private:
  std::string               name_;
  mutable std::mutex        mutex_;
  std::deque<PendingChange> log_;
  util::Lsn                 last_position_ = 0;
};

} // namespace rowcast::stream
