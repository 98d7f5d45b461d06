#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/stream/change_source.hpp"

namespace rowcast::stream {

/*
  StreamCursor

  Single sequential reader over a ChangeSource with a durable position.

    Peek(max)        pending changes after Position(); repeatable
    Consume(max)     Peek, then durably advance past what was returned
    Advance(pos)     durably move to pos; moving backwards is rejected

  On construction the position is restored from the repository (keyed by
  the source name), so a restarted process resumes after the last
  advanced change. Anything peeked but not advanced is redelivered.
*/
class StreamCursor {
 public:
  StreamCursor(std::shared_ptr<ChangeSource> source, std::shared_ptr<db::Repository> repository);

  std::vector<PendingChange> Peek(std::size_t max) const;

  std::vector<PendingChange> Consume(std::size_t max);

  // Throws util::InvalidState when position < Position().
  void Advance(util::Lsn position);

  util::Lsn Position() const;

  std::string SourceName() const {
    return source_->Name();
  }

 private:
  void AdvanceLocked(util::Lsn position);

  std::shared_ptr<ChangeSource>   source_;
  std::shared_ptr<db::Repository> repository_;

  mutable std::mutex mutex_;
  util::Lsn          position_ = 0;
};

} // namespace rowcast::stream
