#include "stream_cursor.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace rowcast::stream {

StreamCursor::StreamCursor(std::shared_ptr<ChangeSource> source, std::shared_ptr<db::Repository> repository)
    : source_(std::move(source)), repository_(std::move(repository)) {
  auto tx     = repository_->Begin();
  auto stored = repository_->GetCursorPosition(*tx, source_->Name());
  tx->Commit();

  if (stored) {
    position_ = stored->position;
    ROWCAST_LOG_INFO("resuming stream cursor",
                     {observability::StringField("source", source_->Name()), observability::StringField("position", util::FormatLsn(position_))});
  }
}

std::vector<PendingChange> StreamCursor::Peek(std::size_t max) const {
  std::lock_guard lock(mutex_);
  return source_->Peek(position_, max);
}

std::vector<PendingChange> StreamCursor::Consume(std::size_t max) {
  std::lock_guard lock(mutex_);
  auto            changes = source_->Peek(position_, max);
  if (!changes.empty()) {
    AdvanceLocked(changes.back().position);
  }
  return changes;
}

void StreamCursor::Advance(util::Lsn position) {
  std::lock_guard lock(mutex_);
  AdvanceLocked(position);
}

util::Lsn StreamCursor::Position() const {
  std::lock_guard lock(mutex_);
  return position_;
}

void StreamCursor::AdvanceLocked(util::Lsn position) {
  if (position < position_) {
    throw util::InvalidState("cursor cannot move backwards from " + util::FormatLsn(position_) + " to " + util::FormatLsn(position));
  }
  if (position == position_) {
    return;
  }

  // the stored position is authoritative; the source only releases storage
  db::model::CursorPositionRecord record;
  record.slot_name     = source_->Name();
  record.position      = position;
  record.updated_at_ms = util::ToUnixMillis(util::Now());

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->CommitCursorPosition(*tx, record), "commit cursor position");
  tx->Commit();

  position_ = position;
  source_->Advance(position);
}

} // namespace rowcast::stream
