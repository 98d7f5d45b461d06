#pragma once

#include <string>

#include "internal/stream/change_source.hpp"

namespace rowcast::stream {

/*
  FileChangeSource

  Replays a JSON-lines file, one payload per line. The position of a
  line is its 1-based line number; blank lines hold a position but
  yield nothing. The file is re-read on every Peek so appended lines
  are picked up. Advance is a no-op: the file is never rewritten and
  the cursor keeps the durable position.
*/
class FileChangeSource final : public ChangeSource {
 public:
  explicit FileChangeSource(std::string path);

  std::vector<PendingChange> Peek(util::Lsn from, std::size_t max) override;
  void                       Advance(util::Lsn to) override;
  std::string                Name() const override;

 private:
  std::string path_;
};

} // namespace rowcast::stream
