#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/util/lsn.hpp"

namespace rowcast::stream {

// One raw payload as it sits in the change stream.
struct PendingChange {
  util::Lsn   position = 0;
  std::string payload;
};

/*
  ChangeSource

  Backend of a StreamCursor. Positions are strictly increasing within a
  source.

  Peek(from, max) returns up to max changes whose position is greater
  than from, in stream order, without consuming anything. It may be
  called repeatedly with the same arguments and returns the same
  changes until Advance() releases them.

  Advance(to) tells the backend that everything at or before to has
  been dispatched and may be discarded.
*/
class ChangeSource {
 public:
  virtual ~ChangeSource() = default;

  virtual std::vector<PendingChange> Peek(util::Lsn from, std::size_t max) = 0;

  virtual void Advance(util::Lsn to) = 0;

  // Key under which the cursor position is stored in the repository.
  virtual std::string Name() const = 0;
};

} // namespace rowcast::stream
