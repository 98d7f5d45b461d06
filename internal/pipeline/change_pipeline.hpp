#pragma once

#include <cstddef>
#include <memory>

#include "internal/dispatch/dispatcher.hpp"
#include "internal/engine/visibility_engine.hpp"
#include "internal/stream/stream_cursor.hpp"

namespace rowcast::pipeline {

struct RunStats {
  std::size_t processed = 0;
  std::size_t failed    = 0;
};

/*
  ChangePipeline

  One pass over the stream: peek up to batch_size changes and, in order,
  decode -> evaluate -> dispatch each one, advancing the cursor right
  after its dispatch was accepted.

  The first failure stops the pass and leaves the cursor in front of the
  failing change:
    - DecodeError: logged with the position and a payload excerpt
    - anything thrown by evaluation, dispatch or the cursor
  Changes without a row (transaction markers) are advanced over.
*/
class ChangePipeline {
 public:
  ChangePipeline(std::shared_ptr<stream::StreamCursor> cursor, std::shared_ptr<engine::VisibilityEngine> engine,
                 std::shared_ptr<dispatch::Dispatcher> dispatcher, std::size_t batch_size);

  RunStats RunOnce();

 private:
  std::shared_ptr<stream::StreamCursor>     cursor_;
  std::shared_ptr<engine::VisibilityEngine> engine_;
  std::shared_ptr<dispatch::Dispatcher>     dispatcher_;
  std::size_t                               batch_size_;
};

} // namespace rowcast::pipeline
