#pragma once

#include "internal/model/visibility_result.hpp"

namespace rowcast::dispatch {

/*
  Downstream of the pipeline.

  Accept() returning normally means the event was taken and the cursor
  may advance past it. Throwing (util::Unavailable for back-pressure)
  leaves the cursor where it is and the event is offered again later,
  so implementations must tolerate redelivery of the same position.
*/
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual void Accept(const model::VisibilityResult& result) = 0;
};

} // namespace rowcast::dispatch
