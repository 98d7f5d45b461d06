#pragma once

#include <chrono>
#include <set>
#include <string>
#include <vector>

#include "internal/model/change_event.hpp"
#include "internal/model/visibility_result.hpp"

namespace rowcast::security {

using Deadline = std::chrono::steady_clock::time_point;

struct AdmissionResult {
  std::set<std::string>               admitted;
  std::vector<model::VisibilityError> errors;
};

/*
  AdmissionEvaluator

  Host-delegated row-security primitive:

    admits(row, identity) -> bool, batched over all identities of one event.

  Implementations materialize the row once and evaluate every identity
  against it in a single set-oriented pass. They never reinterpret the
  host's policy language themselves.

  Contract:
    - admitted is a subset of identities
    - a failure for an individual identity is reported in errors and the
      identity is left out of admitted
    - util::AdmissionTimeout when the deadline passes
    - util::AdmissionError when the whole batch could not be evaluated
    - anything else is fatal for the event
*/
class AdmissionEvaluator {
 public:
  virtual ~AdmissionEvaluator() = default;

  virtual AdmissionResult Admit(const model::ChangeEvent& event, const model::Record& row, const std::vector<std::string>& identities,
                                Deadline deadline) = 0;
};

} // namespace rowcast::security
