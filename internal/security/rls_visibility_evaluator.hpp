#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "internal/model/subscription.hpp"
#include "internal/security/admission_evaluator.hpp"

namespace rowcast::security {

// What row security means for a DELETE, whose old_record carries only
// replica identity columns.
enum class DeleteVisibility {
  kEvaluateIdentity, // run admission against the identity columns
  kAdmitAll,         // every entity subscriber sees deletes
  kExcludeAll,       // no subscriber sees deletes on row-secured tables
};

struct VisibilityOptions {
  DeleteVisibility          delete_visibility = DeleteVisibility::kEvaluateIdentity;
  std::chrono::milliseconds admission_timeout{5000};
};

/*
  RlsVisibilityEvaluator

  Decides which subscribers of an entity row security admits for one
  (already redacted) event:

    TRUNCATE                 every subscriber
    RLS disabled             every subscriber
    INSERT / UPDATE          admission against record
    DELETE                   per DeleteVisibility

  Admission is a single batched call per event. A timed out or failed
  batch excludes every subscriber and is recorded as a visibility error;
  it never widens the admitted set. Other exceptions propagate.
*/
class RlsVisibilityEvaluator {
 public:
  RlsVisibilityEvaluator(std::shared_ptr<AdmissionEvaluator> admission, VisibilityOptions options);

  AdmissionResult Evaluate(const model::ChangeEvent& event, bool is_rls_enabled, const std::vector<model::Subscription>& subscriptions) const;

 private:
  std::shared_ptr<AdmissionEvaluator> admission_;
  VisibilityOptions                   options_;
};

} // namespace rowcast::security
