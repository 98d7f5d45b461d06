#include "rls_visibility_evaluator.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rowcast::security {

using model::ChangeKind;

namespace {

std::vector<std::string> DistinctIdentities(const std::vector<model::Subscription>& subscriptions) {
  std::vector<std::string> identities;
  identities.reserve(subscriptions.size());
  for (const auto& subscription : subscriptions) {
    identities.push_back(subscription.user_id);
  }
  std::sort(identities.begin(), identities.end());
  identities.erase(std::unique(identities.begin(), identities.end()), identities.end());
  return identities;
}

AdmissionResult AdmitAll(const std::vector<std::string>& identities) {
  AdmissionResult result;
  result.admitted.insert(identities.begin(), identities.end());
  return result;
}

} // namespace

RlsVisibilityEvaluator::RlsVisibilityEvaluator(std::shared_ptr<AdmissionEvaluator> admission, VisibilityOptions options)
    : admission_(std::move(admission)), options_(options) {
}

AdmissionResult RlsVisibilityEvaluator::Evaluate(const model::ChangeEvent& event, bool is_rls_enabled,
                                                 const std::vector<model::Subscription>& subscriptions) const {
  const auto identities = DistinctIdentities(subscriptions);
  if (identities.empty()) {
    return {};
  }

  // truncation is table-wide; there is no row to test
  if (event.kind == ChangeKind::kTruncate || !is_rls_enabled) {
    return AdmitAll(identities);
  }

  if (event.kind == ChangeKind::kDelete) {
    switch (options_.delete_visibility) {
      case DeleteVisibility::kAdmitAll:
        return AdmitAll(identities);
      case DeleteVisibility::kExcludeAll:
        return {};
      case DeleteVisibility::kEvaluateIdentity:
        break;
    }
  }

  const model::Record* row = event.kind == ChangeKind::kDelete ? (event.old_record ? &*event.old_record : nullptr)
                                                               : (event.record ? &*event.record : nullptr);
  if (row == nullptr) {
    AdmissionResult result;
    result.errors.push_back({model::ErrorCategory::kVisibility, "", std::string(model::KindName(event.kind)) + " event carries no row to admit"});
    return result;
  }

  const auto deadline = std::chrono::steady_clock::now() + options_.admission_timeout;

  AdmissionResult admitted;
  try {
    admitted = admission_->Admit(event, *row, identities, deadline);
  } catch (const util::AdmissionError& e) {
    ROWCAST_LOG_WARN("row security admission failed",
                     {observability::StringField("entity", event.EntityName()), observability::IntField("subscribers", identities.size()),
                      observability::StringField("error", e.what())});
    AdmissionResult failed;
    failed.errors.push_back({model::ErrorCategory::kVisibility, "", e.what()});
    return failed;
  }

  // the adapter's answer is intersected with the identities it was asked about
  std::erase_if(admitted.admitted, [&](const std::string& id) { return !std::binary_search(identities.begin(), identities.end(), id); });
  return admitted;
}

} // namespace rowcast::security
