#pragma once

#include <memory>

#include "internal/filter/filter_evaluator.hpp"
#include "internal/model/visibility_result.hpp"
#include "internal/redaction/column_redactor.hpp"
#include "internal/registry/security_catalog.hpp"
#include "internal/registry/subscription_registry.hpp"
#include "internal/security/rls_visibility_evaluator.hpp"

namespace rowcast::engine {

/*
  VisibilityEngine

  Computes the VisibilityResult of one decoded event:

    1. redact to the consuming role's granted columns
    2. load the entity's subscriptions
    3. row-security admission (one batched call)
    4. per-subscriber filters

  Per-subscriber problems end up in result.errors. Exceptions leaving
  Evaluate() (repository or admission backend unavailable) are fatal for
  the event and must not advance the cursor.
*/
class VisibilityEngine {
 public:
  VisibilityEngine(std::shared_ptr<registry::SecurityCatalog> catalog, std::shared_ptr<registry::SubscriptionRegistry> registry,
                   std::shared_ptr<security::RlsVisibilityEvaluator> rls, filter::FilterEvaluator filters);

  model::VisibilityResult Evaluate(const model::ChangeEvent& event) const;

 private:
  std::shared_ptr<registry::SecurityCatalog>        catalog_;
  std::shared_ptr<registry::SubscriptionRegistry>   registry_;
  redaction::ColumnRedactor                         redactor_;
  std::shared_ptr<security::RlsVisibilityEvaluator> rls_;
  filter::FilterEvaluator                           filters_;
};

} // namespace rowcast::engine
