#include "visibility_engine.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace rowcast::engine {

VisibilityEngine::VisibilityEngine(std::shared_ptr<registry::SecurityCatalog> catalog, std::shared_ptr<registry::SubscriptionRegistry> registry,
                                   std::shared_ptr<security::RlsVisibilityEvaluator> rls, filter::FilterEvaluator filters)
    : catalog_(std::move(catalog)),
      registry_(std::move(registry)),
      redactor_(catalog_->ConsumingRole()),
      rls_(std::move(rls)),
      filters_(filters) {
}

model::VisibilityResult VisibilityEngine::Evaluate(const model::ChangeEvent& event) const {
  observability::SpanScope span("VisibilityEngine.Evaluate");
  span.SetAttribute("rowcast.entity", event.EntityName());
  span.SetAttribute("rowcast.kind", model::KindName(event.kind));

  const auto start = std::chrono::steady_clock::now();

  model::VisibilityResult result;

  const auto security = catalog_->Resolve(event.schema_name, event.table);
  auto       redacted = redactor_.Redact(event, security);
  result.event          = std::move(redacted.event);
  result.is_rls_enabled = security.is_rls_enabled;
  if (redacted.error) {
    result.errors.push_back(std::move(*redacted.error));
  }

  auto lookup = registry_->ForEntity(event.EntityName());
  result.errors.insert(result.errors.end(), lookup.errors.begin(), lookup.errors.end());
  span.SetAttribute("rowcast.subscriptions", static_cast<std::int64_t>(lookup.subscriptions.size()));

  auto admission = rls_->Evaluate(result.event, result.is_rls_enabled, lookup.subscriptions);
  result.errors.insert(result.errors.end(), admission.errors.begin(), admission.errors.end());

  filters_.Apply(result.event, lookup.subscriptions, admission.admitted, result.errors);
  result.visible_subscribers = std::move(admission.admitted);

  span.SetAttribute("rowcast.visible_subscribers", static_cast<std::int64_t>(result.visible_subscribers.size()));
  span.SetAttribute("rowcast.errors", static_cast<std::int64_t>(result.errors.size()));

  auto& metrics = observability::Metrics::Instance();
  metrics.ObserveEvaluateLatencyMs(model::KindName(event.kind),
                                   std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count());
  metrics.RecordAdmitted(result.visible_subscribers.size());
  for (const auto& error : result.errors) {
    metrics.RecordError(model::ErrorCategoryName(error.category));
  }

  if (!result.errors.empty()) {
    ROWCAST_LOG_DEBUG("event evaluated with errors", {observability::StringField("entity", event.EntityName()),
                                                      observability::IntField("errors", static_cast<std::int64_t>(result.errors.size()))});
  }
  return result;
}

} // namespace rowcast::engine
