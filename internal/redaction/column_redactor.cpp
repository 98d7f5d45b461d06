#include "column_redactor.hpp"

#include <set>
#include <vector>

namespace rowcast::redaction {

namespace {

void RestrictRecord(model::Record& record, const std::set<std::string>& granted) {
  std::vector<std::string> drop;
  for (const auto& [name, _] : record.fields()) {
    if (!granted.contains(name)) {
      drop.push_back(name);
    }
  }
  for (const auto& name : drop) {
    record.mutable_fields()->erase(name);
  }
}

} // namespace

ColumnRedactor::ColumnRedactor(std::string consuming_role) : consuming_role_(std::move(consuming_role)) {
}

RedactionOutcome ColumnRedactor::Redact(const model::ChangeEvent& event, const model::TableSecurity& security) const {
  RedactionOutcome outcome;
  outcome.event = event;

  static const std::set<std::string> kNothingGranted;
  const std::set<std::string>*       granted = &kNothingGranted;

  if (!security.granted_columns.has_value()) {
    outcome.error = model::VisibilityError{model::ErrorCategory::kRedaction, "",
                                           "no column grant metadata for " + event.EntityName() + " and role " + consuming_role_};
  } else if (security.role != consuming_role_) {
    outcome.error = model::VisibilityError{model::ErrorCategory::kRedaction, "",
                                           "grant metadata for " + event.EntityName() + " belongs to role " + security.role + ", expected " +
                                               consuming_role_};
  } else {
    granted = &*security.granted_columns;
  }

  auto& columns = outcome.event.columns;
  std::erase_if(columns, [&](const model::Column& column) { return !granted->contains(column.name); });

  if (outcome.event.record) {
    RestrictRecord(*outcome.event.record, *granted);
  }
  if (outcome.event.old_record) {
    RestrictRecord(*outcome.event.old_record, *granted);
  }
  return outcome;
}

} // namespace rowcast::redaction
