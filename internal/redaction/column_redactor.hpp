#pragma once

#include <optional>
#include <string>

#include "internal/model/change_event.hpp"
#include "internal/model/table_security.hpp"
#include "internal/model/visibility_result.hpp"

namespace rowcast::redaction {

struct RedactionOutcome {
  model::ChangeEvent                    event;
  std::optional<model::VisibilityError> error;
};

/*
  ColumnRedactor

  Restricts columns, record and old_record to the columns the consuming
  role may SELECT. Runs before any visibility or filter logic so that an
  ungranted value can never surface through a predicate or an error
  message.

  Missing grant metadata (or metadata for a different role) is treated
  as zero granted columns and reported as a redaction error.

  Redaction is idempotent.
*/
class ColumnRedactor {
 public:
  explicit ColumnRedactor(std::string consuming_role);

  const std::string& ConsumingRole() const {
    return consuming_role_;
  }

  RedactionOutcome Redact(const model::ChangeEvent& event, const model::TableSecurity& security) const;

 private:
  std::string consuming_role_;
};

} // namespace rowcast::redaction
