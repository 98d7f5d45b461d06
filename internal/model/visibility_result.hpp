#pragma once

#include <set>
#include <string>
#include <vector>

#include "internal/model/change_event.hpp"

namespace rowcast::model {

enum class ErrorCategory {
  kRedaction,
  kVisibility,
  kFilter,
};

const char* ErrorCategoryName(ErrorCategory category);

// Per-subscriber (or per-event, when user_id is empty) evaluation fault.
struct VisibilityError {
  ErrorCategory category = ErrorCategory::kVisibility;
  std::string   user_id;
  std::string   message;
};

struct VisibilityResult {
  ChangeEvent                  event;
  bool                         is_rls_enabled = false;
  std::set<std::string>        visible_subscribers;
  std::vector<VisibilityError> errors;
};

inline const char* ErrorCategoryName(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::kRedaction:
      return "redaction";
    case ErrorCategory::kVisibility:
      return "visibility";
    case ErrorCategory::kFilter:
      return "filter";
  }
  return "unknown";
}

} // namespace rowcast::model
