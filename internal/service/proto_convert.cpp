#include "proto_convert.hpp"

#include "internal/util/lsn.hpp"
#include "internal/util/time.hpp"

namespace rowcast::service {

rowcast::v1::ChangeKind ToProto(model::ChangeKind kind) {
  switch (kind) {
    case model::ChangeKind::kInsert:
      return rowcast::v1::CHANGE_KIND_INSERT;
    case model::ChangeKind::kUpdate:
      return rowcast::v1::CHANGE_KIND_UPDATE;
    case model::ChangeKind::kDelete:
      return rowcast::v1::CHANGE_KIND_DELETE;
    case model::ChangeKind::kTruncate:
      return rowcast::v1::CHANGE_KIND_TRUNCATE;
  }
  return rowcast::v1::CHANGE_KIND_UNSPECIFIED;
}

rowcast::v1::ErrorCategory ToProto(model::ErrorCategory category) {
  switch (category) {
    case model::ErrorCategory::kRedaction:
      return rowcast::v1::ERROR_CATEGORY_REDACTION;
    case model::ErrorCategory::kVisibility:
      return rowcast::v1::ERROR_CATEGORY_VISIBILITY;
    case model::ErrorCategory::kFilter:
      return rowcast::v1::ERROR_CATEGORY_FILTER;
  }
  return rowcast::v1::ERROR_CATEGORY_UNSPECIFIED;
}

rowcast::v1::ChangeEvent ToProto(const model::ChangeEvent& event) {
  rowcast::v1::ChangeEvent out;
  out.set_kind(ToProto(event.kind));
  out.set_schema(event.schema_name);
  out.set_table(event.table);
  *out.mutable_commit_timestamp() = util::ToProto(event.commit_timestamp);

  for (const auto& column : event.columns) {
    auto* c = out.add_columns();
    c->set_name(column.name);
    c->set_type(column.type);
  }

  if (event.record) *out.mutable_record() = *event.record;
  if (event.old_record) *out.mutable_old_record() = *event.old_record;
  return out;
}

rowcast::v1::VisibilityError ToProto(const model::VisibilityError& error) {
  rowcast::v1::VisibilityError out;
  out.set_category(ToProto(error.category));
  out.set_user_id(error.user_id);
  out.set_message(error.message);
  return out;
}

rowcast::v1::Delivery ToProto(const dispatch::Delivery& delivery) {
  rowcast::v1::Delivery out;
  out.set_position(util::FormatLsn(delivery.position));
  *out.mutable_event() = ToProto(delivery.event);
  out.set_is_rls_enabled(delivery.is_rls_enabled);
  return out;
}

} // namespace rowcast::service
