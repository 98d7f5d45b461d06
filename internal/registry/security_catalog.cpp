#include "security_catalog.hpp"

#include "internal/observability/logging.hpp"

namespace rowcast::registry {

SecurityCatalog::SecurityCatalog(std::shared_ptr<db::Repository> repository, std::string consuming_role)
    : repository_(std::move(repository)), consuming_role_(std::move(consuming_role)) {
}

model::TableSecurity SecurityCatalog::Resolve(const std::string& schema_name, const std::string& table) const {
  auto tx     = repository_->Begin();
  auto record = repository_->GetTableSecurity(*tx, schema_name, table, consuming_role_);
  tx->Commit();

  model::TableSecurity security;
  security.schema_name = schema_name;
  security.table       = table;
  security.role        = consuming_role_;

  if (!record) {
    ROWCAST_LOG_WARN("no security metadata for table; failing closed",
                     {observability::StringField("entity", security.EntityName()), observability::StringField("role", consuming_role_)});
    security.is_rls_enabled = true;
    return security;
  }

  security.is_rls_enabled  = record->is_rls_enabled;
  security.granted_columns = std::move(record->granted_columns);
  return security;
}

void SecurityCatalog::Register(const model::TableSecurity& security) {
  db::model::TableSecurityRecord record;
  record.schema_name     = security.schema_name;
  record.table           = security.table;
  record.role            = security.role.empty() ? consuming_role_ : security.role;
  record.is_rls_enabled  = security.is_rls_enabled;
  record.granted_columns = security.granted_columns;

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->UpsertTableSecurity(*tx, record), "register table security for " + security.EntityName());
  tx->Commit();
}

} // namespace rowcast::registry
