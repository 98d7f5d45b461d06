#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/table_security.hpp"

namespace rowcast::registry {

/*
  SecurityCatalog

  Resolves TableSecurity for the consuming role. When the repository has
  no metadata for a table the result fails closed: no columns granted and
  row security enabled.
*/
class SecurityCatalog {
 public:
  SecurityCatalog(std::shared_ptr<db::Repository> repository, std::string consuming_role);

  const std::string& ConsumingRole() const {
    return consuming_role_;
  }

  model::TableSecurity Resolve(const std::string& schema_name, const std::string& table) const;

  // Stores metadata for a table; the postgres backend rejects this (catalog-derived).
  void Register(const model::TableSecurity& security);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::string                     consuming_role_;
};

} // namespace rowcast::registry
