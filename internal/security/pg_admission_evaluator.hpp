#pragma once

#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/security/admission_evaluator.hpp"

namespace rowcast::security {

/*
  PgAdmissionEvaluator

  Delegates row-security admission to PostgreSQL. Per event it runs one
  read-only transaction:

    SET LOCAL ROLE <consuming role>
    SET LOCAL statement_timeout = <time left until deadline>
    SELECT s.identity
      FROM unnest($identities) s(identity)
      CROSS JOIN LATERAL (SELECT set_config(<claims setting>, s.identity, true)) c
      CROSS JOIN LATERAL jsonb_populate_record(NULL::<table>, $row) <table>
     WHERE (<permissive quals OR-ed>) AND (<restrictive quals AND-ed>)

  The changed row is materialized once from the event (not re-read from
  the table, which may already have moved on) and every subscriber's
  security context is tested against it in a single statement. Policy
  expressions come verbatim from pg_policies and are evaluated by the
  server.

  Columns missing from the (redacted) row materialize as NULL.
*/
class PgAdmissionEvaluator final : public AdmissionEvaluator {
 public:
  PgAdmissionEvaluator(std::shared_ptr<db::postgres::PgPool> pool, std::string consuming_role, std::string claims_setting);

  AdmissionResult Admit(const model::ChangeEvent& event, const model::Record& row, const std::vector<std::string>& identities,
                        Deadline deadline) override;

 private:
  struct TablePolicies {
    std::vector<std::string> permissive;
    std::vector<std::string> restrictive;
  };

  TablePolicies LoadPolicies(pqxx::transaction_base& tx, const model::ChangeEvent& event) const;

  static std::string BuildAdmissionQuery(pqxx::transaction_base& tx, const model::ChangeEvent& event, const TablePolicies& policies);

  std::shared_ptr<db::postgres::PgPool> pool_;
  std::string                           consuming_role_;
  std::string                           claims_setting_;
};

} // namespace rowcast::security
