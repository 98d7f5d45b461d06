#include "pg_admission_evaluator.hpp"

#include <algorithm>
#include <chrono>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace rowcast::security {

namespace {

std::string JoinQuals(const std::vector<std::string>& quals, const char* op) {
  std::string out;
  for (const auto& qual : quals) {
    if (!out.empty()) {
      out += op;
    }
    out += "(" + qual + ")";
  }
  return out;
}

} // namespace

PgAdmissionEvaluator::PgAdmissionEvaluator(std::shared_ptr<db::postgres::PgPool> pool, std::string consuming_role, std::string claims_setting)
    : pool_(std::move(pool)), consuming_role_(std::move(consuming_role)), claims_setting_(std::move(claims_setting)) {
}

PgAdmissionEvaluator::TablePolicies PgAdmissionEvaluator::LoadPolicies(pqxx::transaction_base& tx, const model::ChangeEvent& event) const {
  auto res = tx.exec_params(
      "SELECT permissive, qual FROM pg_catalog.pg_policies "
      "WHERE schemaname=$1 AND tablename=$2 AND cmd IN ('SELECT','ALL') "
      "AND roles && ARRAY[$3::name, 'public'::name] AND qual IS NOT NULL "
      "ORDER BY policyname;",
      event.schema_name, event.table, consuming_role_);

  TablePolicies policies;
  for (const auto& row : res) {
    const std::string kind = row[0].c_str();
    if (kind == "RESTRICTIVE") {
      policies.restrictive.emplace_back(row[1].c_str());
    } else {
      policies.permissive.emplace_back(row[1].c_str());
    }
  }
  return policies;
}

std::string PgAdmissionEvaluator::BuildAdmissionQuery(pqxx::transaction_base& tx, const model::ChangeEvent& event, const TablePolicies& policies) {
  const auto qualified = tx.quote_name(event.schema_name) + "." + tx.quote_name(event.table);

  std::string where = "(" + JoinQuals(policies.permissive, " OR ") + ")";
  if (!policies.restrictive.empty()) {
    where += " AND " + JoinQuals(policies.restrictive, " AND ");
  }

  // The quals live in a lateral subquery keyed on c.claim so they run only
  // after set_config for the same identity. OFFSET 0 keeps the planner from
  // flattening either subquery and hoisting the quals above the claim.
  return "SELECT s.identity FROM unnest($1::text[]) AS s(identity) "
         "CROSS JOIN LATERAL (SELECT set_config($2, s.identity, true) AS claim OFFSET 0) AS c "
         "CROSS JOIN LATERAL (SELECT 1 FROM jsonb_populate_record(NULL::" +
         qualified + ", $3::jsonb) AS " + tx.quote_name(event.table) + " WHERE c.claim IS NOT NULL AND " + where + " OFFSET 0) AS ok;";
}

AdmissionResult PgAdmissionEvaluator::Admit(const model::ChangeEvent& event, const model::Record& row, const std::vector<std::string>& identities,
                                            Deadline deadline) {
  AdmissionResult result;
  if (identities.empty()) {
    return result;
  }

  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
  if (remaining.count() <= 0) {
    throw util::AdmissionTimeout("admission deadline passed before querying " + event.EntityName());
  }

  try {
    auto                   conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);

    tx.exec("SET LOCAL ROLE " + tx.quote_name(consuming_role_) + ";");
    tx.exec("SET LOCAL statement_timeout = " + std::to_string(std::max<int64_t>(1, remaining.count())) + ";");

    const auto policies = LoadPolicies(tx, event);
    if (policies.permissive.empty()) {
      // row security with no permissive policy denies every row
      return result;
    }

    auto res = tx.exec_params(BuildAdmissionQuery(tx, event, policies), identities, claims_setting_, util::ToJson(row));
    for (const auto& admitted : res) {
      result.admitted.insert(admitted[0].c_str());
    }
    return result;
  } catch (const pqxx::query_canceled& e) {
    throw util::AdmissionTimeout("admission for " + event.EntityName() + " canceled: " + e.what());
  } catch (const pqxx::broken_connection& e) {
    throw util::Unavailable(std::string("admission connection lost: ") + e.what());
  } catch (const pqxx::sql_error& e) {
    throw util::AdmissionError("admission query for " + event.EntityName() + " failed: " + e.what());
  }
}

} // namespace rowcast::security
