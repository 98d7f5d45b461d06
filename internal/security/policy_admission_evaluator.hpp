#pragma once

#include <cstddef>
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/security/admission_evaluator.hpp"

namespace rowcast::security {

// Returns true when `identity` may see `row`. May throw; the throw is
// reported as a visibility error for that identity only.
using RowPolicy = std::function<bool(const model::Record& row, const std::string& identity)>;

/*
  PolicyAdmissionEvaluator

  In-process admission for hosts that expose their row-security rules
  as callables (embedded deployments, tests).

  Policies registered for an entity are permissive and OR-ed. An entity
  without any policy admits nobody (row security with no policy denies
  every row).

  Identities are split into shards of `shard_size` and shards are
  evaluated concurrently; the call returns only after every shard is
  complete.
*/
class PolicyAdmissionEvaluator final : public AdmissionEvaluator {
 public:
  explicit PolicyAdmissionEvaluator(std::size_t shard_size = 1024);

  void AddPolicy(const std::string& entity, RowPolicy policy);
  void ClearPolicies(const std::string& entity);

  AdmissionResult Admit(const model::ChangeEvent& event, const model::Record& row, const std::vector<std::string>& identities,
                        Deadline deadline) override;

  // identity == row[column] (string compare of the JSON value)
  static RowPolicy OwnerColumnPolicy(std::string column);

 private:
  struct ShardOutcome {
    std::vector<std::string>            admitted;
    std::vector<model::VisibilityError> errors;
    bool                                timed_out = false;
  };

  static ShardOutcome EvaluateShard(const std::vector<RowPolicy>& policies, const model::Record& row, const std::vector<std::string>& identities,
                                    std::size_t begin, std::size_t end, Deadline deadline);

  std::size_t shard_size_;

  std::shared_mutex                                       mutex_;
  std::unordered_map<std::string, std::vector<RowPolicy>> policies_;
};

} // namespace rowcast::security
