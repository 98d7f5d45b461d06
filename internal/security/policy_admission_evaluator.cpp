#include "policy_admission_evaluator.hpp"

#include <algorithm>
#include <future>
#include <iterator>
#include <mutex>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace rowcast::security {

namespace {

constexpr std::size_t kDeadlineCheckInterval = 256;

} // namespace

PolicyAdmissionEvaluator::PolicyAdmissionEvaluator(std::size_t shard_size) : shard_size_(shard_size == 0 ? 1 : shard_size) {
}

void PolicyAdmissionEvaluator::AddPolicy(const std::string& entity, RowPolicy policy) {
  std::unique_lock lock(mutex_);
  policies_[entity].push_back(std::move(policy));
}

void PolicyAdmissionEvaluator::ClearPolicies(const std::string& entity) {
  std::unique_lock lock(mutex_);
  policies_.erase(entity);
}

RowPolicy PolicyAdmissionEvaluator::OwnerColumnPolicy(std::string column) {
  return [column = std::move(column)](const model::Record& row, const std::string& identity) {
    auto it = row.fields().find(column);
    if (it == row.fields().end()) {
      return false;
    }
    if (it->second.kind_case() == google::protobuf::Value::kNullValue) {
      return false;
    }
    return util::ValueToText(it->second) == identity;
  };
}

PolicyAdmissionEvaluator::ShardOutcome PolicyAdmissionEvaluator::EvaluateShard(const std::vector<RowPolicy>& policies, const model::Record& row,
                                                                               const std::vector<std::string>& identities, std::size_t begin,
                                                                               std::size_t end, Deadline deadline) {
  ShardOutcome outcome;
  for (std::size_t i = begin; i < end; ++i) {
    if ((i - begin) % kDeadlineCheckInterval == 0 && std::chrono::steady_clock::now() > deadline) {
      outcome.timed_out = true;
      return outcome;
    }

    const auto& identity = identities[i];
    try {
      const bool admitted = std::any_of(policies.begin(), policies.end(), [&](const RowPolicy& policy) { return policy(row, identity); });
      if (admitted) {
        outcome.admitted.push_back(identity);
      }
    } catch (const std::exception& e) {
      outcome.errors.push_back({model::ErrorCategory::kVisibility, identity, std::string("row policy failed: ") + e.what()});
    }
  }
  return outcome;
}

AdmissionResult PolicyAdmissionEvaluator::Admit(const model::ChangeEvent& event, const model::Record& row, const std::vector<std::string>& identities,
                                                Deadline deadline) {
  AdmissionResult result;
  if (identities.empty()) {
    return result;
  }

  std::vector<RowPolicy> policies;
  {
    std::shared_lock lock(mutex_);
    auto             it = policies_.find(event.EntityName());
    if (it != policies_.end()) {
      policies = it->second;
    }
  }
  if (policies.empty()) {
    return result;
  }

  std::vector<ShardOutcome> outcomes;
  if (identities.size() <= shard_size_) {
    outcomes.push_back(EvaluateShard(policies, row, identities, 0, identities.size(), deadline));
  } else {
    std::vector<std::future<ShardOutcome>> shards;
    for (std::size_t begin = 0; begin < identities.size(); begin += shard_size_) {
      const auto end = std::min(begin + shard_size_, identities.size());
      shards.push_back(std::async(std::launch::async, [&policies, &row, &identities, begin, end, deadline] {
        return EvaluateShard(policies, row, identities, begin, end, deadline);
      }));
    }
    for (auto& shard : shards) {
      outcomes.push_back(shard.get());
    }
  }

  for (auto& outcome : outcomes) {
    if (outcome.timed_out) {
      throw util::AdmissionTimeout("row policy evaluation for " + event.EntityName() + " exceeded its deadline");
    }
    result.admitted.insert(outcome.admitted.begin(), outcome.admitted.end());
    std::move(outcome.errors.begin(), outcome.errors.end(), std::back_inserter(result.errors));
  }
  return result;
}

} // namespace rowcast::security
