#include "quota_gate.hpp"

namespace graphflow::engine {

StaticQuotaGate::StaticQuotaGate(uint64_t default_budget) : default_budget_(default_budget) {
}

void StaticQuotaGate::SetBudget(const std::string& tenant_id, uint64_t budget) {
  std::lock_guard lock(mutex_);
  budgets_[tenant_id] = budget;
}

void StaticQuotaGate::DenyTenant(const std::string& tenant_id) {
  std::lock_guard lock(mutex_);
  denied_.insert(tenant_id);
}

void StaticQuotaGate::AllowTenant(const std::string& tenant_id) {
  std::lock_guard lock(mutex_);
  denied_.erase(tenant_id);
}

uint64_t StaticQuotaGate::Used(const std::string& tenant_id) const {
  std::lock_guard lock(mutex_);
  auto it = used_.find(tenant_id);
  return it == used_.end() ? 0 : it->second;
}

void StaticQuotaGate::Reset(const std::string& tenant_id) {
  std::lock_guard lock(mutex_);
  used_.erase(tenant_id);
}

GateDecision StaticQuotaGate::Authorize(const std::string& tenant_id, const std::string& operation) {
  std::lock_guard lock(mutex_);
  if (denied_.count(tenant_id)) {
    return GateDecision::Deny(DenialKind::kAccessDenied, "tenant '" + tenant_id + "' may not perform " + operation);
  }

  auto budget = default_budget_;
  if (auto it = budgets_.find(tenant_id); it != budgets_.end()) budget = it->second;

  auto& used = used_[tenant_id];
  if (budget != 0 && used >= budget) {
    return GateDecision::Deny(DenialKind::kQuotaExceeded,
                              "tenant '" + tenant_id + "' exhausted its budget of " + std::to_string(budget) + " steps");
  }
  ++used;
  return GateDecision::Allow();
}

} // namespace graphflow::engine
