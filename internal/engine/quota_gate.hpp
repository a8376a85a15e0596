#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace graphflow::engine {

enum class DenialKind {
  kNone,
  kQuotaExceeded,
  kAccessDenied,
};

struct GateDecision {
  bool        allowed = true;
  DenialKind  denial  = DenialKind::kNone;
  std::string reason;

  static GateDecision Allow() {
    return {};
  }
  static GateDecision Deny(DenialKind kind, std::string reason) {
    return GateDecision{false, kind, std::move(reason)};
  }
};

/*
  Tenant/quota gate consulted before every node step with operation
  "node:<id>". A denial fails the execution without running the node.
*/
class QuotaGate {
 public:
  virtual ~QuotaGate() = default;

  virtual GateDecision Authorize(const std::string& tenant_id, const std::string& operation) = 0;
};

class AllowAllGate final : public QuotaGate {
 public:
  GateDecision Authorize(const std::string&, const std::string&) override {
    return GateDecision::Allow();
  }
};

/*
  In-process gate: a per-tenant budget of node steps plus a deny list.
  A budget of zero means unlimited.
*/
class StaticQuotaGate final : public QuotaGate {
 public:
  explicit StaticQuotaGate(uint64_t default_budget = 0);

  void SetBudget(const std::string& tenant_id, uint64_t budget);
  void DenyTenant(const std::string& tenant_id);
  void AllowTenant(const std::string& tenant_id);

  uint64_t Used(const std::string& tenant_id) const;
  void     Reset(const std::string& tenant_id);

  GateDecision Authorize(const std::string& tenant_id, const std::string& operation) override;

 private:
  uint64_t                                  default_budget_;
  mutable std::mutex                        mutex_;
  std::unordered_map<std::string, uint64_t> budgets_;
  std::unordered_map<std::string, uint64_t> used_;
  std::unordered_set<std::string>           denied_;
};

} // namespace graphflow::engine
