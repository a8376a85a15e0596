#include "backtrack_registry.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace graphflow::router {

using observability::StringField;

void BacktrackRegistry::Save(BacktrackPoint point) {
  if (point.created_at == util::TimePoint{}) point.created_at = util::Now();
  if (!point.chosen.empty()) point.tried.insert(point.chosen);
  std::lock_guard lock(mutex_);
  points_[point.execution_id].push_back(std::move(point));
}

BacktrackResult BacktrackRegistry::Backtrack(const std::string& execution_id, const std::string& current_node) {
  BacktrackResult result;

  std::lock_guard lock(mutex_);
  auto it = points_.find(execution_id);
  if (it == points_.end() || it->second.empty()) {
    result.message = "No backtrack points available";
    return result;
  }

  auto& point = it->second.back();
  point.tried.insert(current_node);

  const std::pair<std::string, double>* best = nullptr;
  for (const auto& alternative : point.alternatives) {
    if (point.tried.count(alternative.first)) continue;
    if (!best || alternative.second > best->second) best = &alternative;
  }

  if (!best) {
    GRAPHFLOW_LOG_DEBUG("backtrack point exhausted", {StringField("execution_id", execution_id), StringField("node", point.node_id)});
    it->second.pop_back();
    if (it->second.empty()) points_.erase(it);
    result.message = "All alternative paths have been tried";
    return result;
  }

  point.tried.insert(best->first);

  result.success   = true;
  result.from_node = point.node_id;
  result.next_node = best->first;
  result.state     = point.state.Derive();
  result.message   = "Backtracking to try alternative path";
  return result;
}

std::size_t BacktrackRegistry::PointCount(const std::string& execution_id) const {
  std::lock_guard lock(mutex_);
  auto it = points_.find(execution_id);
  return it == points_.end() ? 0 : it->second.size();
}

std::size_t BacktrackRegistry::TotalPoints() const {
  std::lock_guard lock(mutex_);
  std::size_t total = 0;
  for (const auto& [_, stack] : points_) total += stack.size();
  return total;
}

std::optional<BacktrackPoint> BacktrackRegistry::Latest(const std::string& execution_id) const {
  std::lock_guard lock(mutex_);
  auto it = points_.find(execution_id);
  if (it == points_.end() || it->second.empty()) return std::nullopt;
  return it->second.back();
}

std::size_t BacktrackRegistry::CleanupOlderThan(std::chrono::milliseconds max_age) {
  const auto  cutoff  = util::Now() - max_age;
  std::size_t removed = 0;

  std::lock_guard lock(mutex_);
  for (auto it = points_.begin(); it != points_.end();) {
    auto& stack  = it->second;
    auto  before = stack.size();
    stack.erase(std::remove_if(stack.begin(), stack.end(), [&](const BacktrackPoint& p) { return p.created_at < cutoff; }), stack.end());
    removed += before - stack.size();
    it = stack.empty() ? points_.erase(it) : std::next(it);
  }
  return removed;
}

void BacktrackRegistry::ClearExecution(const std::string& execution_id) {
  std::lock_guard lock(mutex_);
  points_.erase(execution_id);
}

} // namespace graphflow::router
