#include "routing_history.hpp"

#include <mutex>

namespace graphflow::router {

std::string RoutingHistory::Key(const std::string& from, const std::string& to) {
  return from + "->" + to;
}

void RoutingHistory::RecordOutcome(const std::string& from, const std::string& to, bool success, double confidence) {
  std::unique_lock lock(mutex_);
  auto& stats = stats_[Key(from, to)];
  ++stats.attempts;
  if (success) ++stats.successes;
  stats.total_confidence += confidence;
}

std::optional<double> RoutingHistory::SuccessRate(const std::string& from, const std::string& to) const {
  std::shared_lock lock(mutex_);
  auto it = stats_.find(Key(from, to));
  if (it == stats_.end() || it->second.attempts == 0) return std::nullopt;
  return static_cast<double>(it->second.successes) / static_cast<double>(it->second.attempts);
}

double RoutingHistory::SuccessRateOr(const std::string& from, const std::string& to, double fallback) const {
  return SuccessRate(from, to).value_or(fallback);
}

std::optional<double> RoutingHistory::AverageConfidence(const std::string& from, const std::string& to) const {
  std::shared_lock lock(mutex_);
  auto it = stats_.find(Key(from, to));
  if (it == stats_.end() || it->second.attempts == 0) return std::nullopt;
  return it->second.total_confidence / static_cast<double>(it->second.attempts);
}

std::optional<RoutingHistory::Stats> RoutingHistory::Get(const std::string& from, const std::string& to) const {
  std::shared_lock lock(mutex_);
  auto it = stats_.find(Key(from, to));
  if (it == stats_.end()) return std::nullopt;
  return it->second;
}

std::size_t RoutingHistory::Size() const {
  std::shared_lock lock(mutex_);
  return stats_.size();
}

void RoutingHistory::Clear() {
  std::unique_lock lock(mutex_);
  stats_.clear();
}

} // namespace graphflow::router
