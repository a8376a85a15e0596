#pragma once

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace graphflow::router {

/*
  Outcome statistics per (from, to) edge, shared by every execution of
  an engine instance. Thread-safe.
*/
class RoutingHistory {
 public:
  struct Stats {
    uint64_t attempts         = 0;
    uint64_t successes        = 0;
    double   total_confidence = 0.0;
  };

  void RecordOutcome(const std::string& from, const std::string& to, bool success, double confidence);

  // nullopt until the edge has been attempted at least once.
  std::optional<double> SuccessRate(const std::string& from, const std::string& to) const;
  double                SuccessRateOr(const std::string& from, const std::string& to, double fallback) const;

  std::optional<double> AverageConfidence(const std::string& from, const std::string& to) const;
  std::optional<Stats>  Get(const std::string& from, const std::string& to) const;

  std::size_t Size() const;
  void        Clear();

 private:
  static std::string Key(const std::string& from, const std::string& to);

  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Stats> stats_;
};

} // namespace graphflow::router
