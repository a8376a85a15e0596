#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/state/state.hpp"
#include "internal/util/time.hpp"

namespace graphflow::router {

/*
  A routing decision that had close contenders. The saved state is a
  derived copy taken when the decision was made; alternatives keep the
  candidate order of the decision. The branch actually taken (chosen)
  and every alternative handed out by Backtrack() count as tried, so a
  failure further down any of them moves on to the next candidate.
*/
struct BacktrackPoint {
  std::string                                  execution_id;
  std::string                                  node_id;
  state::State                                 state;
  std::vector<std::pair<std::string, double>>  alternatives;
  std::string                                  chosen;
  std::set<std::string>                        tried;
  util::TimePoint                              created_at;
};

struct BacktrackResult {
  bool                        success = false;
  // Node whose decision is being revisited.
  std::string                 from_node;
  std::string                 next_node;
  std::optional<state::State> state;
  std::string                 message;
};

/*
  Per-execution stack of backtrack points. Thread-safe; shared by all
  executions of one engine.

  Backtrack() consults the newest point. Once its alternatives are
  exhausted the point is popped, so the next call falls through to the
  one saved before it.
*/
class BacktrackRegistry {
 public:
  void Save(BacktrackPoint point);

  BacktrackResult Backtrack(const std::string& execution_id, const std::string& current_node);

  std::size_t PointCount(const std::string& execution_id) const;
  std::size_t TotalPoints() const;

  std::optional<BacktrackPoint> Latest(const std::string& execution_id) const;

  // Drops points created before now - max_age; returns how many.
  std::size_t CleanupOlderThan(std::chrono::milliseconds max_age);
  void        ClearExecution(const std::string& execution_id);

 private:
  mutable std::mutex                                           mutex_;
  std::unordered_map<std::string, std::vector<BacktrackPoint>> points_;
};

} // namespace graphflow::router
