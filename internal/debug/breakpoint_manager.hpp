#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "graphflow/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/state/state.hpp"

namespace graphflow::debug {

namespace breakpoints {

graphflow::v1::Breakpoint Node(const std::string& node_id);
// "key == value" or "key != value" over state data.
graphflow::v1::Breakpoint Condition(const std::string& expression, const std::string& node_id = {});
graphflow::v1::Breakpoint VariableChange(const std::string& key);
// Hits before a node when the previous node (optionally a specific one) ran longer than threshold.
graphflow::v1::Breakpoint Performance(uint64_t threshold_ms, const std::string& node_id = {});
graphflow::v1::Breakpoint Edge(const std::string& from, const std::string& to = {});
graphflow::v1::Breakpoint Exception(const std::string& node_id = {});

} // namespace breakpoints

/*
  Breakpoints of one debug session.

  Every evaluation that matches an enabled breakpoint bumps its hit count.
  With a repository, adds, removals and hit counts are written through
  (best effort; failures are logged).
*/
class BreakpointManager {
 public:
  explicit BreakpointManager(std::string session_id, std::shared_ptr<db::Repository> repository = nullptr);

  // Assigns id and created_at when missing; returns the stored breakpoint.
  graphflow::v1::Breakpoint Add(graphflow::v1::Breakpoint breakpoint);
  bool                      Remove(const std::string& id);
  bool                      SetEnabled(const std::string& id, bool enabled);
  void                      ResetHitCounts();

  std::optional<graphflow::v1::Breakpoint> Get(const std::string& id) const;
  std::vector<graphflow::v1::Breakpoint>   List() const;

  // Restores the session's persisted breakpoints; returns how many.
  std::size_t Load();

  // NODE, CONDITION, VARIABLE_CHANGE and PERFORMANCE, before entering node.
  std::vector<graphflow::v1::Breakpoint> EvaluateEnter(const std::string& node_id, const state::State& state,
                                                       const std::string&                        previous_node,
                                                       std::optional<std::chrono::milliseconds> previous_duration);
  std::vector<graphflow::v1::Breakpoint> EvaluateEdge(const std::string& from, const std::string& to);
  std::vector<graphflow::v1::Breakpoint> EvaluateError(const std::string& node_id);

 private:
  void Persist(const graphflow::v1::Breakpoint& breakpoint);
  void Hit(graphflow::v1::Breakpoint& breakpoint, std::vector<graphflow::v1::Breakpoint>& hits);

  std::string                     session_id_;
  std::shared_ptr<db::Repository> repository_;

  mutable std::mutex                               mutex_;
  std::map<std::string, graphflow::v1::Breakpoint> breakpoints_;
  std::vector<std::string>                         order_;
};

// Evaluates "key == value" / "key != value"; throws util::InvalidArgument on other syntax.
bool EvaluateCondition(const std::string& expression, const state::State& state);

} // namespace graphflow::debug
