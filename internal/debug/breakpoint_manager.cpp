#include "breakpoint_manager.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>

#include "internal/db/api/run_in_transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "internal/util/value.hpp"

namespace graphflow::debug {

using graphflow::v1::Breakpoint;
using observability::StringField;
namespace v1 = graphflow::v1;

namespace {

Breakpoint Make(v1::BreakpointType type) {
  Breakpoint bp;
  bp.set_type(type);
  bp.set_enabled(true);
  return bp;
}

std::string Trim(const std::string& s) {
  auto begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos) return {};
  auto end = s.find_last_not_of(" \t");
  return s.substr(begin, end - begin + 1);
}

} // namespace

namespace breakpoints {

Breakpoint Node(const std::string& node_id) {
  auto bp = Make(v1::BREAKPOINT_TYPE_NODE);
  bp.set_node_id(node_id);
  return bp;
}

Breakpoint Condition(const std::string& expression, const std::string& node_id) {
  auto bp = Make(v1::BREAKPOINT_TYPE_CONDITION);
  bp.set_condition(expression);
  bp.set_node_id(node_id);
  return bp;
}

Breakpoint VariableChange(const std::string& key) {
  auto bp = Make(v1::BREAKPOINT_TYPE_VARIABLE_CHANGE);
  bp.set_condition(key);
  return bp;
}

Breakpoint Performance(uint64_t threshold_ms, const std::string& node_id) {
  auto bp = Make(v1::BREAKPOINT_TYPE_PERFORMANCE);
  bp.set_threshold_ms(threshold_ms);
  bp.set_node_id(node_id);
  return bp;
}

Breakpoint Edge(const std::string& from, const std::string& to) {
  auto bp = Make(v1::BREAKPOINT_TYPE_EDGE);
  bp.set_node_id(from);
  bp.set_target_node_id(to);
  return bp;
}

Breakpoint Exception(const std::string& node_id) {
  auto bp = Make(v1::BREAKPOINT_TYPE_EXCEPTION);
  bp.set_node_id(node_id);
  return bp;
}

} // namespace breakpoints

bool EvaluateCondition(const std::string& expression, const state::State& state) {
  bool        negate = false;
  std::size_t pos    = expression.find("==");
  if (pos == std::string::npos) {
    pos    = expression.find("!=");
    negate = true;
  }
  if (pos == std::string::npos) throw util::InvalidArgument("unsupported breakpoint condition '" + expression + "'");

  const auto key      = Trim(expression.substr(0, pos));
  const auto expected = util::ParseLiteral(Trim(expression.substr(pos + 2)));
  if (key.empty()) throw util::InvalidArgument("breakpoint condition '" + expression + "' names no variable");

  auto current = state.Get(key);
  bool equal   = current && util::ValueEquals(*current, expected);
  return negate ? !equal : equal;
}

BreakpointManager::BreakpointManager(std::string session_id, std::shared_ptr<db::Repository> repository)
    : session_id_(std::move(session_id)), repository_(std::move(repository)) {
}

void BreakpointManager::Persist(const Breakpoint& breakpoint) {
  if (!repository_) return;

  db::model::BreakpointRecord record;
  record.id            = breakpoint.id();
  record.session_id    = session_id_;
  record.updated_at_ms = util::ToUnixMillis(util::Now());
  auto status          = google::protobuf::util::MessageToJsonString(breakpoint, &record.json);

  try {
    if (!status.ok()) throw util::PersistenceError("failed to serialize breakpoint: " + std::string(status.message()));
    db::RunInTransaction(*repository_, [&](db::Transaction& tx) { db::ThrowIfDbError(repository_->UpsertBreakpoint(tx, record), "upsert breakpoint"); });
  } catch (const util::PersistenceError& e) {
    GRAPHFLOW_LOG_ERROR("failed to persist breakpoint", {StringField("session_id", session_id_), StringField("breakpoint_id", breakpoint.id()),
                                                         StringField("error", e.what())});
  }
}

Breakpoint BreakpointManager::Add(Breakpoint breakpoint) {
  if (breakpoint.type() == v1::BREAKPOINT_TYPE_UNSPECIFIED) throw util::InvalidArgument("breakpoint type is required");
  if (breakpoint.type() == v1::BREAKPOINT_TYPE_CONDITION || breakpoint.type() == v1::BREAKPOINT_TYPE_VARIABLE_CHANGE) {
    if (breakpoint.condition().empty()) throw util::InvalidArgument("breakpoint needs a condition or variable name");
  }
  if (breakpoint.type() == v1::BREAKPOINT_TYPE_NODE && breakpoint.node_id().empty()) {
    throw util::InvalidArgument("node breakpoint needs a node id");
  }

  if (breakpoint.id().empty()) breakpoint.set_id(util::NewId("bp"));
  if (!breakpoint.has_created_at()) *breakpoint.mutable_created_at() = util::ToProto(util::Now());
  breakpoint.set_session_id(session_id_);

  {
    std::lock_guard lock(mutex_);
    if (!breakpoints_.count(breakpoint.id())) order_.push_back(breakpoint.id());
    breakpoints_[breakpoint.id()] = breakpoint;
  }
  Persist(breakpoint);
  return breakpoint;
}

bool BreakpointManager::Remove(const std::string& id) {
  {
    std::lock_guard lock(mutex_);
    if (breakpoints_.erase(id) == 0) return false;
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
  }

  if (repository_) {
    try {
      db::RunInTransaction(*repository_, [&](db::Transaction& tx) { db::ThrowIfDbError(repository_->DeleteBreakpoint(tx, id), "delete breakpoint"); });
    } catch (const util::NotFound&) {
      // never persisted
    } catch (const util::PersistenceError& e) {
      GRAPHFLOW_LOG_ERROR("failed to delete breakpoint", {StringField("breakpoint_id", id), StringField("error", e.what())});
    }
  }
  return true;
}

bool BreakpointManager::SetEnabled(const std::string& id, bool enabled) {
  Breakpoint copy;
  {
    std::lock_guard lock(mutex_);
    auto            it = breakpoints_.find(id);
    if (it == breakpoints_.end()) return false;
    it->second.set_enabled(enabled);
    copy = it->second;
  }
  Persist(copy);
  return true;
}

void BreakpointManager::ResetHitCounts() {
  std::lock_guard lock(mutex_);
  for (auto& [_, bp] : breakpoints_) {
    bp.set_hit_count(0);
    bp.clear_last_value();
  }
}

std::optional<Breakpoint> BreakpointManager::Get(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto            it = breakpoints_.find(id);
  if (it == breakpoints_.end()) return std::nullopt;
  return it->second;
}

std::vector<Breakpoint> BreakpointManager::List() const {
  std::lock_guard         lock(mutex_);
  std::vector<Breakpoint> out;
  out.reserve(order_.size());
  for (const auto& id : order_) out.push_back(breakpoints_.at(id));
  return out;
}

std::size_t BreakpointManager::Load() {
  if (!repository_) return 0;

  auto tx      = repository_->Begin();
  auto records = repository_->ListBreakpoints(*tx, session_id_);

  std::size_t     loaded = 0;
  std::lock_guard lock(mutex_);
  for (const auto& record : records) {
    Breakpoint bp;
    auto       status = google::protobuf::util::JsonStringToMessage(record.json, &bp);
    if (!status.ok()) {
      GRAPHFLOW_LOG_WARN("skipping corrupt breakpoint", {StringField("breakpoint_id", record.id), StringField("error", std::string(status.message()))});
      continue;
    }
    if (!breakpoints_.count(bp.id())) order_.push_back(bp.id());
    breakpoints_[bp.id()] = bp;
    ++loaded;
  }
  return loaded;
}

// ------------------------------------------------------------
// Evaluation
// ------------------------------------------------------------

void BreakpointManager::Hit(Breakpoint& breakpoint, std::vector<Breakpoint>& hits) {
  breakpoint.set_hit_count(breakpoint.hit_count() + 1);
  hits.push_back(breakpoint);
}

std::vector<Breakpoint> BreakpointManager::EvaluateEnter(const std::string& node_id, const state::State& state,
                                                         const std::string&                        previous_node,
                                                         std::optional<std::chrono::milliseconds> previous_duration) {
  std::vector<Breakpoint> hits;
  {
    std::lock_guard lock(mutex_);
    for (const auto& id : order_) {
      auto& bp = breakpoints_.at(id);
      if (!bp.enabled()) continue;

      switch (bp.type()) {
        case v1::BREAKPOINT_TYPE_NODE:
          if (bp.node_id() == node_id) Hit(bp, hits);
          break;

        case v1::BREAKPOINT_TYPE_CONDITION: {
          if (!bp.node_id().empty() && bp.node_id() != node_id) break;
          bool matched = false;
          try {
            matched = EvaluateCondition(bp.condition(), state);
          } catch (const util::InvalidArgument& e) {
            GRAPHFLOW_LOG_WARN("breakpoint condition invalid", {StringField("breakpoint_id", bp.id()), StringField("error", e.what())});
          }
          if (matched) Hit(bp, hits);
          break;
        }

        case v1::BREAKPOINT_TYPE_VARIABLE_CHANGE: {
          auto current = state.Get(bp.condition()).value_or(util::NullValue());
          if (!bp.has_last_value()) {
            *bp.mutable_last_value() = current;
            break;
          }
          if (!util::ValueEquals(bp.last_value(), current)) {
            *bp.mutable_last_value() = current;
            Hit(bp, hits);
          }
          break;
        }

        case v1::BREAKPOINT_TYPE_PERFORMANCE:
          if (!previous_duration || previous_node.empty()) break;
          if (!bp.node_id().empty() && bp.node_id() != previous_node) break;
          if (static_cast<uint64_t>(previous_duration->count()) > bp.threshold_ms()) Hit(bp, hits);
          break;

        default:
          break;
      }
    }
  }
  for (const auto& bp : hits) Persist(bp);
  return hits;
}

std::vector<Breakpoint> BreakpointManager::EvaluateEdge(const std::string& from, const std::string& to) {
  std::vector<Breakpoint> hits;
  {
    std::lock_guard lock(mutex_);
    for (const auto& id : order_) {
      auto& bp = breakpoints_.at(id);
      if (!bp.enabled() || bp.type() != v1::BREAKPOINT_TYPE_EDGE) continue;
      if (!bp.node_id().empty() && bp.node_id() != from) continue;
      if (!bp.target_node_id().empty() && bp.target_node_id() != to) continue;
      Hit(bp, hits);
    }
  }
  for (const auto& bp : hits) Persist(bp);
  return hits;
}

std::vector<Breakpoint> BreakpointManager::EvaluateError(const std::string& node_id) {
  std::vector<Breakpoint> hits;
  {
    std::lock_guard lock(mutex_);
    for (const auto& id : order_) {
      auto& bp = breakpoints_.at(id);
      if (!bp.enabled() || bp.type() != v1::BREAKPOINT_TYPE_EXCEPTION) continue;
      if (!bp.node_id().empty() && bp.node_id() != node_id) continue;
      Hit(bp, hits);
    }
  }
  for (const auto& bp : hits) Persist(bp);
  return hits;
}

} // namespace graphflow::debug
