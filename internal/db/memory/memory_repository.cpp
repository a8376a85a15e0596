#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace graphflow::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// State versions
// ------------------------------------------------------------------

Result MemoryRepository::UpsertState(Transaction& t, const model::StateRecord& r) {
  if (r.state_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "state_id is empty");
  TX(t).Mutable().states[r.state_id] = r;
  return Result::Ok();
}

std::optional<model::StateRecord> MemoryRepository::GetState(Transaction& t, const std::string& state_id) {
  const auto& s  = TX(t).View();
  auto        it = s.states.find(state_id);
  if (it == s.states.end()) return std::nullopt;
  return it->second;
}

std::optional<model::StateRecord> MemoryRepository::GetLatestState(Transaction& t, const std::string& execution_id) {
  std::optional<model::StateRecord> latest;
  for (const auto& [_, record] : TX(t).View().states) {
    if (record.execution_id != execution_id || !record.branch_id.empty()) continue;
    if (!latest || record.version > latest->version) latest = record;
  }
  return latest;
}

std::vector<model::StateRecord> MemoryRepository::ListStates(Transaction& t, const std::string& execution_id) {
  std::vector<model::StateRecord> out;
  for (const auto& [_, record] : TX(t).View().states) {
    if (record.execution_id == execution_id) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.version != b.version) return a.version < b.version;
    return a.branch_id < b.branch_id;
  });
  return out;
}

std::vector<model::StateRecord> MemoryRepository::ListStatesOlderThan(Transaction& t, uint64_t cutoff_ms) {
  std::vector<model::StateRecord> out;
  for (const auto& [_, record] : TX(t).View().states) {
    if (record.created_at_ms < cutoff_ms) out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteState(Transaction& t, const std::string& state_id) {
  TX(t).Mutable().states.erase(state_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Checkpoints
// ------------------------------------------------------------------

Result MemoryRepository::InsertCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.checkpoints.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  s.checkpoints[r.id] = r;
  return Result::Ok();
}

std::optional<model::CheckpointRecord> MemoryRepository::GetCheckpoint(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.checkpoints.find(id);
  if (it == s.checkpoints.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CheckpointRecord> MemoryRepository::ListCheckpoints(Transaction& t, const std::string& execution_id) {
  std::vector<model::CheckpointRecord> out;
  for (const auto& [_, record] : TX(t).View().checkpoints) {
    if (record.execution_id == execution_id) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    if (a.state_version != b.state_version) return a.state_version > b.state_version;
    return a.id > b.id;
  });
  return out;
}

std::vector<model::CheckpointRecord> MemoryRepository::ListCheckpointsOlderThan(Transaction& t, uint64_t cutoff_ms) {
  std::vector<model::CheckpointRecord> out;
  for (const auto& [_, record] : TX(t).View().checkpoints) {
    if (record.created_at_ms < cutoff_ms) out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteCheckpoint(Transaction& t, const std::string& id) {
  TX(t).Mutable().checkpoints.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Breakpoints
// ------------------------------------------------------------------

Result MemoryRepository::UpsertBreakpoint(Transaction& t, const model::BreakpointRecord& r) {
  TX(t).Mutable().breakpoints[r.id] = r;
  return Result::Ok();
}

std::vector<model::BreakpointRecord> MemoryRepository::ListBreakpoints(Transaction& t, const std::string& session_id) {
  std::vector<model::BreakpointRecord> out;
  for (const auto& [_, record] : TX(t).View().breakpoints) {
    if (record.session_id == session_id) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

Result MemoryRepository::DeleteBreakpoint(Transaction& t, const std::string& id) {
  TX(t).Mutable().breakpoints.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Trace events
// ------------------------------------------------------------------

Result MemoryRepository::AppendTraceEvents(Transaction& t, const std::vector<model::TraceEventRecord>& events) {
  auto& s = TX(t).Mutable();
  for (const auto& event : events) {
    // replayed batches are idempotent
    s.trace_events[event.execution_id].try_emplace(event.sequence, event);
  }
  return Result::Ok();
}

std::vector<model::TraceEventRecord> MemoryRepository::ReadTraceEvents(Transaction& t, const std::string& execution_id) {
  const auto& s  = TX(t).View();
  auto        it = s.trace_events.find(execution_id);
  if (it == s.trace_events.end()) return {};

  std::vector<model::TraceEventRecord> out;
  out.reserve(it->second.size());
  for (const auto& [_, event] : it->second) {
    out.push_back(event);
  }
  return out;
}

Result MemoryRepository::DeleteTraceEventsOlderThan(Transaction& t, uint64_t cutoff_ms) {
  auto& s = TX(t).Mutable();
  for (auto it = s.trace_events.begin(); it != s.trace_events.end();) {
    auto& events = it->second;
    for (auto eit = events.begin(); eit != events.end();) {
      if (eit->second.timestamp_ms < cutoff_ms) {
        eit = events.erase(eit);
      } else {
        ++eit;
      }
    }
    if (events.empty()) {
      it = s.trace_events.erase(it);
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

} // namespace graphflow::db::memory
