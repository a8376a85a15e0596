#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace graphflow::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                             UpsertState(Transaction&, const model::StateRecord&) override;
  std::optional<model::StateRecord>  GetState(Transaction&, const std::string&) override;
  std::optional<model::StateRecord>  GetLatestState(Transaction&, const std::string& execution_id) override;
  std::vector<model::StateRecord>    ListStates(Transaction&, const std::string& execution_id) override;
  std::vector<model::StateRecord>    ListStatesOlderThan(Transaction&, uint64_t cutoff_ms) override;
  Result                             DeleteState(Transaction&, const std::string&) override;

  Result                                 InsertCheckpoint(Transaction&, const model::CheckpointRecord&) override;
  std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&, const std::string&) override;
  std::vector<model::CheckpointRecord>   ListCheckpoints(Transaction&, const std::string& execution_id) override;
  std::vector<model::CheckpointRecord>   ListCheckpointsOlderThan(Transaction&, uint64_t cutoff_ms) override;
  Result                                 DeleteCheckpoint(Transaction&, const std::string&) override;

  Result                               UpsertBreakpoint(Transaction&, const model::BreakpointRecord&) override;
  std::vector<model::BreakpointRecord> ListBreakpoints(Transaction&, const std::string& session_id) override;
  Result                               DeleteBreakpoint(Transaction&, const std::string&) override;

  Result                               AppendTraceEvents(Transaction&, const std::vector<model::TraceEventRecord>&) override;
  std::vector<model::TraceEventRecord> ReadTraceEvents(Transaction&, const std::string& execution_id) override;
  Result                               DeleteTraceEventsOlderThan(Transaction&, uint64_t cutoff_ms) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::StateRecord>      states;
    std::unordered_map<std::string, model::CheckpointRecord> checkpoints;
    std::unordered_map<std::string, model::BreakpointRecord> breakpoints;

    // execution_id -> sequence -> event
    std::unordered_map<std::string, std::map<uint64_t, model::TraceEventRecord>> trace_events;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace graphflow::db::memory
