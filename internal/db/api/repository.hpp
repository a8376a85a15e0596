#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/breakpoint_record.hpp"
#include "internal/db/model/checkpoint_record.hpp"
#include "internal/db/model/state_record.hpp"
#include "internal/db/model/trace_event_record.hpp"

namespace graphflow::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A state row is immutable once written; a new version is a new row

  The DB is the source of truth for:
    state versions (or the pointer to their blob)
    checkpoints
    debugger breakpoints
    persisted trace events
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // State versions
  // ---------------------------------------------------------------------

  virtual Result UpsertState(Transaction&, const model::StateRecord&) = 0;

  virtual std::optional<model::StateRecord> GetState(Transaction&, const std::string& state_id) = 0;

  // Highest version on the main line (branch_id empty) of an execution.
  virtual std::optional<model::StateRecord> GetLatestState(Transaction&, const std::string& execution_id) = 0;

  // All versions of an execution, ascending by (version, branch_id).
  virtual std::vector<model::StateRecord> ListStates(Transaction&, const std::string& execution_id) = 0;

  virtual std::vector<model::StateRecord> ListStatesOlderThan(Transaction&, uint64_t cutoff_ms) = 0;

  virtual Result DeleteState(Transaction&, const std::string& state_id) = 0;

  // ---------------------------------------------------------------------
  // Checkpoints
  // ---------------------------------------------------------------------

  virtual Result InsertCheckpoint(Transaction&, const model::CheckpointRecord&) = 0;

  virtual std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&, const std::string& id) = 0;

  // Newest first.
  virtual std::vector<model::CheckpointRecord> ListCheckpoints(Transaction&, const std::string& execution_id) = 0;

  virtual std::vector<model::CheckpointRecord> ListCheckpointsOlderThan(Transaction&, uint64_t cutoff_ms) = 0;

  virtual Result DeleteCheckpoint(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Debugger breakpoints
  // ---------------------------------------------------------------------

  virtual Result UpsertBreakpoint(Transaction&, const model::BreakpointRecord&) = 0;

  virtual std::vector<model::BreakpointRecord> ListBreakpoints(Transaction&, const std::string& session_id) = 0;

  virtual Result DeleteBreakpoint(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Trace events
  // ---------------------------------------------------------------------

  virtual Result AppendTraceEvents(Transaction&, const std::vector<model::TraceEventRecord>& events) = 0;

  // Ascending by sequence.
  virtual std::vector<model::TraceEventRecord> ReadTraceEvents(Transaction&, const std::string& execution_id) = 0;

  virtual Result DeleteTraceEventsOlderThan(Transaction&, uint64_t cutoff_ms) = 0;
};

} // namespace graphflow::db
