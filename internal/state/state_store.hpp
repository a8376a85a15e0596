#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "graphflow/v1.hpp"
#include "internal/async/executor.hpp"
#include "internal/async/future.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/state/state.hpp"
#include "internal/state/state_cache.hpp"
#include "internal/storage/storage_backend.hpp"

namespace graphflow::state {

struct StateStoreOptions {
  // Serialized states at or above this size go to the blob store.
  uint64_t                  inline_threshold_bytes = 10240;
  std::chrono::milliseconds cache_ttl              = std::chrono::minutes(5);
  std::size_t               cache_max_entries      = 1024;
  bool                      fsync_blobs            = false;

  static StateStoreOptions FromConfig(const graphflow::runtime::config::StateStoreConfig& state_cfg,
                                      const graphflow::runtime::config::StorageConfig&    storage_cfg);
};

/*
  Durable home of execution state versions and checkpoints.

  Small states live inline in the repository record; large ones are
  written to the blob store first and the record keeps the key. A
  checkpoint is only inserted in the same transaction as (or after) the
  state version it references.

  All failures surface as util::PersistenceError, except lookups of a
  missing checkpoint which raise util::ReplayError.
*/
class StateStore {
 public:
  StateStore(std::shared_ptr<db::Repository> repository, storage::StorageBackendPtr blobs, async::Executor& io_executor,
             StateStoreOptions options = {});

  // No-op for clean states; marks the state clean on success.
  void SaveState(State& state);

  // Main-line version of an execution.
  std::optional<State> LoadState(const std::string& execution_id, uint64_t version);
  std::optional<State> LoadStateById(const std::string& state_id);
  std::optional<State> LatestState(const std::string& execution_id);

  graphflow::v1::Checkpoint CreateCheckpoint(State& state, const std::string& node_id, graphflow::v1::CheckpointType type,
                                             const std::string& description = {});

  // Fresh copy of the referenced version, positioned at the checkpoint node.
  State RestoreFromCheckpoint(const std::string& checkpoint_id);

  std::optional<graphflow::v1::Checkpoint> GetCheckpoint(const std::string& checkpoint_id);

  // Newest first.
  std::vector<graphflow::v1::Checkpoint> ListCheckpoints(const std::string& execution_id);

  // Transitions of the latest main-line state, ordered by timestamp.
  std::vector<graphflow::v1::StateTransition> GetStateHistory(const std::string& execution_id);

  // Every persisted version (main line and branches), ascending.
  std::vector<State> ListStates(const std::string& execution_id);

  // Deletes states (and their blobs) and checkpoints older than retention.
  std::size_t CleanOldStates(std::chrono::milliseconds retention);

  // Persistence I/O on the io executor; the future carries the clean state.
  async::Future<State>                     SaveStateAsync(State state);
  async::Future<graphflow::v1::Checkpoint> CreateCheckpointAsync(State state, std::string node_id, graphflow::v1::CheckpointType type,
                                                                 std::string description = {});

  StateCache& Cache() {
    return cache_;
  }

  const StateStoreOptions& Options() const {
    return options_;
  }

  static std::string BlobKey(const std::string& tenant_id, const std::string& state_id);

 private:
  // Writes the blob when needed and returns the record to upsert.
  db::model::StateRecord PrepareRecord(const State& state);
  State                  Materialize(const db::model::StateRecord& record);

  std::shared_ptr<db::Repository> repository_;
  storage::StorageBackendPtr      blobs_;
  async::Executor&                io_executor_;
  StateStoreOptions               options_;
  StateCache                      cache_;
};

// Record <-> proto helpers shared with the CLI.
graphflow::v1::Checkpoint ToProto(const db::model::CheckpointRecord& record);

} // namespace graphflow::state
