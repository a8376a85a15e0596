#include "state_store.hpp"

#include <algorithm>

#include "internal/db/api/run_in_transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace graphflow::state {

using graphflow::v1::Checkpoint;
using graphflow::v1::CheckpointType;
using observability::IntField;
using observability::StringField;

namespace {

/*
  Persistence and replay errors pass through; anything else a backend
  throws (Arrow, sqlite, pqxx, filesystem) is rewrapped.
*/
template <typename Fn>
auto Guard(const char* what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::PersistenceError&) {
    throw;
  } catch (const util::ReplayError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::PersistenceError(std::string(what) + ": " + e.what());
  }
}

std::string MainLineStateId(const std::string& execution_id, uint64_t version) {
  return execution_id + "_v" + std::to_string(version);
}

} // namespace

StateStoreOptions StateStoreOptions::FromConfig(const graphflow::runtime::config::StateStoreConfig& state_cfg,
                                                const graphflow::runtime::config::StorageConfig&    storage_cfg) {
  StateStoreOptions options;
  if (state_cfg.inline_threshold_bytes() > 0) options.inline_threshold_bytes = state_cfg.inline_threshold_bytes();
  if (state_cfg.has_cache_ttl()) options.cache_ttl = util::ToMillis(state_cfg.cache_ttl(), options.cache_ttl);
  if (state_cfg.cache_max_entries() > 0) options.cache_max_entries = state_cfg.cache_max_entries();
  options.fsync_blobs = storage_cfg.disk().fsync();
  return options;
}

Checkpoint ToProto(const db::model::CheckpointRecord& record) {
  Checkpoint cp;
  cp.set_id(record.id);
  cp.set_execution_id(record.execution_id);
  cp.set_workflow_id(record.workflow_id);
  cp.set_node_id(record.node_id);
  cp.set_state_version(record.state_version);
  cp.set_state_id(record.state_id);
  cp.set_location(record.location);
  cp.set_type(record.type);
  cp.set_description(record.description);
  *cp.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  return cp;
}

StateStore::StateStore(std::shared_ptr<db::Repository> repository, storage::StorageBackendPtr blobs, async::Executor& io_executor,
                       StateStoreOptions options)
    : repository_(std::move(repository)),
      blobs_(std::move(blobs)),
      io_executor_(io_executor),
      options_(options),
      cache_(options.cache_ttl, options.cache_max_entries) {
  if (!repository_) throw util::InvalidArgument("StateStore requires a repository");
  if (!blobs_) throw util::InvalidArgument("StateStore requires a blob store");
}

std::string StateStore::BlobKey(const std::string& tenant_id, const std::string& state_id) {
  return "states/" + storage::common::KeySegment(tenant_id) + "/" + storage::common::KeySegment(state_id) + ".json";
}

// ------------------------------------------------------------
// Record conversion
// ------------------------------------------------------------

db::model::StateRecord StateStore::PrepareRecord(const State& state) {
  const auto json = state.ToJson();

  db::model::StateRecord record;
  record.state_id      = state.StateId();
  record.execution_id  = state.ExecutionId();
  record.workflow_id   = state.WorkflowId();
  record.tenant_id     = state.TenantId();
  record.branch_id     = state.BranchId();
  record.version       = state.Version();
  record.size_bytes    = json.size();
  record.created_at_ms = util::ToUnixMillis(util::Now());

  if (json.size() < options_.inline_threshold_bytes) {
    record.inline_json = json;
  } else {
    record.blob_path = BlobKey(state.TenantId(), record.state_id);
    blobs_->Write(record.blob_path, storage::common::BufferFromString(json), options_.fsync_blobs);
  }
  return record;
}

State StateStore::Materialize(const db::model::StateRecord& record) {
  if (!record.blob_path.empty()) {
    try {
      return State::FromJson(storage::common::BufferToString(blobs_->Read(record.blob_path)));
    } catch (const util::NotFound&) {
      throw util::PersistenceError("state blob missing for " + record.state_id + " at " + record.blob_path);
    }
  }
  return State::FromJson(record.inline_json);
}

// ------------------------------------------------------------
// Save / load
// ------------------------------------------------------------

void StateStore::SaveState(State& state) {
  if (!state.IsDirty()) return;

  Guard("save state", [&] {
    auto record = PrepareRecord(state);
    db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      db::ThrowIfDbError(repository_->UpsertState(tx, record), "upsert state " + record.state_id);
    });

    GRAPHFLOW_LOG_DEBUG("state saved", {StringField("state_id", record.state_id), IntField("bytes", static_cast<int64_t>(record.size_bytes)),
                                        StringField("location", record.blob_path.empty() ? "inline" : "blob")});
  });

  state.MarkClean();
  cache_.Put(state);
}

std::optional<State> StateStore::LoadState(const std::string& execution_id, uint64_t version) {
  return LoadStateById(MainLineStateId(execution_id, version));
}

std::optional<State> StateStore::LoadStateById(const std::string& state_id) {
  if (auto cached = cache_.Get(state_id)) return cached;

  auto loaded = Guard("load state", [&]() -> std::optional<State> {
    auto tx     = repository_->Begin();
    auto record = repository_->GetState(*tx, state_id);
    tx.reset();
    if (!record) return std::nullopt;
    return Materialize(*record);
  });

  if (loaded) cache_.Put(*loaded);
  return loaded;
}

std::optional<State> StateStore::LatestState(const std::string& execution_id) {
  return Guard("load latest state", [&]() -> std::optional<State> {
    auto tx     = repository_->Begin();
    auto record = repository_->GetLatestState(*tx, execution_id);
    tx.reset();
    if (!record) return std::nullopt;

    if (auto cached = cache_.Get(record->state_id)) return cached;
    auto state = Materialize(*record);
    cache_.Put(state);
    return state;
  });
}

std::vector<State> StateStore::ListStates(const std::string& execution_id) {
  return Guard("list states", [&] {
    auto tx      = repository_->Begin();
    auto records = repository_->ListStates(*tx, execution_id);
    tx.reset();

    std::vector<State> out;
    out.reserve(records.size());
    for (const auto& record : records) {
      out.push_back(Materialize(record));
    }
    return out;
  });
}

// ------------------------------------------------------------
// Checkpoints
// ------------------------------------------------------------

Checkpoint StateStore::CreateCheckpoint(State& state, const std::string& node_id, CheckpointType type, const std::string& description) {
  db::model::CheckpointRecord checkpoint;
  checkpoint.id            = util::NewId("cp");
  checkpoint.execution_id  = state.ExecutionId();
  checkpoint.workflow_id   = state.WorkflowId();
  checkpoint.node_id       = node_id;
  checkpoint.state_id      = state.StateId();
  checkpoint.state_version = state.Version();
  checkpoint.type          = type;
  checkpoint.description   = description;
  checkpoint.created_at_ms = util::ToUnixMillis(util::Now());

  Guard("create checkpoint", [&] {
    // A clean state may still be missing from this store (restored or
    // built elsewhere); the record is written unless it already exists.
    std::optional<db::model::StateRecord> record;
    if (state.IsDirty()) record = PrepareRecord(state);

    db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      if (!record) {
        if (auto existing = repository_->GetState(tx, checkpoint.state_id)) {
          checkpoint.location = existing->blob_path.empty() ? graphflow::v1::STORAGE_LOCATION_INLINE : graphflow::v1::STORAGE_LOCATION_BLOB;
        } else {
          record = PrepareRecord(state);
        }
      }
      if (record) {
        checkpoint.location = record->blob_path.empty() ? graphflow::v1::STORAGE_LOCATION_INLINE : graphflow::v1::STORAGE_LOCATION_BLOB;
        db::ThrowIfDbError(repository_->UpsertState(tx, *record), "upsert state " + record->state_id);
      }
      db::ThrowIfDbError(repository_->InsertCheckpoint(tx, checkpoint), "insert checkpoint " + checkpoint.id);
    });
  });

  state.MarkClean();
  cache_.Put(state);

  observability::Metrics::Instance().RecordCheckpoint(graphflow::v1::CheckpointType_Name(type));
  GRAPHFLOW_LOG_INFO("checkpoint created", {StringField("checkpoint_id", checkpoint.id), StringField("execution_id", checkpoint.execution_id),
                                            StringField("node_id", node_id), IntField("version", static_cast<int64_t>(checkpoint.state_version)),
                                            StringField("type", graphflow::v1::CheckpointType_Name(type))});
  return ToProto(checkpoint);
}

std::optional<Checkpoint> StateStore::GetCheckpoint(const std::string& checkpoint_id) {
  return Guard("get checkpoint", [&]() -> std::optional<Checkpoint> {
    auto tx     = repository_->Begin();
    auto record = repository_->GetCheckpoint(*tx, checkpoint_id);
    if (!record) return std::nullopt;
    return ToProto(*record);
  });
}

State StateStore::RestoreFromCheckpoint(const std::string& checkpoint_id) {
  auto checkpoint = GetCheckpoint(checkpoint_id);
  if (!checkpoint) throw util::ReplayError("checkpoint not found: " + checkpoint_id);

  auto state = LoadStateById(checkpoint->state_id());
  if (!state) {
    throw util::ReplayError("checkpoint " + checkpoint_id + " references missing state " + checkpoint->state_id());
  }

  State restored = *state;
  restored.SetCurrentNode(checkpoint->node_id());
  restored.SetMetadata("restored_from_checkpoint", checkpoint_id);

  GRAPHFLOW_LOG_INFO("state restored from checkpoint", {StringField("checkpoint_id", checkpoint_id), StringField("state_id", checkpoint->state_id()),
                                                        StringField("node_id", checkpoint->node_id())});
  return restored;
}

std::vector<Checkpoint> StateStore::ListCheckpoints(const std::string& execution_id) {
  return Guard("list checkpoints", [&] {
    auto tx      = repository_->Begin();
    auto records = repository_->ListCheckpoints(*tx, execution_id);

    std::vector<Checkpoint> out;
    out.reserve(records.size());
    for (const auto& record : records) {
      out.push_back(ToProto(record));
    }
    return out;
  });
}

std::vector<graphflow::v1::StateTransition> StateStore::GetStateHistory(const std::string& execution_id) {
  auto latest = LatestState(execution_id);
  if (!latest) return {};

  auto transitions = latest->Transitions();
  std::stable_sort(transitions.begin(), transitions.end(), [](const auto& a, const auto& b) {
    if (a.timestamp().seconds() != b.timestamp().seconds()) return a.timestamp().seconds() < b.timestamp().seconds();
    return a.timestamp().nanos() < b.timestamp().nanos();
  });
  return transitions;
}

// ------------------------------------------------------------
// Retention
// ------------------------------------------------------------

std::size_t StateStore::CleanOldStates(std::chrono::milliseconds retention) {
  const auto cutoff_ms = util::ToUnixMillis(util::Now() - retention);

  std::vector<std::string> blob_keys;
  auto removed = Guard("clean old states", [&] {
    return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      blob_keys.clear();
      std::size_t count = 0;

      for (const auto& checkpoint : repository_->ListCheckpointsOlderThan(tx, cutoff_ms)) {
        db::ThrowIfDbError(repository_->DeleteCheckpoint(tx, checkpoint.id), "delete checkpoint " + checkpoint.id);
        ++count;
      }
      for (const auto& record : repository_->ListStatesOlderThan(tx, cutoff_ms)) {
        db::ThrowIfDbError(repository_->DeleteState(tx, record.state_id), "delete state " + record.state_id);
        if (!record.blob_path.empty()) blob_keys.push_back(record.blob_path);
        cache_.Remove(record.state_id);
        ++count;
      }
      return count;
    });
  });

  // Blobs go only after the records are gone, so no record ever points at
  // a deleted blob.
  for (const auto& key : blob_keys) {
    try {
      blobs_->Remove(key);
    } catch (const std::exception& e) {
      GRAPHFLOW_LOG_WARN("failed to remove state blob", {StringField("key", key), StringField("error", e.what())});
    }
  }

  cache_.EvictExpired();

  if (removed > 0) {
    GRAPHFLOW_LOG_INFO("old states cleaned", {IntField("removed", static_cast<int64_t>(removed)), IntField("retention_ms", retention.count())});
  }
  return removed;
}

// ------------------------------------------------------------
// Async variants
// ------------------------------------------------------------

async::Future<State> StateStore::SaveStateAsync(State state) {
  return async::Async(io_executor_, [this, state]() mutable {
    SaveState(state);
    return state;
  });
}

async::Future<Checkpoint> StateStore::CreateCheckpointAsync(State state, std::string node_id, CheckpointType type, std::string description) {
  return async::Async(io_executor_, [this, state, node_id = std::move(node_id), type, description = std::move(description)]() mutable {
    return CreateCheckpoint(state, node_id, type, description);
  });
}

} // namespace graphflow::state
