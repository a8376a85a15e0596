#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "graphflow/v1.hpp"
#include "internal/util/time.hpp"

namespace graphflow::state {

/*
  Working memory of one execution at one version.

  Backed by a StateRecord message: copies are deep, so a derived or
  forked State never shares mutable structure with its parent.

  Every mutator marks the state dirty; StateStore::SaveState skips clean
  states.
*/
class State {
 public:
  State() = default;

  static State Create(const std::string& workflow_id, const std::string& execution_id, const std::string& tenant_id,
                      const google::protobuf::Struct& initial_data = {});

  // Rehydrated states are clean.
  static State FromRecord(graphflow::v1::StateRecord record);
  static State FromJson(const std::string& json);

  // version + 1, deep copy of data, path, metadata and transitions.
  State Derive() const;
  // Derive() owned by a parallel branch.
  State Fork(const std::string& branch_id) const;

  const std::string& WorkflowId() const {
    return record_.workflow_id();
  }
  const std::string& ExecutionId() const {
    return record_.execution_id();
  }
  const std::string& TenantId() const {
    return record_.tenant_id();
  }
  const std::string& BranchId() const {
    return record_.branch_id();
  }
  uint64_t Version() const {
    return record_.version();
  }

  // <execution>_v<version>, or <execution>.<branch>_v<version> for branches.
  std::string StateId() const;

  const std::string& CurrentNode() const {
    return record_.current_node();
  }
  void SetCurrentNode(const std::string& node_id);

  // ------------------------------------------------------------
  // Data
  // ------------------------------------------------------------
  const google::protobuf::Struct&        Data() const {
    return record_.data();
  }
  std::optional<google::protobuf::Value> Get(const std::string& key) const;
  bool                                   Has(const std::string& key) const;
  void                                   Set(const std::string& key, google::protobuf::Value value);
  bool                                   Erase(const std::string& key);
  std::vector<std::string>               Keys() const;

  // ------------------------------------------------------------
  // Path / transitions
  // ------------------------------------------------------------
  std::vector<std::string> Path() const;
  std::size_t              PathLength() const {
    return static_cast<std::size_t>(record_.execution_path_size());
  }
  void AppendPath(const std::string& node_id);

  void                                         AddTransition(const std::string& from, const std::string& to, const std::string& reason);
  std::vector<graphflow::v1::StateTransition> Transitions() const;

  // ------------------------------------------------------------
  // Metadata
  // ------------------------------------------------------------
  std::optional<std::string> Metadata(const std::string& key) const;
  void                       SetMetadata(const std::string& key, const std::string& value);
  void                       EraseMetadata(const std::string& key);

  util::TimePoint Timestamp() const;

  /*
    Join a parallel branch back into this state.

    Data keys the branch wrote since fork_base overwrite ours (last writer
    wins), metadata likewise. Keys present in fork_base that the branch
    erased are erased here as well. Path entries and transitions the
    branch added after fork_base are appended. The version becomes the max of both so it never
    moves backwards.
  */
  void Merge(const State& branch, const State& fork_base);

  bool IsDirty() const {
    return dirty_;
  }
  void MarkClean() {
    dirty_ = false;
  }
  void MarkDirty() {
    dirty_ = true;
  }

  const graphflow::v1::StateRecord& Record() const {
    return record_;
  }
  std::string ToJson() const;
  std::size_t ByteSize() const;

 private:
  void Touch();

  graphflow::v1::StateRecord record_;
  bool                       dirty_ = true;
};

} // namespace graphflow::state
