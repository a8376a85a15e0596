#include "state.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/value.hpp"

namespace graphflow::state {

State State::Create(const std::string& workflow_id, const std::string& execution_id, const std::string& tenant_id,
                    const google::protobuf::Struct& initial_data) {
  if (execution_id.empty()) {
    throw util::InvalidArgument("execution id must not be empty");
  }

  State s;
  s.record_.set_workflow_id(workflow_id);
  s.record_.set_execution_id(execution_id);
  s.record_.set_tenant_id(tenant_id);
  s.record_.set_version(1);
  *s.record_.mutable_data() = initial_data;
  s.Touch();
  return s;
}

State State::FromRecord(graphflow::v1::StateRecord record) {
  State s;
  s.record_ = std::move(record);
  s.dirty_  = false;
  return s;
}

State State::FromJson(const std::string& json) {
  graphflow::v1::StateRecord record;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &record, options);
  if (!status.ok()) {
    throw util::PersistenceError("corrupt state payload: " + std::string(status.message()));
  }
  return FromRecord(std::move(record));
}

State State::Derive() const {
  State next;
  next.record_ = record_;
  next.record_.set_version(record_.version() + 1);
  next.Touch();
  return next;
}

State State::Fork(const std::string& branch_id) const {
  State next = Derive();
  next.record_.set_branch_id(branch_id);
  return next;
}

std::string State::StateId() const {
  if (record_.branch_id().empty()) {
    return record_.execution_id() + "_v" + std::to_string(record_.version());
  }
  return record_.execution_id() + "." + record_.branch_id() + "_v" + std::to_string(record_.version());
}

void State::SetCurrentNode(const std::string& node_id) {
  record_.set_current_node(node_id);
  Touch();
}

// ------------------------------------------------------------
// Data
// ------------------------------------------------------------

std::optional<google::protobuf::Value> State::Get(const std::string& key) const {
  const auto& fields = record_.data().fields();
  auto        it     = fields.find(key);
  if (it == fields.end()) return std::nullopt;
  return it->second;
}

bool State::Has(const std::string& key) const {
  return record_.data().fields().contains(key);
}

void State::Set(const std::string& key, google::protobuf::Value value) {
  (*record_.mutable_data()->mutable_fields())[key] = std::move(value);
  Touch();
}

bool State::Erase(const std::string& key) {
  const bool erased = record_.mutable_data()->mutable_fields()->erase(key) > 0;
  if (erased) Touch();
  return erased;
}

std::vector<std::string> State::Keys() const {
  std::vector<std::string> keys;
  keys.reserve(record_.data().fields_size());
  for (const auto& [key, _] : record_.data().fields()) {
    keys.push_back(key);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

// ------------------------------------------------------------
// Path / transitions
// ------------------------------------------------------------

std::vector<std::string> State::Path() const {
  return {record_.execution_path().begin(), record_.execution_path().end()};
}

void State::AppendPath(const std::string& node_id) {
  record_.add_execution_path(node_id);
  Touch();
}

void State::AddTransition(const std::string& from, const std::string& to, const std::string& reason) {
  auto* t = record_.add_transitions();
  t->set_from_node(from);
  t->set_to_node(to);
  t->set_reason(reason);
  *t->mutable_timestamp() = util::ToProto(util::Now());
  Touch();
}

std::vector<graphflow::v1::StateTransition> State::Transitions() const {
  return {record_.transitions().begin(), record_.transitions().end()};
}

// ------------------------------------------------------------
// Metadata
// ------------------------------------------------------------

std::optional<std::string> State::Metadata(const std::string& key) const {
  auto it = record_.metadata().find(key);
  if (it == record_.metadata().end()) return std::nullopt;
  return it->second;
}

void State::SetMetadata(const std::string& key, const std::string& value) {
  (*record_.mutable_metadata())[key] = value;
  Touch();
}

void State::EraseMetadata(const std::string& key) {
  if (record_.mutable_metadata()->erase(key) > 0) Touch();
}

util::TimePoint State::Timestamp() const {
  return util::FromProto(record_.timestamp());
}

void State::Merge(const State& branch, const State& fork_base) {
  // Only keys the branch wrote (absent from or different to the fork base) are applied.
  const auto& base_fields = fork_base.record_.data().fields();
  for (const auto& [key, value] : branch.record_.data().fields()) {
    auto it = base_fields.find(key);
    if (it != base_fields.end() && util::ValueEquals(it->second, value)) continue;
    (*record_.mutable_data()->mutable_fields())[key] = value;
  }
  const auto& branch_fields = branch.record_.data().fields();
  for (const auto& [key, _] : base_fields) {
    if (branch_fields.count(key) == 0) record_.mutable_data()->mutable_fields()->erase(key);
  }

  const auto& base_metadata = fork_base.record_.metadata();
  for (const auto& [key, value] : branch.record_.metadata()) {
    auto it = base_metadata.find(key);
    if (it != base_metadata.end() && it->second == value) continue;
    (*record_.mutable_metadata())[key] = value;
  }
  for (const auto& [key, _] : base_metadata) {
    if (branch.record_.metadata().count(key) == 0) record_.mutable_metadata()->erase(key);
  }

  for (int i = fork_base.record_.execution_path_size(); i < branch.record_.execution_path_size(); ++i) {
    record_.add_execution_path(branch.record_.execution_path(i));
  }

  for (int i = fork_base.record_.transitions_size(); i < branch.record_.transitions_size(); ++i) {
    *record_.add_transitions() = branch.record_.transitions(i);
  }

  record_.set_version(std::max(record_.version(), branch.record_.version()));
  Touch();
}

std::string State::ToJson() const {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(record_, &json);
  if (!status.ok()) {
    throw util::PersistenceError("failed to serialize state: " + std::string(status.message()));
  }
  return json;
}

std::size_t State::ByteSize() const {
  return record_.ByteSizeLong();
}

void State::Touch() {
  *record_.mutable_timestamp() = util::ToProto(util::Now());
  dirty_                       = true;
}

} // namespace graphflow::state
