#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace graphflow::util {

/*
  Central error types.

  Node and router failures are written into state metadata before any of
  these escape an execution future.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ------------------------------------------------------------
// Graph validation
// ------------------------------------------------------------

class GraphCycleError : public std::runtime_error {
 public:
  explicit GraphCycleError(std::vector<std::string> cycle) : std::runtime_error(Describe(cycle)), cycle_(std::move(cycle)) {
  }

  const std::vector<std::string>& Cycle() const {
    return cycle_;
  }

 private:
  static std::string Describe(const std::vector<std::string>& cycle) {
    std::string out = "workflow graph contains a cycle: ";
    for (size_t i = 0; i < cycle.size(); ++i) {
      if (i) out += " -> ";
      out += cycle[i];
    }
    return out;
  }

  std::vector<std::string> cycle_;
};

class UnknownNodeError : public std::runtime_error {
 public:
  explicit UnknownNodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ------------------------------------------------------------
// Execution
// ------------------------------------------------------------

class NodeExecutionError : public std::runtime_error {
 public:
  NodeExecutionError(std::string node_id, const std::string& msg) : std::runtime_error(msg), node_id_(std::move(node_id)) {
  }

  const std::string& NodeId() const {
    return node_id_;
  }

 private:
  std::string node_id_;
};

class NodeTimeoutError : public NodeExecutionError {
 public:
  NodeTimeoutError(std::string node_id, const std::string& msg) : NodeExecutionError(std::move(node_id), msg) {
  }
};

class NoValidRouteError : public std::runtime_error {
 public:
  explicit NoValidRouteError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class QuotaExceeded : public std::runtime_error {
 public:
  explicit QuotaExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AccessDenied : public std::runtime_error {
 public:
  explicit AccessDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExecutionCancelled : public std::runtime_error {
 public:
  explicit ExecutionCancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ------------------------------------------------------------
// Persistence / replay
// ------------------------------------------------------------

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic commit lost against a concurrent writer; safe to retry.
class TransactionConflict : public PersistenceError {
 public:
  explicit TransactionConflict(const std::string& msg) : PersistenceError(msg) {
  }
};

class ReplayError : public std::runtime_error {
 public:
  explicit ReplayError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace graphflow::util
