#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace graphflow::async {

/*
  Shared cancellation flag. Copies observe the same flag.

  Callbacks registered with OnCancel run once, on the cancelling thread,
  or immediately if the token is already cancelled.
*/
class CancellationToken {
 public:
  using CallbackId = std::uint64_t;

  CancellationToken() : state_(std::make_shared<SharedState>()) {
  }

  void Cancel(const std::string& reason = "cancelled") {
    std::map<CallbackId, std::function<void()>> callbacks;
    {
      std::lock_guard lock(state_->mutex);
      if (state_->cancelled) return;
      state_->cancelled = true;
      state_->reason    = reason;
      callbacks.swap(state_->callbacks);
    }
    for (auto& [_, cb] : callbacks) cb();
  }

  bool IsCancelled() const {
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
  }

  std::string Reason() const {
    std::lock_guard lock(state_->mutex);
    return state_->reason;
  }

  CallbackId OnCancel(std::function<void()> cb) const {
    {
      std::lock_guard lock(state_->mutex);
      if (!state_->cancelled) {
        auto id = state_->next_id++;
        state_->callbacks.emplace(id, std::move(cb));
        return id;
      }
    }
    cb();
    return 0;
  }

  void Unregister(CallbackId id) const {
    std::lock_guard lock(state_->mutex);
    state_->callbacks.erase(id);
  }

 private:
  struct SharedState {
    std::mutex                                  mutex;
    bool                                        cancelled = false;
    std::string                                 reason;
    CallbackId                                  next_id = 1;
    std::map<CallbackId, std::function<void()>> callbacks;
  };

  std::shared_ptr<SharedState> state_;
};

} // namespace graphflow::async
