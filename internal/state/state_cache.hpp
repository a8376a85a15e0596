#pragma once

#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "state.hpp"

namespace graphflow::state {

/*
  Bounded, time-expiring cache of recently used states keyed by state id.

  Pure optimization: the repository stays the source of truth. Entries
  older than ttl are treated as misses and evicted on access; the least
  recently used entry is evicted once max_entries is reached.
*/
class StateCache {
 public:
  using Clock = std::chrono::steady_clock;

  StateCache(std::chrono::milliseconds ttl, std::size_t max_entries);

  void Put(const State& state);

  std::optional<State> Get(const std::string& state_id);

  void Remove(const std::string& state_id);

  // Drops entries past their TTL; returns how many.
  std::size_t EvictExpired();

  std::size_t Size() const;

 private:
  struct Entry {
    State                            state;
    Clock::time_point                stored_at;
    std::list<std::string>::iterator lru_pos;
  };

  bool IsExpired(const Entry& entry, Clock::time_point now) const;
  void EraseLocked(std::unordered_map<std::string, Entry>::iterator it);

  const std::chrono::milliseconds ttl_;
  const std::size_t               max_entries_;

  mutable std::mutex                     mutex_;
  std::unordered_map<std::string, Entry> entries_;
  // front = most recently used
  std::list<std::string> lru_;
};

} // namespace graphflow::state
