#include "state_cache.hpp"

namespace graphflow::state {

StateCache::StateCache(std::chrono::milliseconds ttl, std::size_t max_entries) : ttl_(ttl), max_entries_(max_entries == 0 ? 1 : max_entries) {
}

bool StateCache::IsExpired(const Entry& entry, Clock::time_point now) const {
  return now - entry.stored_at > ttl_;
}

void StateCache::EraseLocked(std::unordered_map<std::string, Entry>::iterator it) {
  lru_.erase(it->second.lru_pos);
  entries_.erase(it);
}

// ------------------------------------------------------------
// Put
// ------------------------------------------------------------

void StateCache::Put(const State& state) {
  std::lock_guard lock(mutex_);

  const auto key = state.StateId();
  if (auto it = entries_.find(key); it != entries_.end()) {
    EraseLocked(it);
  }

  while (entries_.size() >= max_entries_ && !lru_.empty()) {
    EraseLocked(entries_.find(lru_.back()));
  }

  lru_.push_front(key);
  State copy = state;
  copy.MarkClean();
  entries_.emplace(key, Entry{std::move(copy), Clock::now(), lru_.begin()});
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<State> StateCache::Get(const std::string& state_id) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(state_id);
  if (it == entries_.end()) return std::nullopt;

  if (IsExpired(it->second, Clock::now())) {
    EraseLocked(it);
    return std::nullopt;
  }

  lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
  return it->second.state;
}

// ------------------------------------------------------------
// Remove
// ------------------------------------------------------------

void StateCache::Remove(const std::string& state_id) {
  std::lock_guard lock(mutex_);
  if (auto it = entries_.find(state_id); it != entries_.end()) {
    EraseLocked(it);
  }
}

std::size_t StateCache::EvictExpired() {
  std::lock_guard lock(mutex_);
  const auto      now     = Clock::now();
  std::size_t     evicted = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (IsExpired(it->second, now)) {
      lru_.erase(it->second.lru_pos);
      it = entries_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }
  return evicted;
}

std::size_t StateCache::Size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

} // namespace graphflow::state
