#pragma once

#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace graphflow::db {

/*
  Runs fn(tx) inside a fresh transaction and commits it.

  A commit that loses an optimistic conflict (memory backend) is retried
  with a new snapshot; everything else propagates to the caller and the
  transaction rolls back on destruction.
*/
template <typename Fn>
auto RunInTransaction(Repository& repo, Fn&& fn, int max_attempts = 5) {
  for (int attempt = 1;; ++attempt) {
    auto tx = repo.Begin();
    try {
      if constexpr (std::is_void_v<std::invoke_result_t<Fn&, Transaction&>>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        auto out = fn(*tx);
        tx->Commit();
        return out;
      }
    } catch (const util::TransactionConflict&) {
      if (attempt >= max_attempts) throw;
    }
  }
}

} // namespace graphflow::db
