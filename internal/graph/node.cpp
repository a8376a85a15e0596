#include "node.hpp"

#include "internal/util/errors.hpp"

namespace graphflow::graph {

NodeFn SyncNode(std::function<state::State(state::State)> fn) {
  if (!fn) throw util::InvalidArgument("SyncNode requires a callable");

  return [fn = std::move(fn)](state::State input, const NodeContext& ctx) -> async::Future<state::State> {
    async::InlineExecutor inline_executor;
    async::Executor&      executor = ctx.executor ? *ctx.executor : static_cast<async::Executor&>(inline_executor);
    return async::Async(executor, [fn, input = std::move(input)]() mutable { return fn(std::move(input)); });
  };
}

} // namespace graphflow::graph
