#include "internal/state/state_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/async/executor.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/state/state_cache.hpp"
#include "internal/storage/ram/ram_arrow_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/value.hpp"

using namespace graphflow;
using namespace std::chrono_literals;
namespace v1 = graphflow::v1;

namespace {

struct Fixture {
  std::shared_ptr<db::Repository>           repository = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<storage::RamArrowStore>   blobs      = std::make_shared<storage::RamArrowStore>();
  async::InlineExecutor                     executor;
  std::unique_ptr<state::StateStore>        store;

  explicit Fixture(state::StateStoreOptions options = {}) {
    store = std::make_unique<state::StateStore>(repository, blobs, executor, options);
  }
};

state::State MakeState(const std::string& execution_id) {
  google::protobuf::Struct data;
  (*data.mutable_fields())["x"] = util::NumberValue(1);
  return state::State::Create("wf", execution_id, "tenant", data);
}

void TestSaveAndLoad() {
  Fixture f;
  auto    s = MakeState("e1");
  f.store->SaveState(s);
  assert(!s.IsDirty());

  auto next = s.Derive();
  next.Set("y", util::StringValue("two"));
  f.store->SaveState(next);

  auto first  = f.store->LoadState("e1", 1);
  auto second = f.store->LoadState("e1", 2);
  assert(first && second);
  assert(!first->Has("y"));
  assert(second->Get("y")->string_value() == "two");
  assert(f.store->LatestState("e1")->Version() == 2);
  assert(!f.store->LoadState("e1", 7));
  assert(f.store->ListStates("e1").size() == 2);
}

void TestCleanStateSaveIsNoOp() {
  Fixture f;
  auto    s = MakeState("e2");
  s.MarkClean();
  f.store->SaveState(s);
  assert(!f.store->LoadState("e2", 1));
  assert(!f.store->LatestState("e2"));
}

void TestCheckpointRoundTrip() {
  Fixture f;
  auto    s = MakeState("e3").Derive().Derive();
  s.Set("answer", util::NumberValue(42));
  s.AppendPath("a");
  s.AppendPath("b");

  auto cp = f.store->CreateCheckpoint(s, "b", v1::CHECKPOINT_TYPE_MANUAL, "before risky step");
  assert(cp.state_version() == 3);
  assert(cp.location() == v1::STORAGE_LOCATION_INLINE);
  assert(!s.IsDirty());

  // later mutation must not leak into the checkpoint
  s.Set("answer", util::NumberValue(0));

  auto restored = f.store->RestoreFromCheckpoint(cp.id());
  assert(restored.Version() == 3);
  assert(restored.Get("answer")->number_value() == 42);
  assert(restored.Get("x")->number_value() == 1);
  assert(restored.CurrentNode() == "b");
  assert(restored.Metadata("restored_from_checkpoint") == std::optional<std::string>(cp.id()));

  auto listed = f.store->ListCheckpoints("e3");
  assert(listed.size() == 1);
  assert(listed[0].description() == "before risky step");
}

void TestMissingCheckpointIsReplayError() {
  Fixture f;
  bool    threw = false;
  try {
    f.store->RestoreFromCheckpoint("cp-missing");
  } catch (const util::ReplayError&) {
    threw = true;
  }
  assert(threw);
}

void TestLargeStatesGoToBlobStore() {
  state::StateStoreOptions options;
  options.inline_threshold_bytes = 256;
  Fixture f(options);

  auto small = MakeState("e4");
  auto cp1   = f.store->CreateCheckpoint(small, "a", v1::CHECKPOINT_TYPE_AUTO);
  assert(cp1.location() == v1::STORAGE_LOCATION_INLINE);

  auto big = small.Derive();
  big.Set("blob", util::StringValue(std::string(4096, 'x')));
  auto cp2 = f.store->CreateCheckpoint(big, "b", v1::CHECKPOINT_TYPE_AUTO);
  assert(cp2.location() == v1::STORAGE_LOCATION_BLOB);
  assert(f.blobs->Exists(state::StateStore::BlobKey("tenant", big.StateId())));

  // bypass the cache so the blob is actually read back
  f.store->Cache().Remove(big.StateId());
  auto restored = f.store->RestoreFromCheckpoint(cp2.id());
  assert(restored.Get("blob")->string_value().size() == 4096);
}

void TestStateHistory() {
  Fixture f;
  auto    s = MakeState("e5");
  s.AddTransition("a", "b", "first");
  s.AddTransition("b", "c", "second");
  f.store->SaveState(s);

  auto history = f.store->GetStateHistory("e5");
  assert(history.size() == 2);
  assert(history[0].reason() == "first");
  assert(history[1].to_node() == "c");
  assert(f.store->GetStateHistory("unknown").empty());
}

void TestCleanOldStates() {
  Fixture f;
  auto    s = MakeState("e6");
  f.store->CreateCheckpoint(s, "a", v1::CHECKPOINT_TYPE_AUTO);

  assert(f.store->CleanOldStates(std::chrono::hours(1)) == 0);
  std::this_thread::sleep_for(5ms);
  assert(f.store->CleanOldStates(0ms) == 2);  // one state, one checkpoint
  assert(!f.store->LoadState("e6", 1));
  assert(f.store->ListCheckpoints("e6").empty());
}

void TestCacheExpiry() {
  state::StateCache cache(20ms, 2);
  auto              a = MakeState("c1");
  auto              b = MakeState("c2");
  auto              c = MakeState("c3");

  cache.Put(a);
  assert(cache.Get(a.StateId()));
  std::this_thread::sleep_for(40ms);
  assert(!cache.Get(a.StateId()));

  cache.Put(a);
  cache.Put(b);
  cache.Get(a.StateId());  // b becomes least recently used
  cache.Put(c);
  assert(cache.Size() == 2);
  assert(cache.Get(a.StateId()));
  assert(!cache.Get(b.StateId()));
}

void TestAsyncSave() {
  Fixture f;
  auto    s     = MakeState("e7");
  auto    saved = f.store->SaveStateAsync(s).Get();
  assert(!saved.IsDirty());
  assert(f.store->LoadState("e7", 1));

  auto cp = f.store->CreateCheckpointAsync(saved.Derive(), "n", v1::CHECKPOINT_TYPE_ERROR, "failed").Get();
  assert(cp.type() == v1::CHECKPOINT_TYPE_ERROR);
  assert(cp.state_version() == 2);
}

} // namespace

int main() {
  TestSaveAndLoad();
  TestCleanStateSaveIsNoOp();
  TestCheckpointRoundTrip();
  TestMissingCheckpointIsReplayError();
  TestLargeStatesGoToBlobStore();
  TestStateHistory();
  TestCleanOldStates();
  TestCacheExpiry();
  TestAsyncSave();

  std::cout << "state_store_test: pass\n";
  return 0;
}
