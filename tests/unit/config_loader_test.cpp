#include "internal/config/config_loader.hpp"
#include "internal/debug/trace_recorder.hpp"
#include "internal/engine/workflow_engine.hpp"
#include "internal/router/conditional_router.hpp"
#include "internal/runtime/maintenance_worker.hpp"
#include "internal/state/state_store.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using graphflow::config::ConfigLoader;
using namespace std::chrono_literals;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "graphflow_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "/tmp/graphflow.db"
storage:
  disk:
    root_path: "/tmp/graphflow-blobs"
    fsync: true
  blob_tier: BLOB_TIER_DISK
state_store:
  inline_threshold_bytes: 4096
  cache_ttl: "30s"
  cache_max_entries: 16
router:
  history_weight: 0.4
  ai_timeout: "1.5s"
  random_seed: 7
engine:
  worker_threads: 2
  node_timeout: "10s"
  checkpoint_every_node: false
  backtrack_on_failure: true
debugger:
  max_trace_events: 500
  persist_traces: false
maintenance:
  interval: "5s"
  state_retention: "3600s"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/graphflow.db");
  assert(config.storage().blob_tier() == graphflow::runtime::config::BLOB_TIER_DISK);
  assert(config.storage().disk().fsync());
  assert(config.engine().worker_threads() == 2);

  auto store = graphflow::state::StateStoreOptions::FromConfig(config.state_store(), config.storage());
  assert(store.inline_threshold_bytes == 4096);
  assert(store.cache_ttl == 30s);
  assert(store.cache_max_entries == 16);
  assert(store.fsync_blobs);

  auto router = graphflow::router::RouterOptions::FromConfig(config.router());
  assert(router.history_weight == 0.4);
  assert(router.default_success_rate == 0.5);
  assert(router.ai_timeout == 1500ms);
  assert(router.random_seed && *router.random_seed == 7);

  auto engine = graphflow::engine::EngineOptions::FromConfig(config.engine());
  assert(engine.node_timeout == 10s);
  assert(!engine.checkpoint_every_node);
  assert(engine.backtrack_on_failure);

  auto trace = graphflow::debug::TraceRecorderOptions::FromConfig(config.debugger());
  assert(trace.max_trace_events == 500);
  assert(!trace.persist);

  auto maintenance = graphflow::runtime::MaintenanceOptions::FromConfig(config);
  assert(maintenance.interval == 5s);
  assert(maintenance.state_retention == 1h);
  assert(maintenance.backtrack_max_age == 1h);
}

void TestEmptyDocumentKeepsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.has_engine());

  auto engine = graphflow::engine::EngineOptions::FromConfig(config.engine());
  assert(engine.checkpoint_every_node);
  assert(!engine.backtrack_on_failure);

  auto trace = graphflow::debug::TraceRecorderOptions::FromConfig(config.debugger());
  assert(trace.persist);
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(logging:
  level: "007"
  pattern: "line1\nline2☃"
database:
  sqlite:
    path: "C:\\graphflow\\\"quoted\"\\db.sqlite"
)");
  assert(config.logging().level() == "007");
  assert(config.logging().pattern() == std::string("line1\nline2☃"));
  assert(config.database().sqlite().path() == "C:\\graphflow\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("engine:\n  worker_threads: 2\nunknown_field: 123\n") && "top-level typo must fail");
  assert(Rejects("router:\n  histroy_weight: 0.3\n") && "nested typo must fail");
}

void TestMalformedValuesAreRejected() {
  assert(Rejects("engine:\n  node_timeout: \"soon\"\n"));
  assert(Rejects("storage:\n  blob_tier: BLOB_TIER_TAPE\n"));
  assert(Rejects("engine: [1, 2\n"));

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/graphflow.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestSemanticValidation() {
  assert(Rejects("router:\n  history_weight: 1.5\n"));
  assert(Rejects("router:\n  default_success_rate: -0.1\n"));
  assert(Rejects("engine:\n  node_timeout: \"-5s\"\n"));
  assert(Rejects("database:\n  sqlite:\n    path: \"\"\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n"));
  assert(Rejects("storage:\n  blob_tier: BLOB_TIER_OBJECT\n"));

  auto ok = ConfigLoader::LoadFromYamlString("storage:\n  blob_tier: BLOB_TIER_OBJECT\n  object:\n    root_path: \"file:///tmp/gf\"\n");
  assert(ok.storage().object().root_path() == "file:///tmp/gf");

  graphflow::runtime::config::RuntimeConfig example;
  example.mutable_router()->set_history_weight(0.3);
  example.mutable_database()->mutable_memory();
  ConfigLoader::Validate(example);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestEmptyDocumentKeepsDefaults();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMalformedValuesAreRejected();
  TestSemanticValidation();

  std::cout << "config_loader_test: pass\n";
  return 0;
}
