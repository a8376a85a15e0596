#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "graphflow/v1.hpp"
#include "internal/async/executor.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/debug/replay_controller.hpp"
#include "internal/debug/trace_analyzer.hpp"
#include "internal/debug/trace_exporter.hpp"
#include "internal/debug/trace_recorder.hpp"
#include "internal/factory.hpp"
#include "internal/state/state_store.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using namespace graphflow;

static void Usage() {
  std::cout << "Usage:\n"
            << "  graphflowctl <config.yaml> checkpoints <execution_id>\n"
            << "  graphflowctl <config.yaml> history <execution_id>\n"
            << "  graphflowctl <config.yaml> state <execution_id> [version]\n"
            << "  graphflowctl <config.yaml> restore <checkpoint_id>\n"
            << "  graphflowctl <config.yaml> trace <execution_id> [json|csv|chrome]\n"
            << "  graphflowctl <config.yaml> analyze <execution_id>\n"
            << "  graphflowctl <config.yaml> replay <execution_id>\n"
            << "  graphflowctl <config.yaml> cleanup <retention_seconds>\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                                json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) throw util::InvalidState("json encode failed: " + status.ToString());
  return json;
}

static uint64_t ParseCount(const std::string& value, const char* what) {
  try {
    std::size_t pos = 0;
    auto        v   = std::stoull(value, &pos);
    if (pos == value.size()) return v;
  } catch (const std::exception&) {
  }
  std::cerr << "invalid " << what << ": " << value << "\n";
  std::exit(1);
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];
  auto              arg         = [&](int i) { return argc > i ? std::string(argv[i]) : std::string{}; };

  try {
    auto config = config::ConfigLoader::LoadFromYaml(config_path);

    auto                  repository = factory::BuildRepository(config);
    async::InlineExecutor inline_executor;
    state::StateStore     store(repository, storage::StorageFactory::Build(config.storage()), inline_executor,
                                state::StateStoreOptions::FromConfig(config.state_store(), config.storage()));

    auto trace_options    = debug::TraceRecorderOptions::FromConfig(config.debugger());
    trace_options.persist = false;
    debug::TraceRecorder recorder(repository, trace_options);

    if (cmd == "checkpoints" && argc == 4) {
      for (const auto& cp : store.ListCheckpoints(arg(3))) {
        std::cout << cp.id() << "  " << graphflow::v1::CheckpointType_Name(cp.type()) << "  node=" << cp.node_id()
                  << "  version=" << cp.state_version() << "  " << cp.description() << "\n";
      }
      return 0;
    }

    if (cmd == "history" && argc == 4) {
      for (const auto& t : store.GetStateHistory(arg(3))) {
        std::cout << util::ToUnixMillis(util::FromProto(t.timestamp())) << "  " << t.from_node() << " -> " << t.to_node() << "  ("
                  << t.reason() << ")\n";
      }
      return 0;
    }

    if (cmd == "state" && (argc == 4 || argc == 5)) {
      std::optional<state::State> s = argc == 5 ? store.LoadState(arg(3), ParseCount(arg(4), "version")) : store.LatestState(arg(3));
      if (!s) {
        std::cerr << "state not found\n";
        return 3;
      }
      std::cout << ToJson(s->Record()) << "\n";
      return 0;
    }

    if (cmd == "restore" && argc == 4) {
      auto s = store.RestoreFromCheckpoint(arg(3));
      std::cout << ToJson(s.Record()) << "\n";
      return 0;
    }

    if (cmd == "trace" && (argc == 4 || argc == 5)) {
      auto format = debug::ParseExportFormat(argc == 5 ? arg(4) : "json");
      std::cout << debug::Export(recorder.LoadTrace(arg(3)), format) << "\n";
      return 0;
    }

    if (cmd == "analyze" && argc == 4) {
      auto analysis = debug::TraceAnalyzer().Analyze(recorder.LoadTrace(arg(3)));
      std::cout << ToJson(debug::ToStruct(analysis)) << "\n";
      return 0;
    }

    if (cmd == "replay" && argc == 4) {
      debug::ReplayController replay(recorder.LoadTrace(arg(3)));
      while (auto event = replay.StepForward()) {
        std::cout << event->sequence() << "  " << debug::EventTypeName(event->type()) << "  " << event->node_id() << "\n";
      }
      std::cout << "visited:";
      for (const auto& node : replay.VisitedNodes()) std::cout << " " << node;
      std::cout << "\n" << debug::ReplayStateName(replay.State()) << "\n";
      return 0;
    }

    if (cmd == "cleanup" && argc == 4) {
      auto retention = std::chrono::milliseconds(std::chrono::seconds(ParseCount(arg(3), "retention")));
      auto states    = store.CleanOldStates(retention);
      auto traces    = recorder.CleanupTraces(retention);
      std::cout << "removed " << states << " state records, " << traces << " traces\n";
      return 0;
    }

    Usage();
    return 1;
  } catch (const util::ReplayError& e) {
    std::cerr << "not found: " << e.what() << "\n";
    return 3;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
}
