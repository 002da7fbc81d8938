#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/migration/checkpoint_store.hpp"
#include "internal/migration/node_stream_reader.hpp"
#include "internal/migration/node_transform.hpp"
#include "internal/migration/state_machine.hpp"
#include "resonance/graph/v1/migration.pb.h"

namespace resonance::observability {
class EventSink;
}

namespace resonance::governor {
class ResourceGovernor;
}

namespace resonance::migration {

struct MigrationOptions {
  std::filesystem::path input;
  std::filesystem::path output_directory;
  std::filesystem::path checkpoint_file;

  uint32_t batch_size{0};
  uint32_t heartbeat_interval{0};
  uint32_t checkpoint_interval{0};
  size_t   read_chunk_bytes{0};

  std::vector<std::string> anchors;
  double                   default_resonance{0.5};
  double                   default_decay{0.05};

  // Validate and transform only; nothing is written.
  bool dry_run{false};
  // Only indices below the limit are processed.
  std::optional<uint64_t> limit;

  static MigrationOptions FromConfig(const resonance::runtime::config::MigrationConfig& config);
};

enum class CompletionStatus : int {
  kCompleted  = 0,
  kHardKilled = 1,
  kCancelled  = 2,
  kCorrupted  = 3,
  kFailed     = 4,
};

const char* ToString(CompletionStatus status);

struct BatchProgress {
  uint64_t first_index{0};
  uint64_t next_index{0};
  uint64_t processed{0};
  uint64_t migrated{0};
  uint64_t skipped{0};
  uint64_t total_input{0};
};

struct MigrationResult {
  MigrationState   state{MigrationState::kIdle};
  CompletionStatus status{CompletionStatus::kCompleted};

  uint64_t total_input{0};
  uint64_t start_index{0};
  uint64_t next_index{0};

  uint64_t processed{0};       // this run
  uint64_t total_processed{0}; // across resumptions
  uint64_t total_migrated{0};
  uint64_t total_skipped{0};
  uint64_t checkpoint_count{0};
  uint64_t batch_sequence{0};

  std::string last_successful_node_id;
  std::string abort_reason;
  bool        resumed{false};
  double      elapsed_seconds{0};

  int completion_status() const {
    return static_cast<int>(status);
  }
  bool partial() const {
    return status != CompletionStatus::kCompleted || next_index < total_input;
  }
};

/*
  Bounded-memory streaming migration of a node registry.

  Nodes are pulled one at a time from the input and processed in batches of
  batch_size. Between batches the engine consults the resource governor and
  the cancellation flag; both only take effect there. Every
  heartbeat_interval indices a heartbeat event is emitted; every
  checkpoint_interval indices the accumulated output is flushed to
  nodes-batch-<seq>.json and the checkpoint is saved.

  On restart with an existing checkpoint, indices below
  last_processed_index are skipped and batch numbering continues from
  batch_sequence, so the remaining output is identical to that of an
  uninterrupted run. An abort leaves the last saved checkpoint untouched.
*/
class MigrationEngine {
 public:
  MigrationEngine(MigrationOptions options, std::shared_ptr<observability::EventSink> events,
                  std::shared_ptr<governor::ResourceGovernor> governor);

  // Idle -> Loading -> Processing. Called implicitly by NextBatch().
  void Start();

  // Processes one batch. nullopt once the run is completed or aborted.
  // CorruptionDetected and IOError abort the run and propagate.
  std::optional<BatchProgress> NextBatch();

  // Observed at the next batch boundary.
  void RequestCancel();

  MigrationResult Run();

  MigrationState state() const {
    return state_;
  }

  const MigrationResult& result() const {
    return result_;
  }

  const MigrationOptions& options() const {
    return options_;
  }

  // Gold-standard anchor records seen this run, never evicted.
  const std::map<std::string, resonance::graph::v1::MigratedNode>& pinned() const {
    return pinned_;
  }

 private:
  void Transition(MigrationState to);

  uint64_t EndIndex() const;

  void ProcessNode(uint64_t index, const std::string& text, BatchProgress* progress);
  void AfterIndex();
  void Checkpoint();
  void FlushOutput();
  void Finish();
  void Abort(CompletionStatus status, const std::string& reason);

  resonance::graph::v1::MigrationCheckpoint Snapshot(const char* status, bool completed) const;
  void Emit(const char* event, uint64_t index, const std::string& reason);
  double ElapsedSeconds() const;

  MigrationOptions                            options_;
  std::shared_ptr<observability::EventSink>   events_;
  std::shared_ptr<governor::ResourceGovernor> governor_;

  NodeTransformer                   transformer_;
  CheckpointStore                   store_;
  std::unique_ptr<NodeStreamReader> reader_;

  MigrationState    state_{MigrationState::kIdle};
  MigrationResult   result_;
  std::atomic<bool> cancel_requested_{false};

  resonance::graph::v1::MigratedBatch                       output_;
  uint64_t                                                  output_first_index_{0};
  std::map<std::string, resonance::graph::v1::MigratedNode> pinned_;

  std::chrono::steady_clock::time_point started_at_;
  std::optional<uint64_t>               baseline_memory_mb_;
  uint64_t                              memory_mb_{0};
};

} // namespace resonance::migration
