#include "migration_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/governor/resource_governor.hpp"
#include "internal/observability/event_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace resonance::migration {

using namespace resonance::graph::v1;
using observability::BoolField;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

int64_t AsInt(uint64_t value) {
  return static_cast<int64_t>(value);
}

} // namespace

MigrationOptions MigrationOptions::FromConfig(const resonance::runtime::config::MigrationConfig& config) {
  MigrationOptions options;
  options.input               = config.input();
  options.output_directory    = config.output_directory();
  options.checkpoint_file     = config.checkpoint_file();
  options.batch_size          = config.batch_size();
  options.heartbeat_interval  = config.heartbeat_interval();
  options.checkpoint_interval = config.checkpoint_interval();
  options.read_chunk_bytes    = config.read_chunk_bytes();
  options.anchors.assign(config.gold_standard_anchors().begin(), config.gold_standard_anchors().end());
  options.default_resonance = config.default_resonance();
  options.default_decay     = config.default_decay();
  return options;
}

const char* ToString(CompletionStatus status) {
  switch (status) {
    case CompletionStatus::kCompleted:
      return "completed";
    case CompletionStatus::kHardKilled:
      return "hard_killed";
    case CompletionStatus::kCancelled:
      return "cancelled";
    case CompletionStatus::kCorrupted:
      return "corrupted";
    case CompletionStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

MigrationEngine::MigrationEngine(MigrationOptions options, std::shared_ptr<observability::EventSink> events,
                                 std::shared_ptr<governor::ResourceGovernor> governor)
    : options_(std::move(options)),
      events_(std::move(events)),
      governor_(std::move(governor)),
      transformer_(options_.anchors, options_.default_resonance, options_.default_decay),
      store_(options_.checkpoint_file) {
  if (!events_) {
    events_ = std::make_shared<observability::NullEventSink>();
  }
  if (options_.batch_size == 0 || options_.heartbeat_interval == 0 || options_.checkpoint_interval == 0) {
    throw std::invalid_argument("migration batch, heartbeat and checkpoint intervals must be positive");
  }
  if (options_.batch_size > options_.heartbeat_interval) {
    RESONANCE_LOG_WARN("Batch size exceeds heartbeat interval, clamping",
                       {IntField("batch_size", options_.batch_size),
                        IntField("heartbeat_interval", options_.heartbeat_interval)});
    options_.batch_size = options_.heartbeat_interval;
  }
}

// ------------------------------------------------------------
// State
// ------------------------------------------------------------

void MigrationEngine::Transition(MigrationState to) {
  if (!CanTransition(state_, to)) {
    throw util::InvalidState(std::string("illegal migration transition ") + ToString(state_) + " -> " + ToString(to));
  }
  state_        = to;
  result_.state = to;
}

uint64_t MigrationEngine::EndIndex() const {
  if (options_.limit) {
    return std::min(result_.total_input, *options_.limit);
  }
  return result_.total_input;
}

double MigrationEngine::ElapsedSeconds() const {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
}

void MigrationEngine::RequestCancel() {
  cancel_requested_.store(true);
}

// ------------------------------------------------------------
// Start / resume
// ------------------------------------------------------------

void MigrationEngine::Start() {
  Transition(MigrationState::kLoading);
  started_at_ = std::chrono::steady_clock::now();

  try {
    result_.total_input = NodeStreamReader::CountNodes(options_.input, options_.read_chunk_bytes);

    if (auto checkpoint = store_.Load()) {
      if (checkpoint->last_processed_index() > result_.total_input) {
        throw util::CorruptionDetected("checkpoint index " + std::to_string(checkpoint->last_processed_index()) +
                                       " is beyond input size " + std::to_string(result_.total_input));
      }
      result_.resumed                 = true;
      result_.start_index             = checkpoint->last_processed_index();
      result_.total_processed         = checkpoint->total_processed();
      result_.total_migrated          = checkpoint->total_migrated();
      result_.total_skipped           = checkpoint->total_skipped();
      result_.checkpoint_count        = checkpoint->checkpoint_count();
      result_.batch_sequence          = checkpoint->batch_sequence();
      result_.last_successful_node_id = checkpoint->last_successful_node_id();

      RESONANCE_LOG_INFO("Resuming migration from checkpoint",
                         {IntField("last_processed_index", AsInt(checkpoint->last_processed_index())),
                          IntField("checkpoint_count", AsInt(checkpoint->checkpoint_count())),
                          IntField("batch_sequence", AsInt(checkpoint->batch_sequence())),
                          BoolField("completed", checkpoint->completed())});
    }

    reader_ = std::make_unique<NodeStreamReader>(options_.input, options_.read_chunk_bytes);
    reader_->Open();
    for (uint64_t i = 0; i < result_.start_index; ++i) {
      if (!reader_->Skip()) {
        throw util::CorruptionDetected("node stream ended while skipping to index " +
                                       std::to_string(result_.start_index));
      }
    }
  } catch (const util::CorruptionDetected& e) {
    Abort(CompletionStatus::kCorrupted, e.what());
    throw;
  } catch (const util::IOError& e) {
    Abort(CompletionStatus::kFailed, e.what());
    throw;
  }

  result_.next_index  = result_.start_index;
  output_first_index_ = result_.start_index;
  output_.Clear();

  Transition(MigrationState::kProcessing);

  RESONANCE_LOG_INFO("Migration started", {StringField("input", options_.input.string()),
                                           IntField("total_input", AsInt(result_.total_input)),
                                           IntField("start_index", AsInt(result_.start_index)),
                                           IntField("end_index", AsInt(EndIndex())),
                                           IntField("batch_size", options_.batch_size),
                                           BoolField("dry_run", options_.dry_run)});
}

// ------------------------------------------------------------
// Batches
// ------------------------------------------------------------

std::optional<BatchProgress> MigrationEngine::NextBatch() {
  if (state_ == MigrationState::kIdle) {
    Start();
  }
  if (IsTerminal(state_)) {
    return std::nullopt;
  }

  // batch boundary: cancellation, then resource pressure
  if (cancel_requested_.load()) {
    Abort(CompletionStatus::kCancelled, "cancellation requested");
    return std::nullopt;
  }

  if (governor_) {
    const auto decision = governor_->Evaluate();
    memory_mb_          = decision.state.memory_mb;
    if (!baseline_memory_mb_) {
      baseline_memory_mb_ = memory_mb_;
    }

    if (decision.action == governor::Action::kThrottle) {
      RESONANCE_LOG_WARN("Throttling migration", {StringField("reason", decision.reason),
                                                  IntField("delay_ms", governor_->throttle_delay().count())});
    }
    try {
      governor_->Enforce(decision);
    } catch (const util::ResourceLimitExceeded& e) {
      // stop cleanly; the last checkpoint stays valid for a resume
      Abort(CompletionStatus::kHardKilled, e.what());
      return std::nullopt;
    }
  }

  const uint64_t end = EndIndex();
  if (result_.next_index >= end) {
    Finish();
    return std::nullopt;
  }

  BatchProgress progress;
  progress.first_index = result_.next_index;
  progress.total_input = result_.total_input;

  const uint64_t batch_end = std::min<uint64_t>(end, result_.next_index + options_.batch_size);

  try {
    while (result_.next_index < batch_end) {
      auto text = reader_->Next();
      if (!text) {
        throw util::CorruptionDetected("node stream ended at index " + std::to_string(result_.next_index) +
                                       " of " + std::to_string(result_.total_input));
      }

      ProcessNode(result_.next_index, *text, &progress);
      AfterIndex();
    }
  } catch (const util::CorruptionDetected& e) {
    Abort(CompletionStatus::kCorrupted, e.what());
    throw;
  } catch (const util::IOError& e) {
    Abort(CompletionStatus::kFailed, e.what());
    throw;
  }

  progress.next_index = result_.next_index;

  if (result_.next_index >= end) {
    Finish();
  }
  return progress;
}

void MigrationEngine::ProcessNode(uint64_t index, const std::string& text, BatchProgress* progress) {
  ++progress->processed;
  ++result_.processed;
  ++result_.total_processed;

  try {
    const auto node = transformer_.Parse(text);
    transformer_.Validate(node);

    auto migrated = transformer_.Transform(node);
    if (migrated.is_gold_standard()) {
      pinned_[migrated.id()] = migrated;
    }
    result_.last_successful_node_id = migrated.id();
    *output_.add_nodes()            = std::move(migrated);

    ++progress->migrated;
    ++result_.total_migrated;
  } catch (const util::ValidationError& e) {
    ++progress->skipped;
    ++result_.total_skipped;

    RESONANCE_LOG_WARN("Skipping invalid node", {IntField("index", AsInt(index)), StringField("error", e.what())});
    Emit("skip", index, e.what());
  }
}

void MigrationEngine::AfterIndex() {
  ++result_.next_index;
  const uint64_t done = result_.next_index;

  if (done % options_.heartbeat_interval == 0) {
    Emit("heartbeat", done, "");

    const double elapsed = ElapsedSeconds();
    RESONANCE_LOG_INFO("Migration heartbeat",
                       {IntField("nodes", AsInt(done)), IntField("total", AsInt(result_.total_input)),
                        IntField("memory_mb", AsInt(memory_mb_)),
                        DoubleField("nodes_per_second", elapsed > 0 ? result_.processed / elapsed : 0.0),
                        StringField("last_node_id", result_.last_successful_node_id)});
  }

  if (done % options_.checkpoint_interval == 0) {
    Checkpoint();
  }
}

// ------------------------------------------------------------
// Persistence
// ------------------------------------------------------------

void MigrationEngine::FlushOutput() {
  if (output_.nodes_size() > 0) {
    ++result_.batch_sequence;
    output_.set_sequence(result_.batch_sequence);
    output_.set_first_index(output_first_index_);
    output_.set_last_index(result_.next_index - 1);

    if (!options_.dry_run) {
      WriteBatchFile(options_.output_directory, output_);
    }
  }

  // anchors stay reachable through pinned_
  output_.Clear();
  output_first_index_ = result_.next_index;
}

MigrationCheckpoint MigrationEngine::Snapshot(const char* status, bool completed) const {
  MigrationCheckpoint checkpoint;
  checkpoint.set_last_processed_index(result_.next_index);
  checkpoint.set_total_processed(result_.total_processed);
  checkpoint.set_last_successful_node_id(result_.last_successful_node_id);
  checkpoint.set_checkpoint_count(result_.checkpoint_count);
  checkpoint.set_batch_sequence(result_.batch_sequence);
  checkpoint.set_total_migrated(result_.total_migrated);
  checkpoint.set_total_skipped(result_.total_skipped);
  checkpoint.set_completed(completed);
  checkpoint.set_status(status);
  checkpoint.set_memory_mb(memory_mb_);
  *checkpoint.mutable_last_checkpoint_timestamp() = util::ToProto(util::Now());
  return checkpoint;
}

void MigrationEngine::Checkpoint() {
  Transition(MigrationState::kCheckpointing);

  FlushOutput();
  ++result_.checkpoint_count;
  if (!options_.dry_run) {
    store_.Save(Snapshot("checkpoint", false));
  }
  Emit("checkpoint", result_.next_index, "");

  RESONANCE_LOG_INFO("Checkpoint saved", {IntField("checkpoint", AsInt(result_.checkpoint_count)),
                                          IntField("last_processed_index", AsInt(result_.next_index)),
                                          IntField("batch_sequence", AsInt(result_.batch_sequence)),
                                          StringField("last_node_id", result_.last_successful_node_id)});

  Transition(MigrationState::kProcessing);
}

void MigrationEngine::Finish() {
  try {
    FlushOutput();

    const bool exhausted = result_.next_index >= result_.total_input;
    if (!options_.dry_run) {
      store_.Save(Snapshot(exhausted ? "completed" : "partial", exhausted));
    }
  } catch (const util::IOError& e) {
    Abort(CompletionStatus::kFailed, e.what());
    throw;
  }

  result_.status          = CompletionStatus::kCompleted;
  result_.elapsed_seconds = ElapsedSeconds();
  Transition(MigrationState::kCompleted);
  Emit("complete", result_.next_index, "");
  events_->Flush();

  RESONANCE_LOG_INFO("Migration complete", {IntField("processed", AsInt(result_.processed)),
                                            IntField("total_processed", AsInt(result_.total_processed)),
                                            IntField("total_input", AsInt(result_.total_input)),
                                            IntField("migrated", AsInt(result_.total_migrated)),
                                            IntField("skipped", AsInt(result_.total_skipped)),
                                            IntField("checkpoints", AsInt(result_.checkpoint_count)),
                                            IntField("batches", AsInt(result_.batch_sequence)),
                                            BoolField("partial", result_.partial()),
                                            DoubleField("elapsed_seconds", result_.elapsed_seconds)});
}

void MigrationEngine::Abort(CompletionStatus status, const std::string& reason) {
  result_.status          = status;
  result_.abort_reason    = reason;
  result_.elapsed_seconds = ElapsedSeconds();
  Transition(MigrationState::kAborted);

  try {
    Emit("abort", result_.next_index, reason);
    events_->Flush();
  } catch (const util::IOError& e) {
    RESONANCE_LOG_ERROR("Failed to record abort event", {StringField("error", e.what())});
  }

  RESONANCE_LOG_ERROR("Migration aborted", {StringField("status", ToString(status)), StringField("reason", reason),
                                            IntField("next_index", AsInt(result_.next_index)),
                                            IntField("checkpoint_count", AsInt(result_.checkpoint_count)),
                                            StringField("last_node_id", result_.last_successful_node_id)});
}

void MigrationEngine::Emit(const char* event, uint64_t index, const std::string& reason) {
  const double elapsed = ElapsedSeconds();

  HeartbeatRecord record;
  record.set_event(event);
  record.set_timestamp(util::ToIso8601(util::Now()));
  record.set_node_index(index);
  record.set_elapsed_seconds(elapsed);
  record.set_nodes_per_second(elapsed > 0 ? static_cast<double>(result_.processed) / elapsed : 0.0);
  record.set_memory_mb(memory_mb_);
  record.set_memory_delta_mb(static_cast<int64_t>(memory_mb_) - static_cast<int64_t>(baseline_memory_mb_.value_or(memory_mb_)));
  record.set_last_node_id(result_.last_successful_node_id);
  record.set_reason(reason);
  events_->Emit(record);
}

MigrationResult MigrationEngine::Run() {
  while (NextBatch()) {
  }
  return result_;
}

} // namespace resonance::migration
