#include "checkpoint_store.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"

namespace resonance::migration {

using resonance::graph::v1::MigratedBatch;
using resonance::graph::v1::MigrationCheckpoint;

CheckpointStore::CheckpointStore(std::filesystem::path path) : path_(std::move(path)) {
}

std::optional<MigrationCheckpoint> CheckpointStore::Load() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return std::nullopt;
  }

  MigrationCheckpoint checkpoint;
  try {
    util::ParseJsonMessage(util::ReadFile(path_), &checkpoint, /*ignore_unknown_fields=*/true);
  } catch (const util::ValidationError& e) {
    throw util::CorruptionDetected("unreadable checkpoint " + path_.string() + ": " + e.what());
  }
  return checkpoint;
}

void CheckpointStore::Save(const MigrationCheckpoint& checkpoint) const {
  util::WriteJsonAtomic(path_, checkpoint);
}

std::filesystem::path BatchFilePath(const std::filesystem::path& directory, uint64_t sequence) {
  return directory / ("nodes-batch-" + std::to_string(sequence) + ".json");
}

void WriteBatchFile(const std::filesystem::path& directory, const MigratedBatch& batch) {
  util::WriteJsonAtomic(BatchFilePath(directory, batch.sequence()), batch);
}

} // namespace resonance::migration
