#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

#include "resonance/graph/v1/migration.pb.h"

namespace resonance::migration {

/*
  Persists MigrationCheckpoint as JSON. Saves are atomic, so the file on disk
  is always either the previous or the new checkpoint.
*/
class CheckpointStore {
 public:
  explicit CheckpointStore(std::filesystem::path path);

  // nullopt when no checkpoint exists; CorruptionDetected when it cannot be parsed.
  std::optional<resonance::graph::v1::MigrationCheckpoint> Load() const;

  void Save(const resonance::graph::v1::MigrationCheckpoint& checkpoint) const;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

// <directory>/nodes-batch-<sequence>.json
std::filesystem::path BatchFilePath(const std::filesystem::path& directory, uint64_t sequence);

void WriteBatchFile(const std::filesystem::path& directory, const resonance::graph::v1::MigratedBatch& batch);

} // namespace resonance::migration
