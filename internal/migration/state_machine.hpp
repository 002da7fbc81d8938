#pragma once

#include <cstdint>

namespace resonance::migration {

enum class MigrationState : std::uint8_t {
  kIdle          = 0,
  kLoading       = 1,
  kProcessing    = 2,
  kCheckpointing = 3,
  kCompleted     = 4,
  kAborted       = 5,
};

constexpr const char* ToString(MigrationState state) {
  switch (state) {
    case MigrationState::kIdle:
      return "idle";
    case MigrationState::kLoading:
      return "loading";
    case MigrationState::kProcessing:
      return "processing";
    case MigrationState::kCheckpointing:
      return "checkpointing";
    case MigrationState::kCompleted:
      return "completed";
    case MigrationState::kAborted:
      return "aborted";
  }
  return "unknown";
}

constexpr bool IsTerminal(MigrationState state) {
  return state == MigrationState::kCompleted || state == MigrationState::kAborted;
}

/*
  Idle -> Loading -> Processing <-> Checkpointing
  Loading | Processing | Checkpointing -> Aborted
  Processing | Checkpointing -> Completed
*/
constexpr bool CanTransition(MigrationState from, MigrationState to) {
  if (IsTerminal(from)) {
    return false;
  }

  switch (to) {
    case MigrationState::kIdle:
      return false;
    case MigrationState::kLoading:
      return from == MigrationState::kIdle;
    case MigrationState::kProcessing:
      return from == MigrationState::kLoading || from == MigrationState::kCheckpointing;
    case MigrationState::kCheckpointing:
      return from == MigrationState::kProcessing;
    case MigrationState::kCompleted:
      return from == MigrationState::kProcessing || from == MigrationState::kCheckpointing;
    case MigrationState::kAborted:
      return from != MigrationState::kIdle;
  }
  return false;
}

} // namespace resonance::migration
