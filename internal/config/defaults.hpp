#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace resonance::config::defaults {

// scoring
inline constexpr double kInitialResonance    = 1.0;
inline constexpr double kResonanceFloor      = 0.5;
inline constexpr double kCtrCap              = 0.25;
inline constexpr double kCtrWeight           = 4.0;
inline constexpr double kDwellCapMinutes     = 5.0;
inline constexpr double kDwellWeight         = 0.3;
inline constexpr double kDepthCap            = 5.0;
inline constexpr double kDepthWeight         = 0.15;
inline constexpr double kReturnVisitCap      = 5.0;
inline constexpr double kReturnVisitWeight   = 0.2;
inline constexpr double kUnobservedDecayStep = 0.05;
inline constexpr double kUnobservedDecayCap  = 0.3;
inline constexpr double kAgeDecayPerDay      = 0.01;
inline constexpr double kAgeDecayCap         = 0.5;

// linking
inline constexpr uint32_t         kTopK              = 5;
inline constexpr double           kProposalThreshold = 2.5;
inline constexpr std::string_view kLinkReason        = "promote high-resonance nodes within cluster";

// output
inline constexpr std::string_view kOutputDirectory = "matrix";
inline constexpr std::string_view kRegistryFile    = "registry.json";
inline constexpr std::string_view kLinkMapFile     = "link-map.json";
inline constexpr std::string_view kProposalsFile   = "node-proposals.json";
inline constexpr std::string_view kSelfHealFile    = "self-heal.json";
inline constexpr std::string_view kDocumentVersion = "1.0";

// migration
inline constexpr uint32_t         kBatchSize          = 500;
inline constexpr uint32_t         kHeartbeatInterval  = 1000;
inline constexpr uint32_t         kCheckpointInterval = 5000;
inline constexpr double           kDefaultResonance   = 0.5;
inline constexpr double           kDefaultDecay       = 0.05;
inline constexpr uint32_t         kReadChunkBytes     = 256 * 1024;
inline constexpr std::string_view kMigrationOutput    = "migration-output";
inline constexpr std::string_view kCheckpointFile     = "migration-state.json";
inline constexpr std::string_view kHeartbeatLog       = "migration-log.jsonl";

inline constexpr std::array<std::string_view, 12> kGoldStandardAnchors = {
    "fathers-sons",     "mothers-daughters", "the-patriarch", "the-matriarch", "young-lions", "young-women",
    "the-professional", "the-griever",       "the-addict",    "the-protector", "men-solo",    "women-solo"};

// routing
inline constexpr uint32_t kMaxDepth     = 3;
inline constexpr uint32_t kMaxRoutes    = 5;
inline constexpr uint32_t kTimeBudgetMs = 50;

// governor
inline constexpr uint64_t         kMemoryTargetMb        = 56;
inline constexpr uint64_t         kMemoryHardKillMb      = 150;
inline constexpr double           kThermalThrottleCelsius = 80.0;
inline constexpr double           kThermalHardKillCelsius = 95.0;
inline constexpr uint32_t         kThrottleDelayMs       = 100;
inline constexpr uint32_t         kFailoverTimeoutMs     = 10;

} // namespace resonance::config::defaults
