#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_value.hpp"
#include "internal/util/time.hpp"

using resonance::observability::StringField;

static volatile std::sig_atomic_t g_cancel = 0;

void HandleSignal(int) {
  g_cancel = 1;
}

namespace {

struct Arguments {
  std::string              config_path;
  std::string              command;
  bool                     dry_run{false};
  std::optional<uint64_t>  limit;
  std::vector<std::string> failed;
};

void PrintUsage() {
  std::cerr << "Usage:\n"
            << "  resonance-runner --config <config.yaml> build   [--dry-run]\n"
            << "  resonance-runner --config <config.yaml> migrate [--dry-run] [--limit=N]\n"
            << "  resonance-runner --config <config.yaml> heal    --failed=<id>[,<id>...] [--dry-run]" << std::endl;
}

std::vector<std::string> SplitIds(const std::string& value) {
  std::vector<std::string> ids;
  std::stringstream        in(value);
  std::string              id;
  while (std::getline(in, id, ',')) {
    if (!id.empty()) ids.push_back(id);
  }
  return ids;
}

bool ParseArguments(int argc, char** argv, Arguments* args) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--config") {
      if (i + 1 >= argc) return false;
      args->config_path = argv[++i];
    } else if (arg.rfind("--config=", 0) == 0) {
      args->config_path = arg.substr(9);
    } else if (arg == "--dry-run") {
      args->dry_run = true;
    } else if (arg.rfind("--limit=", 0) == 0) {
      args->limit = resonance::util::ParseUnsigned(std::string_view(arg).substr(8));
      if (!args->limit) return false;
    } else if (arg.rfind("--failed=", 0) == 0) {
      args->failed = SplitIds(arg.substr(9));
    } else if (args->command.empty() && (arg == "build" || arg == "migrate" || arg == "heal")) {
      args->command = arg;
    } else {
      return false;
    }
  }

  if (args->config_path.empty() || args->command.empty()) return false;
  if (args->command == "heal" && args->failed.empty()) return false;
  if (args->command != "migrate" && args->limit) return false;
  return true;
}

int RunBuild(const resonance::runtime::config::RuntimeConfig& config, const Arguments& args) {
  auto pipeline = resonance::factory::BuildPipeline(config);
  auto summary  = pipeline->Build(args.dry_run, resonance::util::Now());

  std::cout << "build: nodes=" << summary.nodes << " recommendations=" << summary.recommendations
            << " proposals=" << summary.proposals << " signals_applied=" << summary.scoring.signals_applied
            << " outputs=" << summary.outputs.size() << (args.dry_run ? " (dry-run)" : "") << std::endl;
  return 0;
}

int RunMigrate(const resonance::runtime::config::RuntimeConfig& config, const Arguments& args) {
  auto engine = resonance::factory::BuildMigration(config, args.dry_run, args.limit);

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  while (engine->NextBatch()) {
    if (g_cancel) engine->RequestCancel();
  }

  const auto& result = engine->result();
  std::cout << "migrate: " << resonance::migration::ToString(result.status) << " processed=" << result.total_processed
            << "/" << result.total_input << " migrated=" << result.total_migrated
            << " skipped=" << result.total_skipped << " checkpoints=" << result.checkpoint_count
            << (result.partial() ? " (partial)" : " (full)") << (args.dry_run ? " (dry-run)" : "") << std::endl;

  if (!result.abort_reason.empty()) {
    std::cout << "migrate: stopped: " << result.abort_reason << std::endl;
  }
  return 0;
}

int RunHeal(const resonance::runtime::config::RuntimeConfig& config, const Arguments& args) {
  auto pipeline = resonance::factory::BuildPipeline(config);
  auto summary  = pipeline->Heal(args.failed, args.dry_run, resonance::util::Now());

  std::cout << "heal: engine=" << summary.engine << " rerouted=" << summary.report.rerouted()
            << " unresolved=" << summary.report.unresolved() << " time_ms=" << summary.report.total_time_ms()
            << (summary.report.within_budget() ? " (within budget)" : " (over budget)")
            << (args.dry_run ? " (dry-run)" : "") << std::endl;
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  Arguments args;
  if (!ParseArguments(argc, argv, &args)) {
    PrintUsage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = resonance::config::ConfigLoader::Load(args.config_path);

    resonance::observability::InitializeLogging(config);

    RESONANCE_LOG_INFO("resonance-runner started",
                       {StringField("command", args.command), StringField("config", args.config_path),
                        resonance::observability::BoolField("dry_run", args.dry_run)});

    // ------------------------------------------------------------
    // Dispatch
    // ------------------------------------------------------------
    int rc = 0;
    if (args.command == "build") {
      rc = RunBuild(config, args);
    } else if (args.command == "migrate") {
      rc = RunMigrate(config, args);
    } else {
      rc = RunHeal(config, args);
    }

    resonance::observability::ShutdownLogging();
    return rc;
  } catch (const resonance::util::CorruptionDetected& e) {
    RESONANCE_LOG_ERROR("Input corruption detected", {StringField("error", e.what())});
  } catch (const resonance::util::IOError& e) {
    RESONANCE_LOG_ERROR("I/O failure", {StringField("error", e.what())});
  } catch (const std::exception& e) {
    RESONANCE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
  }

  resonance::observability::ShutdownLogging();
  return 2;
}
