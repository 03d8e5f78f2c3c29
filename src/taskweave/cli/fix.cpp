#include "taskweave/cli/commands.hpp"
#include "taskweave/cli/workspace.hpp"
#include "taskweave/graph/repair.hpp"

#include <print>

namespace taskweave::cli {

auto cmd_fix(const EngineConfig& config) -> int {
  auto doc = load(config);
  if (!doc) {
    return report("failed to load " + config.document.path, doc.error());
  }

  auto result = GraphRepair::repair(*doc, config.repair_options(), print_sink());
  if (!result.changed) {
    std::println("\u2713 No dependency issues found");
    return 0;
  }

  print_stats(result.stats);
  return commit(config, *doc, true);
}

auto cmd_migrate(const EngineConfig& config) -> int {
  auto legacy = config;
  legacy.references.sibling_shorthand = true;

  auto doc = load(legacy);
  if (!doc) {
    return report("failed to load " + config.document.path, doc.error());
  }

  auto result = GraphRepair::repair(*doc, legacy.repair_options(), print_sink());
  if (!result.changed) {
    std::println("\u2713 Nothing to migrate");
    return 0;
  }

  std::println("Migrated {} sibling reference(s)", result.stats.migrated);
  print_stats(result.stats);
  return commit(legacy, *doc, true);
}

}  // namespace taskweave::cli
