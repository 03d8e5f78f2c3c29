#include "taskweave/cli/commands.hpp"
#include "taskweave/cli/workspace.hpp"
#include "taskweave/graph/validator.hpp"

#include <print>

namespace taskweave::cli {

auto cmd_validate(const EngineConfig& config) -> int {
  auto doc = load(config);
  if (!doc) {
    return report("failed to load " + config.document.path, doc.error());
  }

  std::println("Validating dependencies in {}...\n", config.document.path);

  for (const auto& note : doc->pending_normalizations) {
    std::println("\u2717 {} - {}", note.node, note.detail);
  }

  auto verdicts = GraphValidator::classify(*doc);
  for (const auto& v : verdicts) {
    if (v.verdict == Verdict::Valid) continue;
    std::println("\u2717 {} -> {} - {}", v.source, v.target,
                 to_string_view(v.verdict));
  }

  auto summary = GraphValidator::summarize(*doc, verdicts);
  auto issues = summary.issues() + doc->pending_normalizations.size();
  std::println("\nSummary: {} task(s), {} subtask(s), {} dependencies",
               summary.tasks, summary.subtasks, summary.edges);
  std::println("  self-loops: {}, dangling: {}, cyclic: {}, malformed: {}",
               summary.self_loops, summary.dangling, summary.cyclic,
               doc->pending_normalizations.size());

  if (issues == 0) {
    std::println("\u2713 All dependencies are valid");
    return 0;
  }
  std::println("Run 'taskweave fix' to repair {} issue(s)", issues);
  return 1;
}

}  // namespace taskweave::cli
