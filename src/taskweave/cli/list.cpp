#include "taskweave/cli/commands.hpp"
#include "taskweave/cli/workspace.hpp"

#include <format>
#include <optional>
#include <print>

namespace taskweave::cli {

auto cmd_list(const EngineConfig& config, const ListOptions& opts) -> int {
  auto doc = load(config);
  if (!doc) {
    return report("failed to load " + config.document.path, doc.error());
  }

  std::optional<TaskStatus> filter;
  if (!opts.status.empty()) {
    auto status = parse<TaskStatus>(opts.status);
    if (!status) {
      return report("unknown status " + opts.status, status.error());
    }
    filter = *status;
  }

  if (doc->tasks.empty()) {
    std::println("No tasks found.");
    return 0;
  }

  std::println("{:<8} {:<12} {:<9} {:<20} {}", "ID", "STATUS", "PRIORITY",
               "DEPENDENCIES", "TITLE");
  std::size_t shown = 0;
  for (const auto& task : doc->tasks) {
    if (filter && task.status != *filter) {
      continue;
    }
    ++shown;
    std::println("{:<8} {:<12} {:<9} {:<20} {}", task.id,
                 to_string_view(task.status), to_string_view(task.priority),
                 join_refs(task.dependencies), task.title);
    if (!opts.with_subtasks) {
      continue;
    }
    for (const auto& sub : task.subtasks) {
      std::println("{:<8} {:<12} {:<9} {:<20} {}",
                   std::format("  {}.{}", task.id, sub.id),
                   to_string_view(sub.status), "", join_refs(sub.dependencies),
                   sub.title);
    }
  }

  std::println("\n{} of {} task(s), {} subtask(s)", shown, doc->task_count(),
               doc->subtask_count());
  return 0;
}

}  // namespace taskweave::cli
