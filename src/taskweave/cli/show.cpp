#include "taskweave/cli/commands.hpp"
#include "taskweave/cli/workspace.hpp"
#include "taskweave/graph/resolver.hpp"

#include <format>
#include <print>
#include <utility>

namespace taskweave::cli {

namespace {

auto print_field(std::string_view label, std::string_view value) -> void {
  if (!value.empty()) {
    std::println("  {:<15} {}", label, value);
  }
}

auto print_task(const Task& task) -> void {
  std::println("Task {}: {}", task.id, task.title);
  print_field("Status:", to_string_view(task.status));
  print_field("Priority:", to_string_view(task.priority));
  print_field("Dependencies:", join_refs(task.dependencies));
  print_field("Description:", task.description);
  print_field("Details:", task.details);
  print_field("Test strategy:", task.test_strategy);

  if (task.subtasks.empty()) {
    return;
  }
  std::println("  Subtasks:");
  for (const auto& sub : task.subtasks) {
    std::println("    {}.{} [{}] {} (depends on: {})", task.id, sub.id,
                 to_string_view(sub.status), sub.title,
                 join_refs(sub.dependencies));
  }
}

auto print_subtask(const Task& parent, const Subtask& sub) -> void {
  std::println("Subtask {}.{}: {}", parent.id, sub.id, sub.title);
  std::println("  {:<15} {} ({})", "Parent:", parent.id, parent.title);
  print_field("Status:", to_string_view(sub.status));
  print_field("Dependencies:", join_refs(sub.dependencies));
  print_field("Description:", sub.description);
  print_field("Details:", sub.details.value_or(""));
}

}  // namespace

auto cmd_show(const EngineConfig& config, const ShowOptions& opts) -> int {
  auto ref = TaskRef::parse(opts.id);
  if (!ref) {
    return report("invalid id '" + opts.id + "'", ref.error());
  }

  auto doc = load(config);
  if (!doc) {
    return report("failed to load " + config.document.path, doc.error());
  }

  auto node = resolve(std::as_const(*doc), *ref);
  if (!node) {
    return report(std::format("task {}", *ref), node.error());
  }

  if (node->is_subtask()) {
    print_subtask(*node->task, *node->subtask);
  } else {
    print_task(*node->task);
  }
  return 0;
}

}  // namespace taskweave::cli
