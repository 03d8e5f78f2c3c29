#include "taskweave/cli/commands.hpp"
#include "taskweave/cli/workspace.hpp"

#include <format>
#include <print>

namespace taskweave::cli {

auto cmd_add_task(const EngineConfig& config, const AddTaskOptions& opts)
    -> int {
  if (opts.title.empty()) {
    std::println(stderr, "Error: add-task requires --title");
    return 1;
  }
  auto priority = parse<TaskPriority>(opts.priority);
  if (!priority) {
    return report("unknown priority '" + opts.priority + "'",
                  priority.error());
  }
  auto status = parse<TaskStatus>(opts.status);
  if (!status) {
    return report("unknown status '" + opts.status + "'", status.error());
  }
  auto deps = parse_optional_refs(opts.dependencies);
  if (!deps) {
    return report("invalid dependency list '" + opts.dependencies + "'",
                  deps.error());
  }

  auto doc = load(config);
  if (!doc) {
    return report("failed to load " + config.document.path, doc.error());
  }

  auto editor = make_editor(config);
  auto id = editor.add_task(*doc, NewTask{
                                      .title = opts.title,
                                      .description = opts.description,
                                      .details = opts.details,
                                      .test_strategy = opts.test_strategy,
                                      .status = *status,
                                      .priority = *priority,
                                      .dependencies = std::move(*deps),
                                  });
  if (!id) {
    return report("cannot add task", id.error());
  }
  std::println("\u2713 Added task {}: {}", *id, opts.title);
  return commit(config, *doc, true);
}

auto cmd_remove_task(const EngineConfig& config, const RemoveTaskOptions& opts)
    -> int {
  auto refs = parse_ref_list(opts.ids);
  if (!refs) {
    return report("invalid id list '" + opts.ids + "'", refs.error());
  }

  auto doc = load(config);
  if (!doc) {
    return report("failed to load " + config.document.path, doc.error());
  }

  auto editor = make_editor(config);
  bool changed = false;
  int failures = 0;
  for (auto ref : *refs) {
    if (auto r = editor.remove_task(*doc, ref); !r) {
      std::println(stderr, "Error: {}: {}", ref, r.error().message());
      ++failures;
      continue;
    }
    changed = true;
    std::println("\u2713 Removed {}", ref);
  }

  if (int rc = commit(config, *doc, changed); rc != 0) {
    return rc;
  }
  return failures > 0 ? 1 : 0;
}

}  // namespace taskweave::cli
