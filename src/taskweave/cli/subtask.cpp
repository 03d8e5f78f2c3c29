#include "taskweave/cli/commands.hpp"
#include "taskweave/cli/workspace.hpp"

#include <format>
#include <optional>
#include <print>
#include <vector>

namespace taskweave::cli {

auto cmd_add_subtask(const EngineConfig& config, const AddSubtaskOptions& opts)
    -> int {
  auto parent = TaskRef::parse(opts.parent);
  if (!parent) {
    return report("invalid parent id '" + opts.parent + "'", parent.error());
  }
  if (opts.task_id.empty() && opts.title.empty()) {
    std::println(stderr, "Error: add-subtask requires --task-id or --title");
    return 1;
  }

  auto doc = load(config);
  if (!doc) {
    return report("failed to load " + config.document.path, doc.error());
  }
  auto editor = make_editor(config);

  if (!opts.task_id.empty()) {
    auto task = TaskRef::parse(opts.task_id);
    if (!task) {
      return report("invalid task id '" + opts.task_id + "'", task.error());
    }
    auto converted = editor.convert_task_to_subtask(*doc, *task, *parent);
    if (!converted) {
      return report(std::format("cannot convert task {} to a subtask of {}",
                                *task, *parent),
                    converted.error());
    }
    std::println("\u2713 Task {} is now subtask {}", *task, *converted);
    return commit(config, *doc, true);
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

  NewSubtask subtask{
      .title = opts.title,
      .description = opts.description,
      .details = std::nullopt,
      .status = *status,
      .dependencies = std::move(*deps),
  };
  if (!opts.details.empty()) {
    subtask.details = opts.details;
  }

  auto ref = editor.add_subtask(*doc, *parent, std::move(subtask));
  if (!ref) {
    return report(std::format("cannot add subtask to {}", *parent),
                  ref.error());
  }
  std::println("\u2713 Added subtask {}: {}", *ref, opts.title);
  return commit(config, *doc, true);
}

auto cmd_remove_subtask(const EngineConfig& config,
                        const RemoveSubtaskOptions& opts) -> int {
  auto refs = parse_ref_list(opts.ids);
  if (!refs) {
    return report("invalid id list '" + opts.ids + "'", refs.error());
  }
  for (auto ref : *refs) {
    if (!ref.is_subtask()) {
      std::println(stderr, "Error: --id must name subtasks as parent.sub, got '{}'",
                   ref);
      return 1;
    }
  }

  auto doc = load(config);
  if (!doc) {
    return report("failed to load " + config.document.path, doc.error());
  }

  auto editor = make_editor(config);
  auto mode = opts.convert ? RemoveMode::Convert : RemoveMode::Delete;
  bool changed = false;
  int failures = 0;
  for (auto ref : *refs) {
    auto removed =
        editor.remove_subtask(*doc, ref.task_id(), ref.subtask_id(), mode);
    if (!removed) {
      std::println(stderr, "Error: {}: {}", ref, removed.error().message());
      ++failures;
      continue;
    }
    changed = true;
    if (*removed) {
      std::println("\u2713 Subtask {} converted to task {}", ref, **removed);
    } else {
      std::println("\u2713 Removed subtask {}", ref);
    }
  }

  if (int rc = commit(config, *doc, changed); rc != 0) {
    return rc;
  }
  return failures > 0 ? 1 : 0;
}

auto cmd_clear_subtasks(const EngineConfig& config,
                        const ClearSubtasksOptions& opts) -> int {
  if (opts.ids.empty() && !opts.all) {
    std::println(stderr, "Error: clear-subtasks requires --id or --all");
    return 1;
  }

  auto doc = load(config);
  if (!doc) {
    return report("failed to load " + config.document.path, doc.error());
  }

  std::vector<TaskRef> targets;
  if (opts.all) {
    for (const auto& task : doc->tasks) {
      targets.push_back(TaskRef::task(task.id));
    }
  } else {
    auto refs = parse_ref_list(opts.ids);
    if (!refs) {
      return report("invalid id list '" + opts.ids + "'", refs.error());
    }
    targets = std::move(*refs);
  }

  auto editor = make_editor(config);
  bool changed = false;
  int failures = 0;
  for (auto target : targets) {
    auto removed = editor.clear_subtasks(*doc, target);
    if (!removed) {
      std::println(stderr, "Error: {}: {}", target, removed.error().message());
      ++failures;
      continue;
    }
    // The trailing repair may have pruned edges even when nothing was cleared
    changed = changed || *removed > 0 || editor.last_repair().changed;
    std::println("\u2713 Cleared {} subtask(s) from task {}", *removed, target);
  }

  if (int rc = commit(config, *doc, changed); rc != 0) {
    return rc;
  }
  return failures > 0 ? 1 : 0;
}

}  // namespace taskweave::cli
