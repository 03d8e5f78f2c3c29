#include "taskweave/graph/editor.hpp"

#include "taskweave/graph/resolver.hpp"
#include "taskweave/graph/validator.hpp"
#include "taskweave/util/log.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

namespace taskweave {

namespace {

constexpr std::string_view kTestStrategyKey = "testStrategy";
constexpr std::string_view kPriorityKey = "priority";

[[nodiscard]] auto all_resolve(const Document& doc,
                               const std::vector<TaskRef>& refs) -> bool {
  return std::ranges::all_of(refs,
                             [&doc](TaskRef ref) { return exists(doc, ref); });
}

// Pulls a string member out of a node's extra keys. Values of any other
// type stay where they are.
[[nodiscard]] auto take_extra_string(nlohmann::json& extra,
                                     std::string_view key)
    -> std::optional<std::string> {
  auto it = extra.find(key);
  if (it == extra.end() || !it->is_string()) {
    return std::nullopt;
  }
  auto value = it->get<std::string>();
  extra.erase(it);
  return value;
}

}  // namespace

auto rewrite_references(Document& doc, TaskRef from, TaskRef to)
    -> std::size_t {
  std::size_t rewritten = 0;
  auto rewrite = [&](std::vector<TaskRef>& deps) {
    for (auto& dep : deps) {
      if (dep == from) {
        dep = to;
        ++rewritten;
      }
    }
  };
  for (auto& task : doc.tasks) {
    rewrite(task.dependencies);
    for (auto& sub : task.subtasks) {
      rewrite(sub.dependencies);
    }
  }
  return rewritten;
}

TaskGraphEditor::TaskGraphEditor(RepairOptions options, RepairSink sink)
    : options_(options), sink_(std::move(sink)) {}

auto TaskGraphEditor::finish(Document& doc) -> void {
  last_repair_ = GraphRepair::repair(doc, options_, sink_);
}

auto TaskGraphEditor::add_dependency(Document& doc, TaskRef from, TaskRef to)
    -> Result<bool> {
  auto node = resolve(doc, from);
  if (!node) {
    log::error("Task {} not found", from);
    return fail(node.error());
  }
  if (!exists(doc, to)) {
    log::error("Dependency target {} does not exist", to);
    return fail(Error::NotFound);
  }
  if (from == to) {
    log::error("Task {} cannot depend on itself", from);
    return fail(Error::InvalidOperation);
  }

  auto& deps = node->dependencies();
  if (std::ranges::find(deps, to) != deps.end()) {
    log::warn("Dependency {} already exists in task {}", to, from);
    finish(doc);
    return ok(false);
  }

  if (GraphValidator::would_create_cycle(doc, from, to)) {
    log::error("Cannot add dependency {} to {}: would create a cycle", to,
               from);
    return fail(Error::WouldCreateCycle);
  }

  deps.push_back(to);
  log::info("Added dependency {} to task {}", to, from);
  finish(doc);
  return ok(true);
}

auto TaskGraphEditor::remove_dependency(Document& doc, TaskRef from,
                                        TaskRef to) -> Result<bool> {
  auto node = resolve(doc, from);
  if (!node) {
    log::error("Task {} not found", from);
    return fail(node.error());
  }

  auto removed = std::erase(node->dependencies(), to);
  if (removed == 0) {
    log::info("Task {} does not depend on {}, no changes made", from, to);
  } else {
    log::info("Removed dependency {} from task {}", to, from);
  }
  finish(doc);
  return ok(removed > 0);
}

auto TaskGraphEditor::promote_subtask(Document& doc, NodeId parent,
                                      NodeId subtask_id) -> Result<NodeId> {
  auto* parent_task = doc.find_task(parent);
  if (parent_task == nullptr) {
    log::error("Parent task {} not found", parent);
    return fail(Error::NotFound);
  }
  auto* sub = parent_task->find_subtask(subtask_id);
  if (sub == nullptr) {
    log::error("Subtask {}.{} not found", parent, subtask_id);
    return fail(Error::NotFound);
  }

  auto new_id = doc.next_task_id();
  if (!new_id) {
    log::error("Cannot promote subtask {}.{}: task ids are exhausted", parent,
               subtask_id);
    return fail(new_id.error());
  }

  Task promoted;
  promoted.id = *new_id;
  promoted.title = std::move(sub->title);
  promoted.description = std::move(sub->description);
  promoted.details = sub->details.value_or("");
  promoted.status = sub->status;
  promoted.priority = parent_task->priority;
  // Sibling references are already absolute (parent.x) and stay valid.
  promoted.dependencies = std::move(sub->dependencies);
  promoted.extra = std::move(sub->extra);
  if (auto strategy = take_extra_string(promoted.extra, kTestStrategyKey)) {
    promoted.test_strategy = std::move(*strategy);
  }
  if (auto priority = take_extra_string(promoted.extra, kPriorityKey)) {
    if (auto parsed = parse<TaskPriority>(*priority)) {
      promoted.priority = *parsed;
    }
  }

  std::erase_if(parent_task->subtasks,
                [subtask_id](const Subtask& s) { return s.id == subtask_id; });
  doc.tasks.push_back(std::move(promoted));

  auto rewritten = rewrite_references(doc, TaskRef::subtask(parent, subtask_id),
                                      TaskRef::task(*new_id));
  log::info("Promoted subtask {}.{} to task {} ({} reference(s) rewritten)",
            parent, subtask_id, *new_id, rewritten);
  finish(doc);
  return ok(*new_id);
}

auto TaskGraphEditor::convert_task_to_subtask(Document& doc, TaskRef task,
                                              TaskRef parent)
    -> Result<TaskRef> {
  if (!exists(doc, task) || !exists(doc, parent)) {
    log::error("Cannot convert {} under {}: address not found", task, parent);
    return fail(Error::NotFound);
  }
  if (task.is_subtask()) {
    log::error("{} is already a subtask", task);
    return fail(Error::InvalidOperation);
  }
  if (parent.is_subtask() || parent.task_id() == task.task_id()) {
    // A subtask parent is either inside the moved subtree or would nest
    log::error("Cannot convert task {} into a subtask of {}", task, parent);
    return fail(Error::InvalidOperation);
  }

  auto* source = doc.find_task(task.task_id());
  if (!source->subtasks.empty()) {
    log::error("Task {} still has {} subtask(s); clear or promote them first",
               task, source->subtasks.size());
    return fail(Error::InvalidOperation);
  }

  auto* target = doc.find_task(parent.task_id());
  auto next_id = target->next_subtask_id();
  if (!next_id) {
    log::error("Cannot convert task {}: subtask ids of {} are exhausted", task,
               parent);
    return fail(next_id.error());
  }
  const NodeId new_sub_id = *next_id;

  Subtask moved;
  moved.id = new_sub_id;
  moved.title = std::move(source->title);
  moved.description = std::move(source->description);
  if (!source->details.empty()) {
    moved.details = std::move(source->details);
  }
  moved.status = source->status;
  moved.dependencies = std::move(source->dependencies);
  moved.extra = std::move(source->extra);
  if (!source->test_strategy.empty()) {
    moved.extra[std::string(kTestStrategyKey)] = source->test_strategy;
  }
  if (source->priority != target->priority) {
    moved.extra[std::string(kPriorityKey)] =
        std::string(to_string_view(source->priority));
  }

  target->subtasks.push_back(std::move(moved));
  std::erase_if(doc.tasks,
                [id = task.task_id()](const Task& t) { return t.id == id; });

  auto new_ref = TaskRef::subtask(parent.task_id(), new_sub_id);
  auto rewritten = rewrite_references(doc, task, new_ref);
  log::info("Converted task {} to subtask {} ({} reference(s) rewritten)",
            task, new_ref, rewritten);
  finish(doc);
  return ok(new_ref);
}

auto TaskGraphEditor::remove_subtask(Document& doc, NodeId parent,
                                     NodeId subtask_id, RemoveMode mode)
    -> Result<std::optional<NodeId>> {
  if (mode == RemoveMode::Convert) {
    auto promoted = promote_subtask(doc, parent, subtask_id);
    if (!promoted) {
      return fail(promoted.error());
    }
    return ok(std::optional<NodeId>{*promoted});
  }

  auto* parent_task = doc.find_task(parent);
  if (parent_task == nullptr ||
      parent_task->find_subtask(subtask_id) == nullptr) {
    log::error("Subtask {}.{} not found", parent, subtask_id);
    return fail(Error::NotFound);
  }

  std::erase_if(parent_task->subtasks,
                [subtask_id](const Subtask& s) { return s.id == subtask_id; });
  log::info("Removed subtask {}.{}", parent, subtask_id);
  finish(doc);
  return ok(std::optional<NodeId>{});
}

auto TaskGraphEditor::clear_subtasks(Document& doc, TaskRef task)
    -> Result<std::size_t> {
  if (task.is_subtask()) {
    log::error("{} is a subtask and has no subtasks to clear", task);
    return fail(Error::InvalidOperation);
  }
  auto* target = doc.find_task(task.task_id());
  if (target == nullptr) {
    log::error("Task {} not found", task);
    return fail(Error::NotFound);
  }

  auto removed = target->subtasks.size();
  target->subtasks.clear();
  log::info("Cleared {} subtask(s) from task {}", removed, task);
  finish(doc);
  return ok(removed);
}

auto TaskGraphEditor::add_task(Document& doc, NewTask task) -> Result<NodeId> {
  if (!all_resolve(doc, task.dependencies)) {
    log::error("New task lists a dependency that does not exist");
    return fail(Error::NotFound);
  }

  auto id = doc.next_task_id();
  if (!id) {
    log::error("Cannot add task: task ids are exhausted");
    return fail(id.error());
  }

  Task created;
  created.id = *id;
  created.title = std::move(task.title);
  created.description = std::move(task.description);
  created.details = std::move(task.details);
  created.test_strategy = std::move(task.test_strategy);
  created.status = task.status;
  created.priority = task.priority;
  created.dependencies = std::move(task.dependencies);

  doc.tasks.push_back(std::move(created));
  log::info("Added task {}", *id);
  finish(doc);
  return ok(*id);
}

auto TaskGraphEditor::add_subtask(Document& doc, TaskRef parent,
                                  NewSubtask subtask) -> Result<TaskRef> {
  if (parent.is_subtask()) {
    log::error("Subtasks cannot be nested under {}", parent);
    return fail(Error::InvalidOperation);
  }
  auto* target = doc.find_task(parent.task_id());
  if (target == nullptr) {
    log::error("Parent task {} not found", parent);
    return fail(Error::NotFound);
  }
  if (!all_resolve(doc, subtask.dependencies)) {
    log::error("New subtask lists a dependency that does not exist");
    return fail(Error::NotFound);
  }

  auto id = target->next_subtask_id();
  if (!id) {
    log::error("Cannot add subtask: subtask ids of {} are exhausted", parent);
    return fail(id.error());
  }

  Subtask created;
  created.id = *id;
  created.title = std::move(subtask.title);
  created.description = std::move(subtask.description);
  created.details = std::move(subtask.details);
  created.status = subtask.status;
  created.dependencies = std::move(subtask.dependencies);

  auto ref = TaskRef::subtask(target->id, created.id);
  target->subtasks.push_back(std::move(created));
  log::info("Added subtask {}", ref);
  finish(doc);
  return ok(ref);
}

auto TaskGraphEditor::remove_task(Document& doc, TaskRef ref) -> Result<void> {
  if (!exists(doc, ref)) {
    log::error("Task {} not found", ref);
    return fail(Error::NotFound);
  }

  if (ref.is_subtask()) {
    auto* parent = doc.find_task(ref.task_id());
    std::erase_if(parent->subtasks, [id = ref.subtask_id()](const Subtask& s) {
      return s.id == id;
    });
  } else {
    std::erase_if(doc.tasks,
                  [id = ref.task_id()](const Task& t) { return t.id == id; });
  }
  log::info("Removed {}", ref);
  finish(doc);
  return ok();
}

}  // namespace taskweave
