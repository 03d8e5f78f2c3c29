#include "taskweave/model/document.hpp"

#include <algorithm>
#include <limits>
#include <ranges>

namespace taskweave {

auto Document::find_task(NodeId id) -> Task* {
  auto it = std::ranges::find(tasks, id, &Task::id);
  return it != tasks.end() ? &*it : nullptr;
}

auto Document::find_task(NodeId id) const -> const Task* {
  auto it = std::ranges::find(tasks, id, &Task::id);
  return it != tasks.end() ? &*it : nullptr;
}

auto Document::max_task_id() const noexcept -> NodeId {
  NodeId max_id = 0;
  for (const auto& task : tasks) {
    max_id = std::max(max_id, task.id);
  }
  return max_id;
}

auto Document::next_task_id() const -> Result<NodeId> {
  auto max_id = max_task_id();
  if (max_id == std::numeric_limits<NodeId>::max()) {
    return fail(Error::InvalidOperation);
  }
  return ok(max_id + 1);
}

auto Document::subtask_count() const noexcept -> std::size_t {
  std::size_t count = 0;
  for (const auto& task : tasks) {
    count += task.subtasks.size();
  }
  return count;
}

auto Document::edge_count() const noexcept -> std::size_t {
  std::size_t count = 0;
  for (const auto& task : tasks) {
    count += task.dependencies.size();
    for (const auto& sub : task.subtasks) {
      count += sub.dependencies.size();
    }
  }
  return count;
}

auto Document::node_refs() const -> std::vector<TaskRef> {
  std::vector<TaskRef> refs;
  refs.reserve(tasks.size() + subtask_count());
  for (const auto& task : tasks) {
    refs.push_back(TaskRef::task(task.id));
    for (const auto& sub : task.subtasks) {
      refs.push_back(TaskRef::subtask(task.id, sub.id));
    }
  }
  return refs;
}

}  // namespace taskweave
