#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/graph/task_ref.hpp"
#include "taskweave/model/document.hpp"

#include <type_traits>
#include <vector>

namespace taskweave {

// Non-owning view of a resolved node. Valid until the owning document's task
// or subtask vectors are resized.
template <typename TaskT, typename SubtaskT>
struct BasicNodeHandle {
  TaskT* task{nullptr};
  SubtaskT* subtask{nullptr};

  [[nodiscard]] auto is_subtask() const noexcept -> bool {
    return subtask != nullptr;
  }

  [[nodiscard]] auto ref() const -> TaskRef {
    return subtask ? TaskRef::subtask(task->id, subtask->id)
                   : TaskRef::task(task->id);
  }

  [[nodiscard]] auto dependencies() const -> auto& {
    return subtask ? subtask->dependencies : task->dependencies;
  }

  [[nodiscard]] auto status() const -> auto& {
    return subtask ? subtask->status : task->status;
  }

  [[nodiscard]] auto title() const -> auto& {
    return subtask ? subtask->title : task->title;
  }
};

using NodeHandle = BasicNodeHandle<Task, Subtask>;
using ConstNodeHandle = BasicNodeHandle<const Task, const Subtask>;

// Fails with Error::NotFound when the address does not name a node.
[[nodiscard]] auto resolve(Document& doc, TaskRef ref) -> Result<NodeHandle>;
[[nodiscard]] auto resolve(const Document& doc, TaskRef ref)
    -> Result<ConstNodeHandle>;

[[nodiscard]] auto exists(const Document& doc, TaskRef ref) -> bool;

// Dependency list of a node, or nullptr when it does not resolve.
[[nodiscard]] auto find_dependencies(const Document& doc, TaskRef ref)
    -> const std::vector<TaskRef>*;

}  // namespace taskweave
