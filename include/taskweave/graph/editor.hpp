#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/graph/repair.hpp"
#include "taskweave/graph/task_ref.hpp"
#include "taskweave/model/document.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace taskweave {

enum class RemoveMode : std::uint8_t {
  Delete,
  Convert,
};

struct NewTask {
  std::string title;
  std::string description;
  std::string details;
  std::string test_strategy;
  TaskStatus status{TaskStatus::Pending};
  TaskPriority priority{TaskPriority::Medium};
  std::vector<TaskRef> dependencies;
};

struct NewSubtask {
  std::string title;
  std::string description;
  std::optional<std::string> details;
  TaskStatus status{TaskStatus::Pending};
  std::vector<TaskRef> dependencies;
};

// Structural edits on a caller-owned document. Each successful operation
// finishes with a repair pass, so the document satisfies the graph
// invariants on return. A failed operation leaves the document untouched.
class TaskGraphEditor {
public:
  explicit TaskGraphEditor(RepairOptions options = {}, RepairSink sink = {});

  // false when the dependency was already present
  [[nodiscard]] auto add_dependency(Document& doc, TaskRef from, TaskRef to)
      -> Result<bool>;
  // false when there was nothing to remove
  [[nodiscard]] auto remove_dependency(Document& doc, TaskRef from, TaskRef to)
      -> Result<bool>;

  // Returns the new task id.
  [[nodiscard]] auto promote_subtask(Document& doc, NodeId parent,
                                     NodeId subtask_id) -> Result<NodeId>;
  // Returns the new subtask address.
  [[nodiscard]] auto convert_task_to_subtask(Document& doc, TaskRef task,
                                             TaskRef parent)
      -> Result<TaskRef>;

  // Convert mode returns the id of the promoted task.
  [[nodiscard]] auto remove_subtask(Document& doc, NodeId parent,
                                    NodeId subtask_id, RemoveMode mode)
      -> Result<std::optional<NodeId>>;
  // Returns how many subtasks were removed.
  [[nodiscard]] auto clear_subtasks(Document& doc, TaskRef task)
      -> Result<std::size_t>;

  [[nodiscard]] auto add_task(Document& doc, NewTask task) -> Result<NodeId>;
  [[nodiscard]] auto add_subtask(Document& doc, TaskRef parent,
                                 NewSubtask subtask) -> Result<TaskRef>;
  // Removes a task (with its subtasks) or a single subtask.
  [[nodiscard]] auto remove_task(Document& doc, TaskRef ref) -> Result<void>;

  [[nodiscard]] auto last_repair() const noexcept -> const RepairReport& {
    return last_repair_;
  }

private:
  auto finish(Document& doc) -> void;

  RepairOptions options_;
  RepairSink sink_;
  RepairReport last_repair_;
};

// Rewrites every dependency equal to `from` into `to`, across all nodes.
// Returns the number of references rewritten.
auto rewrite_references(Document& doc, TaskRef from, TaskRef to)
    -> std::size_t;

}  // namespace taskweave
