#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/graph/task_ref.hpp"
#include "taskweave/model/document.hpp"

#include <span>
#include <vector>

namespace taskweave {

struct StatusChange {
  TaskRef node;
  TaskStatus previous{TaskStatus::Pending};
  TaskStatus current{TaskStatus::Pending};

  [[nodiscard]] auto changed() const noexcept -> bool {
    return previous != current;
  }
};

// Sets the status of exactly the addressed node. Parent and subtask
// statuses are independent.
[[nodiscard]] auto set_status(Document& doc, TaskRef ref, TaskStatus status)
    -> Result<StatusChange>;

// One result per address, in input order.
[[nodiscard]] auto set_status(Document& doc, std::span<const TaskRef> refs,
                              TaskStatus status)
    -> std::vector<Result<StatusChange>>;

}  // namespace taskweave
