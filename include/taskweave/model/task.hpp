#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/graph/task_ref.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace taskweave {

enum class TaskStatus : std::uint8_t {
  Pending,
  InProgress,
  Done,
  Review,
  Deferred,
  Cancelled,
};

enum class TaskPriority : std::uint8_t {
  High,
  Medium,
  Low,
};

namespace detail {

constexpr std::array<std::string_view, 6> kTaskStatusNames = {
    "pending", "in-progress", "done", "review", "deferred", "cancelled",
};

constexpr std::array<std::string_view, 3> kTaskPriorityNames = {
    "high",
    "medium",
    "low",
};

}  // namespace detail

[[nodiscard]] constexpr auto to_string_view(TaskStatus status) noexcept
    -> std::string_view {
  return detail::kTaskStatusNames[std::to_underlying(status)];
}

[[nodiscard]] constexpr auto to_string_view(TaskPriority priority) noexcept
    -> std::string_view {
  return detail::kTaskPriorityNames[std::to_underlying(priority)];
}

template <typename T>
[[nodiscard]] auto parse(std::string_view s) -> Result<T>;

template <>
[[nodiscard]] inline auto parse<TaskStatus>(std::string_view s)
    -> Result<TaskStatus> {
  auto it = std::ranges::find(detail::kTaskStatusNames, s);
  if (it == detail::kTaskStatusNames.end()) {
    return fail(Error::InvalidArgument);
  }
  return ok(static_cast<TaskStatus>(
      std::ranges::distance(detail::kTaskStatusNames.begin(), it)));
}

template <>
[[nodiscard]] inline auto parse<TaskPriority>(std::string_view s)
    -> Result<TaskPriority> {
  auto it = std::ranges::find(detail::kTaskPriorityNames, s);
  if (it == detail::kTaskPriorityNames.end()) {
    return fail(Error::InvalidArgument);
  }
  return ok(static_cast<TaskPriority>(
      std::ranges::distance(detail::kTaskPriorityNames.begin(), it)));
}

struct Subtask {
  NodeId id{0};
  std::string title;
  std::string description;
  std::optional<std::string> details;
  TaskStatus status{TaskStatus::Pending};
  std::vector<TaskRef> dependencies;
  // Keys this engine does not model, written back untouched
  nlohmann::json extra = nlohmann::json::object();
};

struct Task {
  NodeId id{0};
  std::string title;
  std::string description;
  std::string details;
  std::string test_strategy;
  TaskStatus status{TaskStatus::Pending};
  TaskPriority priority{TaskPriority::Medium};
  std::vector<TaskRef> dependencies;
  std::vector<Subtask> subtasks;
  nlohmann::json extra = nlohmann::json::object();

  [[nodiscard]] auto find_subtask(NodeId sub_id) -> Subtask* {
    auto it = std::ranges::find(subtasks, sub_id, &Subtask::id);
    return it != subtasks.end() ? &*it : nullptr;
  }

  [[nodiscard]] auto find_subtask(NodeId sub_id) const -> const Subtask* {
    auto it = std::ranges::find(subtasks, sub_id, &Subtask::id);
    return it != subtasks.end() ? &*it : nullptr;
  }

  [[nodiscard]] auto next_subtask_id() const -> Result<NodeId> {
    NodeId max_id = 0;
    for (const auto& sub : subtasks) {
      max_id = std::max(max_id, sub.id);
    }
    if (max_id == std::numeric_limits<NodeId>::max()) {
      return fail(Error::InvalidOperation);
    }
    return ok(max_id + 1);
  }
};

}  // namespace taskweave
