#pragma once

#include "taskweave/core/error.hpp"

#include <compare>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace taskweave {

using NodeId = std::uint32_t;

// Address of a top-level task: textual form "n"
struct TaskId {
  NodeId value{0};

  [[nodiscard]] friend constexpr auto operator<=>(const TaskId&,
                                                  const TaskId&) = default;
};

// Address of a subtask scoped to its parent: textual form "p.s"
struct SubtaskId {
  NodeId parent{0};
  NodeId value{0};

  [[nodiscard]] friend constexpr auto operator<=>(const SubtaskId&,
                                                  const SubtaskId&) = default;
};

// Dependency address. Closed sum of TaskId and SubtaskId; tasks order before
// subtasks, then numerically.
class TaskRef {
public:
  constexpr TaskRef() = default;
  constexpr TaskRef(TaskId id) : value_(id) {}
  constexpr TaskRef(SubtaskId id) : value_(id) {}

  [[nodiscard]] static constexpr auto task(NodeId id) -> TaskRef {
    return TaskRef{TaskId{id}};
  }
  [[nodiscard]] static constexpr auto subtask(NodeId parent, NodeId id)
      -> TaskRef {
    return TaskRef{SubtaskId{parent, id}};
  }

  // Accepts "n" or "n.m" with positive integer segments. Surrounding
  // whitespace is ignored.
  [[nodiscard]] static auto parse(std::string_view text) -> Result<TaskRef>;

  [[nodiscard]] constexpr auto is_task() const noexcept -> bool {
    return std::holds_alternative<TaskId>(value_);
  }
  [[nodiscard]] constexpr auto is_subtask() const noexcept -> bool {
    return std::holds_alternative<SubtaskId>(value_);
  }

  // Owning task id: the task itself, or the parent of a subtask.
  [[nodiscard]] constexpr auto task_id() const noexcept -> NodeId {
    if (const auto* sub = std::get_if<SubtaskId>(&value_)) {
      return sub->parent;
    }
    return std::get<TaskId>(value_).value;
  }

  // Subtask id within the parent, 0 for task addresses.
  [[nodiscard]] constexpr auto subtask_id() const noexcept -> NodeId {
    if (const auto* sub = std::get_if<SubtaskId>(&value_)) {
      return sub->value;
    }
    return 0;
  }

  [[nodiscard]] constexpr auto as_variant() const noexcept
      -> const std::variant<TaskId, SubtaskId>& {
    return value_;
  }

  [[nodiscard]] auto str() const -> std::string;

  [[nodiscard]] friend constexpr auto operator<=>(const TaskRef&,
                                                  const TaskRef&) = default;
  [[nodiscard]] friend constexpr auto operator==(const TaskRef&,
                                                 const TaskRef&)
      -> bool = default;

private:
  std::variant<TaskId, SubtaskId> value_{TaskId{}};
};

// Comma separated batch, e.g. "1, 2.3,4". Empty segments are rejected.
[[nodiscard]] auto parse_ref_list(std::string_view text)
    -> Result<std::vector<TaskRef>>;

// Parses a positive integer id segment.
[[nodiscard]] auto parse_node_id(std::string_view text) -> Result<NodeId>;

inline auto operator<<(std::ostream& os, const TaskRef& ref) -> std::ostream& {
  return os << ref.str();
}

}  // namespace taskweave

template <>
struct std::hash<taskweave::TaskRef> {
  auto operator()(const taskweave::TaskRef& ref) const noexcept
      -> std::size_t {
    auto key = (static_cast<std::uint64_t>(ref.task_id()) << 32) |
               ref.subtask_id();
    return std::hash<std::uint64_t>{}(key ^
                                      (ref.is_subtask() ? 0x9e3779b9ULL : 0));
  }
};

template <>
struct std::formatter<taskweave::TaskRef> : std::formatter<std::string> {
  auto format(const taskweave::TaskRef& ref, auto& ctx) const {
    return std::formatter<std::string>::format(ref.str(), ctx);
  }
};
