#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/graph/task_ref.hpp"
#include "taskweave/model/task.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace taskweave {

enum class NormalizationKind : std::uint8_t {
  Malformed,  // field replaced or entry dropped while decoding
  Migrated,   // legacy sibling shorthand rewritten to an explicit address
};

// Decode-time correction, reported by the next repair pass.
struct Normalization {
  TaskRef node;
  NormalizationKind kind{NormalizationKind::Malformed};
  std::optional<TaskRef> ref;
  std::string detail;
};

// In-memory task document. Owned by the caller and passed to every engine
// call; the engine keeps no copy between calls.
struct Document {
  std::vector<Task> tasks;
  nlohmann::json extra = nlohmann::json::object();
  std::vector<Normalization> pending_normalizations;

  [[nodiscard]] auto find_task(NodeId id) -> Task*;
  [[nodiscard]] auto find_task(NodeId id) const -> const Task*;

  [[nodiscard]] auto max_task_id() const noexcept -> NodeId;
  // InvalidOperation once the largest id is already the NodeId maximum.
  [[nodiscard]] auto next_task_id() const -> Result<NodeId>;

  [[nodiscard]] auto task_count() const noexcept -> std::size_t {
    return tasks.size();
  }
  [[nodiscard]] auto subtask_count() const noexcept -> std::size_t;
  [[nodiscard]] auto edge_count() const noexcept -> std::size_t;

  // Every node address in document order: each task, then its subtasks.
  [[nodiscard]] auto node_refs() const -> std::vector<TaskRef>;
};

}  // namespace taskweave
