#pragma once

#include "taskweave/graph/task_ref.hpp"
#include "taskweave/model/document.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

enum class RepairReason : std::uint8_t {
  SelfLoop,
  Dangling,
  Cyclic,
  Duplicate,
  Malformed,
  Migrated,
};

[[nodiscard]] constexpr auto to_string_view(RepairReason reason) noexcept
    -> std::string_view {
  switch (reason) {
    case RepairReason::SelfLoop: return "self-loop";
    case RepairReason::Dangling: return "dangling";
    case RepairReason::Cyclic: return "cyclic";
    case RepairReason::Duplicate: return "duplicate";
    case RepairReason::Malformed: return "malformed";
    case RepairReason::Migrated: return "migrated";
  }
  return "malformed";
}

struct RepairAction {
  TaskRef node;
  std::optional<TaskRef> removed;
  RepairReason reason{RepairReason::Dangling};
  std::string detail;
};

// Optional diagnostic callback; an empty function is a valid no-op sink.
using RepairSink = std::function<void(const RepairAction&)>;

struct RepairStats {
  std::size_t self_loops{0};
  std::size_t dangling{0};
  std::size_t cyclic{0};
  std::size_t duplicates{0};
  std::size_t malformed{0};
  std::size_t migrated{0};
  std::size_t tasks_fixed{0};
  std::size_t subtasks_fixed{0};

  [[nodiscard]] auto edges_removed() const noexcept -> std::size_t {
    return self_loops + dangling + cyclic + duplicates;
  }
  [[nodiscard]] auto total() const noexcept -> std::size_t {
    return edges_removed() + malformed + migrated;
  }
};

struct RepairReport {
  bool changed{false};
  RepairStats stats;
  std::vector<RepairAction> actions;
};

struct RepairOptions {
  bool remove_duplicates{true};
};

class GraphRepair {
public:
  // Prunes self-loop, dangling and cyclic edges in place. Edges are checked
  // in document order against the already-pruned graph, so a cycle loses only
  // the first of its edges met in that order. Never fails.
  static auto repair(Document& doc, const RepairOptions& options = {},
                     const RepairSink& sink = {}) -> RepairReport;
};

}  // namespace taskweave
