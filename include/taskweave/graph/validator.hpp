#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/graph/task_ref.hpp"
#include "taskweave/model/document.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace taskweave {

enum class Verdict : std::uint8_t {
  Valid,
  SelfLoop,
  Dangling,
  Cyclic,
};

[[nodiscard]] constexpr auto to_string_view(Verdict verdict) noexcept
    -> std::string_view {
  switch (verdict) {
    case Verdict::Valid: return "valid";
    case Verdict::SelfLoop: return "self-loop";
    case Verdict::Dangling: return "dangling";
    case Verdict::Cyclic: return "cyclic";
  }
  return "valid";
}

struct EdgeVerdict {
  TaskRef source;
  std::size_t position{0};  // index in the source's dependency list
  TaskRef target;
  Verdict verdict{Verdict::Valid};
};

struct ValidationSummary {
  std::size_t tasks{0};
  std::size_t subtasks{0};
  std::size_t edges{0};
  std::size_t self_loops{0};
  std::size_t dangling{0};
  std::size_t cyclic{0};

  [[nodiscard]] auto issues() const noexcept -> std::size_t {
    return self_loops + dangling + cyclic;
  }
  [[nodiscard]] auto valid() const noexcept -> bool {
    return issues() == 0;
  }
};

class GraphValidator {
public:
  // Every edge in document order (task, then its subtasks; list order within
  // a node). Pure function of the snapshot.
  [[nodiscard]] static auto classify(const Document& doc)
      -> std::vector<EdgeVerdict>;

  // Fails with Error::InvalidArgument if any edge is not Valid.
  [[nodiscard]] static auto validate(const Document& doc) -> Result<void>;

  [[nodiscard]] static auto summarize(const Document& doc,
                                      std::span<const EdgeVerdict> verdicts)
      -> ValidationSummary;

  [[nodiscard]] static auto classify_edge(const Document& doc, TaskRef source,
                                          TaskRef target) -> Verdict;

  // True if `target` is reachable from `start` along dependency edges.
  // Unresolvable addresses end their branch of the walk.
  [[nodiscard]] static auto reaches(const Document& doc, TaskRef start,
                                    TaskRef target) -> bool;

  // Adding from -> to closes a cycle iff `from` is reachable from `to`.
  [[nodiscard]] static auto would_create_cycle(const Document& doc,
                                               TaskRef from, TaskRef to)
      -> bool {
    return from == to || reaches(doc, to, from);
  }
};

}  // namespace taskweave
