#include "taskweave/graph/validator.hpp"

#include "taskweave/graph/resolver.hpp"
#include "taskweave/util/log.hpp"

#include <unordered_set>

namespace taskweave {

auto GraphValidator::reaches(const Document& doc, TaskRef start,
                             TaskRef target) -> bool {
  // Visited set is local to this walk; duplicates and diamonds are expanded
  // once per query, never shared between edges.
  std::unordered_set<TaskRef> visited;
  std::vector<TaskRef> stack;
  stack.push_back(start);

  while (!stack.empty()) {
    TaskRef current = stack.back();
    stack.pop_back();

    if (current == target) {
      return true;
    }
    if (!visited.insert(current).second) {
      continue;
    }

    const auto* deps = find_dependencies(doc, current);
    if (deps == nullptr) {
      continue;
    }
    for (const auto& dep : *deps) {
      if (!visited.contains(dep)) {
        stack.push_back(dep);
      }
    }
  }
  return false;
}

auto GraphValidator::classify_edge(const Document& doc, TaskRef source,
                                   TaskRef target) -> Verdict {
  if (source == target) {
    return Verdict::SelfLoop;
  }
  if (!exists(doc, target)) {
    return Verdict::Dangling;
  }
  if (reaches(doc, target, source)) {
    return Verdict::Cyclic;
  }
  return Verdict::Valid;
}

auto GraphValidator::classify(const Document& doc) -> std::vector<EdgeVerdict> {
  std::vector<EdgeVerdict> verdicts;
  verdicts.reserve(doc.edge_count());

  auto classify_node = [&](TaskRef source, const std::vector<TaskRef>& deps) {
    for (std::size_t i = 0; i < deps.size(); ++i) {
      verdicts.push_back(EdgeVerdict{
          .source = source,
          .position = i,
          .target = deps[i],
          .verdict = classify_edge(doc, source, deps[i]),
      });
    }
  };

  for (const auto& task : doc.tasks) {
    classify_node(TaskRef::task(task.id), task.dependencies);
    for (const auto& sub : task.subtasks) {
      classify_node(TaskRef::subtask(task.id, sub.id), sub.dependencies);
    }
  }
  return verdicts;
}

auto GraphValidator::validate(const Document& doc) -> Result<void> {
  auto verdicts = classify(doc);
  bool valid = true;
  for (const auto& v : verdicts) {
    if (v.verdict != Verdict::Valid) {
      log::debug("Invalid dependency {} -> {} ({})", v.source, v.target,
                 to_string_view(v.verdict));
      valid = false;
    }
  }
  return valid ? ok() : fail(Error::InvalidArgument);
}

auto GraphValidator::summarize(const Document& doc,
                               std::span<const EdgeVerdict> verdicts)
    -> ValidationSummary {
  ValidationSummary summary{
      .tasks = doc.task_count(),
      .subtasks = doc.subtask_count(),
      .edges = verdicts.size(),
  };
  for (const auto& v : verdicts) {
    switch (v.verdict) {
      case Verdict::Valid: break;
      case Verdict::SelfLoop: ++summary.self_loops; break;
      case Verdict::Dangling: ++summary.dangling; break;
      case Verdict::Cyclic: ++summary.cyclic; break;
    }
  }
  return summary;
}

}  // namespace taskweave
