#include "taskweave/graph/status.hpp"

#include "taskweave/graph/resolver.hpp"
#include "taskweave/util/log.hpp"

namespace taskweave {

auto set_status(Document& doc, TaskRef ref, TaskStatus status)
    -> Result<StatusChange> {
  auto node = resolve(doc, ref);
  if (!node) {
    log::error("Task {} not found", ref);
    return fail(node.error());
  }

  StatusChange change{
      .node = ref,
      .previous = node->status(),
      .current = status,
  };
  node->status() = status;
  log::info("Status of {} set to {} (was {})", ref, to_string_view(status),
            to_string_view(change.previous));
  return ok(change);
}

auto set_status(Document& doc, std::span<const TaskRef> refs,
                TaskStatus status) -> std::vector<Result<StatusChange>> {
  std::vector<Result<StatusChange>> results;
  results.reserve(refs.size());
  for (auto ref : refs) {
    results.push_back(set_status(doc, ref, status));
  }
  return results;
}

}  // namespace taskweave
