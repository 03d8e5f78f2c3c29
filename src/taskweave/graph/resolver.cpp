#include "taskweave/graph/resolver.hpp"

namespace taskweave {

namespace {

template <typename Handle, typename Doc>
[[nodiscard]] auto resolve_impl(Doc& doc, TaskRef ref) -> Result<Handle> {
  auto* task = doc.find_task(ref.task_id());
  if (task == nullptr) {
    return fail(Error::NotFound);
  }
  if (ref.is_task()) {
    return Handle{task, nullptr};
  }
  auto* sub = task->find_subtask(ref.subtask_id());
  if (sub == nullptr) {
    return fail(Error::NotFound);
  }
  return Handle{task, sub};
}

}  // namespace

auto resolve(Document& doc, TaskRef ref) -> Result<NodeHandle> {
  return resolve_impl<NodeHandle>(doc, ref);
}

auto resolve(const Document& doc, TaskRef ref) -> Result<ConstNodeHandle> {
  return resolve_impl<ConstNodeHandle>(doc, ref);
}

auto exists(const Document& doc, TaskRef ref) -> bool {
  return resolve(doc, ref).has_value();
}

auto find_dependencies(const Document& doc, TaskRef ref)
    -> const std::vector<TaskRef>* {
  auto node = resolve(doc, ref);
  if (!node) {
    return nullptr;
  }
  return &node->dependencies();
}

}  // namespace taskweave
