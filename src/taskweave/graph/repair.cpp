#include "taskweave/graph/repair.hpp"

#include "taskweave/graph/validator.hpp"
#include "taskweave/util/log.hpp"

#include <format>
#include <unordered_set>

namespace taskweave {

namespace {

[[nodiscard]] auto reason_for(Verdict verdict) -> RepairReason {
  switch (verdict) {
    case Verdict::SelfLoop: return RepairReason::SelfLoop;
    case Verdict::Cyclic: return RepairReason::Cyclic;
    case Verdict::Dangling:
    case Verdict::Valid: break;
  }
  return RepairReason::Dangling;
}

class RepairPass {
public:
  RepairPass(Document& doc, const RepairOptions& options,
             const RepairSink& sink)
      : doc_(doc), options_(options), sink_(sink) {}

  auto run() -> RepairReport {
    drain_normalizations();

    if (options_.remove_duplicates) {
      for_each_node([this](TaskRef node, std::vector<TaskRef>& deps) {
        return remove_duplicates(node, deps);
      });
    }

    for_each_node([this](TaskRef node, std::vector<TaskRef>& deps) {
      return prune_invalid(node, deps);
    });

    for (const auto& node : fixed_) {
      if (node.is_subtask()) {
        ++report_.stats.subtasks_fixed;
      } else {
        ++report_.stats.tasks_fixed;
      }
    }
    report_.changed = report_.stats.total() > 0;
    return std::move(report_);
  }

private:
  // fn returns true when it altered the node's list
  template <typename Fn>
  auto for_each_node(Fn&& fn) -> void {
    for (auto& task : doc_.tasks) {
      auto task_ref = TaskRef::task(task.id);
      if (fn(task_ref, task.dependencies)) {
        fixed_.insert(task_ref);
      }
      for (auto& sub : task.subtasks) {
        auto sub_ref = TaskRef::subtask(task.id, sub.id);
        if (fn(sub_ref, sub.dependencies)) {
          fixed_.insert(sub_ref);
        }
      }
    }
  }

  auto drain_normalizations() -> void {
    for (auto& note : doc_.pending_normalizations) {
      auto reason = note.kind == NormalizationKind::Migrated
                        ? RepairReason::Migrated
                        : RepairReason::Malformed;
      if (reason == RepairReason::Migrated) {
        ++report_.stats.migrated;
      } else {
        ++report_.stats.malformed;
      }
      fixed_.insert(note.node);
      emit(RepairAction{.node = note.node,
                        .removed = note.ref,
                        .reason = reason,
                        .detail = std::move(note.detail)});
    }
    doc_.pending_normalizations.clear();
  }

  auto remove_duplicates(TaskRef node, std::vector<TaskRef>& deps) -> bool {
    std::unordered_set<TaskRef> seen;
    auto before = deps.size();
    std::erase_if(deps, [&](const TaskRef& dep) {
      if (seen.insert(dep).second) {
        return false;
      }
      ++report_.stats.duplicates;
      emit(RepairAction{.node = node,
                        .removed = dep,
                        .reason = RepairReason::Duplicate,
                        .detail = "duplicate dependency"});
      return true;
    });
    return deps.size() != before;
  }

  // Classifies against the live document, so edges removed earlier in this
  // pass are already gone when later edges are checked.
  auto prune_invalid(TaskRef node, std::vector<TaskRef>& deps) -> bool {
    bool altered = false;
    std::size_t i = 0;
    while (i < deps.size()) {
      auto dep = deps[i];
      auto verdict = GraphValidator::classify_edge(doc_, node, dep);
      if (verdict == Verdict::Valid) {
        ++i;
        continue;
      }

      deps.erase(deps.begin() + static_cast<std::ptrdiff_t>(i));
      altered = true;
      auto reason = reason_for(verdict);
      switch (reason) {
        case RepairReason::SelfLoop: ++report_.stats.self_loops; break;
        case RepairReason::Cyclic: ++report_.stats.cyclic; break;
        default: ++report_.stats.dangling; break;
      }
      emit(RepairAction{.node = node,
                        .removed = dep,
                        .reason = reason,
                        .detail = describe(reason, node, dep)});
    }
    return altered;
  }

  [[nodiscard]] static auto describe(RepairReason reason, TaskRef node,
                                     TaskRef dep) -> std::string {
    switch (reason) {
      case RepairReason::SelfLoop:
        return std::format("{} depends on itself", node);
      case RepairReason::Cyclic:
        return std::format("{} -> {} closes a dependency cycle", node, dep);
      default:
        return std::format("{} does not exist", dep);
    }
  }

  auto emit(RepairAction action) -> void {
    if (action.reason != RepairReason::Malformed &&
        action.reason != RepairReason::Migrated && action.removed) {
      log::warn("Removed dependency {} from {}: {}", *action.removed,
                action.node, action.detail);
    } else {
      log::warn("Normalized {}: {}", action.node, action.detail);
    }
    if (sink_) {
      sink_(action);
    }
    report_.actions.push_back(std::move(action));
  }

  Document& doc_;
  const RepairOptions& options_;
  const RepairSink& sink_;
  RepairReport report_;
  // Nodes counted once however many passes touched them
  std::unordered_set<TaskRef> fixed_;
};

}  // namespace

auto GraphRepair::repair(Document& doc, const RepairOptions& options,
                         const RepairSink& sink) -> RepairReport {
  auto report = RepairPass(doc, options, sink).run();
  if (report.changed) {
    log::info("Dependency repair: {} edge(s) removed, {} field(s) normalized",
              report.stats.edges_removed(),
              report.stats.malformed + report.stats.migrated);
  } else {
    log::debug("Dependency repair: no changes");
  }
  return report;
}

}  // namespace taskweave
