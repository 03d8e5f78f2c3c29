#include "taskweave/cli/workspace.hpp"

#include "taskweave/storage/document_store.hpp"
#include "taskweave/util/log.hpp"

#include <print>

namespace taskweave::cli {

auto load(const EngineConfig& config) -> Result<Document> {
  return load_document(config.document.path, config.decode_options());
}

auto commit(const EngineConfig& config, const Document& doc, bool changed)
    -> int {
  if (!changed) {
    log::debug("No changes to write");
    return 0;
  }
  if (auto r = save_document(config.document.path, doc, config.save_options());
      !r) {
    return report("failed to save " + config.document.path, r.error());
  }
  return 0;
}

auto print_sink() -> RepairSink {
  return [](const RepairAction& action) {
    std::println("  [{}] {}: {}", to_string_view(action.reason), action.node,
                 action.detail);
  };
}

auto make_editor(const EngineConfig& config) -> TaskGraphEditor {
  return TaskGraphEditor(config.repair_options(), print_sink());
}

auto print_stats(const RepairStats& stats) -> void {
  std::println("Dependencies removed: {} (self-loops {}, dangling {}, "
               "cyclic {}, duplicates {})",
               stats.edges_removed(), stats.self_loops, stats.dangling,
               stats.cyclic, stats.duplicates);
  if (stats.malformed + stats.migrated > 0) {
    std::println("Fields normalized: {} (malformed {}, migrated {})",
                 stats.malformed + stats.migrated, stats.malformed,
                 stats.migrated);
  }
  std::println("Tasks fixed: {}, subtasks fixed: {}", stats.tasks_fixed,
               stats.subtasks_fixed);
}

auto report(std::string_view context, std::error_code ec) -> int {
  std::println(stderr, "Error: {}: {}", context, ec.message());
  return 1;
}

auto parse_optional_refs(std::string_view text)
    -> Result<std::vector<TaskRef>> {
  if (text.empty()) {
    return ok(std::vector<TaskRef>{});
  }
  return parse_ref_list(text);
}

auto join_refs(const std::vector<TaskRef>& refs) -> std::string {
  if (refs.empty()) {
    return "-";
  }
  std::string out;
  for (const auto& ref : refs) {
    if (!out.empty()) {
      out += ", ";
    }
    out += ref.str();
  }
  return out;
}

}  // namespace taskweave::cli
