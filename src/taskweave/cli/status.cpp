#include "taskweave/cli/commands.hpp"
#include "taskweave/cli/workspace.hpp"
#include "taskweave/graph/repair.hpp"
#include "taskweave/graph/status.hpp"

#include <print>

namespace taskweave::cli {

auto cmd_set_status(const EngineConfig& config, const SetStatusOptions& opts)
    -> int {
  auto refs = parse_ref_list(opts.ids);
  if (!refs) {
    return report("invalid id list '" + opts.ids + "'", refs.error());
  }
  auto status = parse<TaskStatus>(opts.status);
  if (!status) {
    return report("unknown status '" + opts.status + "'", status.error());
  }

  auto doc = load(config);
  if (!doc) {
    return report("failed to load " + config.document.path, doc.error());
  }

  bool changed = false;
  int failures = 0;
  auto results = set_status(*doc, *refs, *status);
  for (std::size_t i = 0; i < results.size(); ++i) {
    const auto& r = results[i];
    if (!r) {
      std::println(stderr, "Error: {}: {}", (*refs)[i], r.error().message());
      ++failures;
      continue;
    }
    changed = changed || r->changed();
    std::println("\u2713 {}: {} -> {}", r->node, to_string_view(r->previous),
                 to_string_view(r->current));
  }

  // Report decode normalizations and stale edges before they are saved
  auto repaired =
      GraphRepair::repair(*doc, config.repair_options(), print_sink());
  changed = changed || repaired.changed;

  if (int rc = commit(config, *doc, changed); rc != 0) {
    return rc;
  }
  return failures > 0 ? 1 : 0;
}

}  // namespace taskweave::cli
