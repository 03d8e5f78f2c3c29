#include "taskweave/cli/commands.hpp"
#include "taskweave/cli/workspace.hpp"

#include <format>
#include <print>

namespace taskweave::cli {

namespace {

struct Edge {
  TaskRef from;
  TaskRef to;
};

auto parse_edge(const DependencyOptions& opts) -> Result<Edge> {
  auto from = TaskRef::parse(opts.id);
  if (!from) {
    std::println(stderr, "Error: invalid task id '{}'", opts.id);
    return fail(from.error());
  }
  auto to = TaskRef::parse(opts.depends_on);
  if (!to) {
    std::println(stderr, "Error: invalid dependency id '{}'", opts.depends_on);
    return fail(to.error());
  }
  return ok(Edge{.from = *from, .to = *to});
}

}  // namespace

auto cmd_add_dependency(const EngineConfig& config,
                        const DependencyOptions& opts) -> int {
  auto edge = parse_edge(opts);
  if (!edge) {
    return 1;
  }
  auto doc = load(config);
  if (!doc) {
    return report("failed to load " + config.document.path, doc.error());
  }

  auto editor = make_editor(config);
  auto added = editor.add_dependency(*doc, edge->from, edge->to);
  if (!added) {
    return report(std::format("cannot add dependency {} -> {}", edge->from,
                              edge->to),
                  added.error());
  }

  if (*added) {
    std::println("\u2713 {} now depends on {}", edge->from, edge->to);
  } else {
    std::println("{} already depends on {}", edge->from, edge->to);
  }
  return commit(config, *doc, *added || editor.last_repair().changed);
}

auto cmd_remove_dependency(const EngineConfig& config,
                           const DependencyOptions& opts) -> int {
  auto edge = parse_edge(opts);
  if (!edge) {
    return 1;
  }
  auto doc = load(config);
  if (!doc) {
    return report("failed to load " + config.document.path, doc.error());
  }

  auto editor = make_editor(config);
  auto removed = editor.remove_dependency(*doc, edge->from, edge->to);
  if (!removed) {
    return report(std::format("cannot remove dependency {} -> {}", edge->from,
                              edge->to),
                  removed.error());
  }

  if (*removed) {
    std::println("\u2713 {} no longer depends on {}", edge->from, edge->to);
  } else {
    std::println("{} does not depend on {}", edge->from, edge->to);
  }
  return commit(config, *doc, *removed || editor.last_repair().changed);
}

}  // namespace taskweave::cli
