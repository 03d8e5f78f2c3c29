#pragma once

#include "taskweave/config/engine_config.hpp"
#include "taskweave/core/error.hpp"
#include "taskweave/graph/editor.hpp"
#include "taskweave/graph/repair.hpp"
#include "taskweave/model/document.hpp"

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace taskweave::cli {

// Shared plumbing for commands: load the configured document, edit it, and
// write it back only when something changed.
[[nodiscard]] auto load(const EngineConfig& config) -> Result<Document>;
[[nodiscard]] auto commit(const EngineConfig& config, const Document& doc,
                          bool changed) -> int;

// Repair sink printing each action to stdout.
[[nodiscard]] auto print_sink() -> RepairSink;
[[nodiscard]] auto make_editor(const EngineConfig& config) -> TaskGraphEditor;

auto print_stats(const RepairStats& stats) -> void;

// Prints "Error: <context>: <message>" and returns the failure exit code.
auto report(std::string_view context, std::error_code ec) -> int;

// Empty text is an empty list; otherwise a comma separated batch.
[[nodiscard]] auto parse_optional_refs(std::string_view text)
    -> Result<std::vector<TaskRef>>;

[[nodiscard]] auto join_refs(const std::vector<TaskRef>& refs) -> std::string;

}  // namespace taskweave::cli
