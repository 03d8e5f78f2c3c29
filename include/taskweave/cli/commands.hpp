#pragma once

#include "taskweave/config/engine_config.hpp"

#include <string>

namespace taskweave::cli {

struct ListOptions {
  std::string status;
  bool with_subtasks{false};
};

struct DependencyOptions {
  std::string id;
  std::string depends_on;
};

struct SetStatusOptions {
  std::string ids;
  std::string status;
};

struct AddTaskOptions {
  std::string title;
  std::string description;
  std::string details;
  std::string test_strategy;
  std::string priority{"medium"};
  std::string status{"pending"};
  std::string dependencies;
};

struct AddSubtaskOptions {
  std::string parent;
  std::string task_id;  // convert an existing task instead of creating one
  std::string title;
  std::string description;
  std::string details;
  std::string status{"pending"};
  std::string dependencies;
};

struct ShowOptions {
  std::string id;
};

struct RemoveSubtaskOptions {
  std::string ids;  // one or more parent.sub addresses, comma separated
  bool convert{false};
};

struct ClearSubtasksOptions {
  std::string ids;
  bool all{false};
};

struct RemoveTaskOptions {
  std::string ids;
};

[[nodiscard]] auto cmd_list(const EngineConfig& config, const ListOptions& opts)
    -> int;
[[nodiscard]] auto cmd_show(const EngineConfig& config, const ShowOptions& opts)
    -> int;
[[nodiscard]] auto cmd_validate(const EngineConfig& config) -> int;
[[nodiscard]] auto cmd_fix(const EngineConfig& config) -> int;
[[nodiscard]] auto cmd_migrate(const EngineConfig& config) -> int;
[[nodiscard]] auto cmd_add_dependency(const EngineConfig& config,
                                      const DependencyOptions& opts) -> int;
[[nodiscard]] auto cmd_remove_dependency(const EngineConfig& config,
                                         const DependencyOptions& opts) -> int;
[[nodiscard]] auto cmd_set_status(const EngineConfig& config,
                                  const SetStatusOptions& opts) -> int;
[[nodiscard]] auto cmd_add_task(const EngineConfig& config,
                                const AddTaskOptions& opts) -> int;
[[nodiscard]] auto cmd_remove_task(const EngineConfig& config,
                                   const RemoveTaskOptions& opts) -> int;
[[nodiscard]] auto cmd_add_subtask(const EngineConfig& config,
                                   const AddSubtaskOptions& opts) -> int;
[[nodiscard]] auto cmd_remove_subtask(const EngineConfig& config,
                                      const RemoveSubtaskOptions& opts) -> int;
[[nodiscard]] auto cmd_clear_subtasks(const EngineConfig& config,
                                      const ClearSubtasksOptions& opts) -> int;

}  // namespace taskweave::cli
