#pragma once

#include "taskweave/graph/repair.hpp"
#include "taskweave/storage/document_store.hpp"

#include <string>

namespace taskweave {

struct DocumentConfig {
  std::string path{"tasks/tasks.json"};
  bool backup{false};
};

struct ReferenceConfig {
  bool sibling_shorthand{false};
  NodeId sibling_limit{100};
};

struct RepairConfig {
  bool remove_duplicates{true};
};

struct LogConfig {
  std::string level{"info"};
};

struct EngineConfig {
  DocumentConfig document;
  ReferenceConfig references;
  RepairConfig repair;
  LogConfig log;

  [[nodiscard]] auto decode_options() const -> DecodeOptions {
    return DecodeOptions{
        .sibling_shorthand = references.sibling_shorthand,
        .sibling_limit = references.sibling_limit,
    };
  }

  [[nodiscard]] auto save_options() const -> SaveOptions {
    return SaveOptions{.backup = document.backup};
  }

  [[nodiscard]] auto repair_options() const -> RepairOptions {
    return RepairOptions{.remove_duplicates = repair.remove_duplicates};
  }
};

}  // namespace taskweave
