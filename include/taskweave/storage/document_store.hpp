#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/model/document.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace taskweave {

struct DecodeOptions {
  // Legacy reading of bare integers inside a subtask's dependency list as
  // sibling subtask ids. Off by default: a bare integer is a task id.
  bool sibling_shorthand{false};
  // Only bare integers below this bound are considered siblings.
  NodeId sibling_limit{100};
};

struct SaveOptions {
  // Copy the current file to <path>.bak before replacing it.
  bool backup{false};
};

// JSON shape of a task document. Task references are written as integers,
// subtask references as "parent.sub" strings. Unknown keys survive a
// decode/encode cycle.
class DocumentCodec {
public:
  [[nodiscard]] static auto decode(const nlohmann::json& root,
                                   const DecodeOptions& options = {})
      -> Result<Document>;
  [[nodiscard]] static auto encode(const Document& doc) -> nlohmann::json;

  [[nodiscard]] static auto load_from_string(std::string_view text,
                                             const DecodeOptions& options = {})
      -> Result<Document>;
  [[nodiscard]] static auto to_string(const Document& doc) -> std::string;
};

[[nodiscard]] auto load_document(const std::filesystem::path& path,
                                 const DecodeOptions& options = {})
    -> Result<Document>;

// Writes <path>.tmp and renames it over <path>, so readers never observe a
// partially written document.
[[nodiscard]] auto save_document(const std::filesystem::path& path,
                                 const Document& doc,
                                 const SaveOptions& options = {})
    -> Result<void>;

}  // namespace taskweave
