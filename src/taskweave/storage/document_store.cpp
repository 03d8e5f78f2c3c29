#include "taskweave/storage/document_store.hpp"

#include "taskweave/util/log.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <fstream>
#include <limits>
#include <optional>
#include <span>
#include <sstream>
#include <unordered_set>

namespace taskweave {

namespace {

using nlohmann::json;

constexpr std::string_view kTaskKeys[] = {
    "id",       "title",        "description", "details",  "testStrategy",
    "status",   "priority",     "dependencies", "subtasks",
};

constexpr std::string_view kSubtaskKeys[] = {
    "id", "title", "description", "details", "status", "dependencies",
};

[[nodiscard]] auto decode_id(const json& value) -> std::optional<NodeId> {
  if (value.is_number_integer()) {
    if (value.is_number_unsigned()) {
      auto v = value.get<std::uint64_t>();
      if (v == 0 || v > std::numeric_limits<NodeId>::max()) {
        return std::nullopt;
      }
      return static_cast<NodeId>(v);
    }
    auto v = value.get<std::int64_t>();
    if (v <= 0 || v > std::numeric_limits<NodeId>::max()) {
      return std::nullopt;
    }
    return static_cast<NodeId>(v);
  }
  if (value.is_string()) {
    if (auto id = parse_node_id(value.get_ref<const std::string&>())) {
      return *id;
    }
  }
  return std::nullopt;
}

[[nodiscard]] auto string_field(const json& obj, std::string_view key)
    -> std::string {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

[[nodiscard]] auto extra_fields(const json& obj,
                                std::span<const std::string_view> known)
    -> json {
  json extra = json::object();
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    if (std::ranges::find(known, std::string_view{it.key()}) == known.end()) {
      extra[it.key()] = it.value();
    }
  }
  return extra;
}

template <typename T>
[[nodiscard]] auto enum_field(const json& obj, std::string_view key,
                              T default_val) -> Result<T> {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return ok(default_val);
  }
  if (!it->is_string()) {
    return fail(Error::MalformedDocument);
  }
  return parse<T>(it->get_ref<const std::string&>());
}

[[nodiscard]] auto encode_ref(TaskRef ref) -> json {
  if (ref.is_subtask()) {
    return ref.str();
  }
  return ref.task_id();
}

[[nodiscard]] auto encode_refs(const std::vector<TaskRef>& refs) -> json {
  json out = json::array();
  for (auto ref : refs) {
    out.push_back(encode_ref(ref));
  }
  return out;
}

// A bare integer seen in a subtask's dependency list, kept for the sibling
// shorthand pass once every task is known.
struct BareEntry {
  std::size_t task_index;
  std::size_t subtask_index;
  std::size_t dep_index;
};

class Decoder {
public:
  explicit Decoder(const DecodeOptions& options) : options_(options) {}

  auto run(const json& root) -> Result<Document> {
    if (!root.is_object()) {
      log::error("Task document root must be an object");
      return fail(Error::MalformedDocument);
    }
    auto tasks = root.find("tasks");
    if (tasks == root.end() || !tasks->is_array()) {
      log::error("Task document has no tasks array");
      return fail(Error::MalformedDocument);
    }

    doc_.extra = root;
    doc_.extra.erase("tasks");
    doc_.tasks.reserve(tasks->size());

    std::unordered_set<NodeId> seen;
    for (const auto& entry : *tasks) {
      auto task = decode_task(entry);
      if (!task) {
        return fail(task.error());
      }
      if (!seen.insert(task->id).second) {
        log::error("Duplicate task id {}", task->id);
        return fail(Error::MalformedDocument);
      }
      doc_.tasks.push_back(std::move(*task));
    }

    if (options_.sibling_shorthand) {
      apply_sibling_shorthand();
    }
    return ok(std::move(doc_));
  }

private:
  auto decode_task(const json& entry) -> Result<Task> {
    if (!entry.is_object()) {
      log::error("Task entry is not an object");
      return fail(Error::MalformedDocument);
    }
    auto id = entry.contains("id") ? decode_id(entry["id"]) : std::nullopt;
    if (!id) {
      log::error("Task without a positive integer id");
      return fail(Error::MalformedDocument);
    }

    Task task;
    task.id = *id;
    task.title = string_field(entry, "title");
    task.description = string_field(entry, "description");
    task.details = string_field(entry, "details");
    task.test_strategy = string_field(entry, "testStrategy");

    auto status = enum_field(entry, "status", TaskStatus::Pending);
    if (!status) {
      log::error("Task {} has an unknown status", task.id);
      return fail(Error::MalformedDocument);
    }
    task.status = *status;

    auto priority = enum_field(entry, "priority", TaskPriority::Medium);
    if (!priority) {
      log::error("Task {} has an unknown priority", task.id);
      return fail(Error::MalformedDocument);
    }
    task.priority = *priority;

    task.dependencies =
        decode_dependencies(entry, TaskRef::task(task.id), std::nullopt);
    task.extra = extra_fields(entry, kTaskKeys);

    if (auto subtasks = entry.find("subtasks");
        subtasks != entry.end() && !subtasks->is_null()) {
      if (!subtasks->is_array()) {
        log::error("Task {} has a non-list subtasks field", task.id);
        return fail(Error::MalformedDocument);
      }
      std::unordered_set<NodeId> seen;
      for (const auto& sub_entry : *subtasks) {
        auto sub = decode_subtask(task.id, task.subtasks.size(), sub_entry);
        if (!sub) {
          return fail(sub.error());
        }
        if (!seen.insert(sub->id).second) {
          log::error("Duplicate subtask id {}.{}", task.id, sub->id);
          return fail(Error::MalformedDocument);
        }
        task.subtasks.push_back(std::move(*sub));
      }
    }
    return ok(std::move(task));
  }

  auto decode_subtask(NodeId parent, std::size_t index, const json& entry)
      -> Result<Subtask> {
    if (!entry.is_object()) {
      log::error("Subtask entry of task {} is not an object", parent);
      return fail(Error::MalformedDocument);
    }
    auto id = entry.contains("id") ? decode_id(entry["id"]) : std::nullopt;
    if (!id) {
      log::error("Subtask of task {} without a positive integer id", parent);
      return fail(Error::MalformedDocument);
    }

    Subtask sub;
    sub.id = *id;
    sub.title = string_field(entry, "title");
    sub.description = string_field(entry, "description");
    if (auto details = entry.find("details");
        details != entry.end() && details->is_string()) {
      sub.details = details->get<std::string>();
    }

    auto status = enum_field(entry, "status", TaskStatus::Pending);
    if (!status) {
      log::error("Subtask {}.{} has an unknown status", parent, sub.id);
      return fail(Error::MalformedDocument);
    }
    sub.status = *status;

    sub.dependencies =
        decode_dependencies(entry, TaskRef::subtask(parent, sub.id), index);
    sub.extra = extra_fields(entry, kSubtaskKeys);
    return ok(std::move(sub));
  }

  // subtask_index is set when decoding a subtask's list
  auto decode_dependencies(const json& entry, TaskRef node,
                           std::optional<std::size_t> subtask_index)
      -> std::vector<TaskRef> {
    std::vector<TaskRef> deps;
    auto field = entry.find("dependencies");
    if (field == entry.end() || field->is_null()) {
      return deps;
    }
    if (!field->is_array()) {
      note(node, std::nullopt, "dependencies was not a list, reset to []");
      return deps;
    }

    deps.reserve(field->size());
    for (const auto& dep : *field) {
      if (dep.is_number_integer()) {
        if (auto id = decode_id(dep)) {
          if (subtask_index) {
            bare_.push_back(BareEntry{
                .task_index = doc_.tasks.size(),
                .subtask_index = *subtask_index,
                .dep_index = deps.size(),
            });
          }
          deps.push_back(TaskRef::task(*id));
          continue;
        }
      } else if (dep.is_string()) {
        if (auto ref = TaskRef::parse(dep.get_ref<const std::string&>())) {
          deps.push_back(*ref);
          continue;
        }
      }
      note(node, std::nullopt,
           std::format("dropped unparseable dependency {}", dep.dump()));
    }
    return deps;
  }

  auto note(TaskRef node, std::optional<TaskRef> ref, std::string detail)
      -> void {
    log::warn("{}: {}", node, detail);
    doc_.pending_normalizations.push_back(Normalization{
        .node = node,
        .kind = NormalizationKind::Malformed,
        .ref = ref,
        .detail = std::move(detail),
    });
  }

  auto apply_sibling_shorthand() -> void {
    for (const auto& bare : bare_) {
      auto& task = doc_.tasks[bare.task_index];
      auto& sub = task.subtasks[bare.subtask_index];
      auto& dep = sub.dependencies[bare.dep_index];
      auto n = dep.task_id();
      if (n >= options_.sibling_limit || task.find_subtask(n) == nullptr) {
        continue;
      }

      auto node = TaskRef::subtask(task.id, sub.id);
      auto sibling = TaskRef::subtask(task.id, n);
      auto detail = std::format("bare {} read as sibling {}", n, sibling);
      log::warn("{}: {}", node, detail);
      dep = sibling;
      doc_.pending_normalizations.push_back(Normalization{
          .node = node,
          .kind = NormalizationKind::Migrated,
          .ref = std::nullopt,
          .detail = std::move(detail),
      });
    }
  }

  const DecodeOptions& options_;
  Document doc_;
  std::vector<BareEntry> bare_;
};

}  // namespace

auto DocumentCodec::decode(const nlohmann::json& root,
                           const DecodeOptions& options) -> Result<Document> {
  try {
    return Decoder(options).run(root);
  } catch (const json::exception& e) {
    log::error("Failed to decode task document: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto DocumentCodec::encode(const Document& doc) -> nlohmann::json {
  json root = doc.extra.is_object() ? doc.extra : json::object();
  json tasks = json::array();

  for (const auto& task : doc.tasks) {
    json t = task.extra.is_object() ? task.extra : json::object();
    t["id"] = task.id;
    t["title"] = task.title;
    t["description"] = task.description;
    t["details"] = task.details;
    t["testStrategy"] = task.test_strategy;
    t["status"] = std::string(to_string_view(task.status));
    t["priority"] = std::string(to_string_view(task.priority));
    t["dependencies"] = encode_refs(task.dependencies);

    json subtasks = json::array();
    for (const auto& sub : task.subtasks) {
      json s = sub.extra.is_object() ? sub.extra : json::object();
      s["id"] = sub.id;
      s["title"] = sub.title;
      s["description"] = sub.description;
      if (sub.details) {
        s["details"] = *sub.details;
      }
      s["status"] = std::string(to_string_view(sub.status));
      s["dependencies"] = encode_refs(sub.dependencies);
      subtasks.push_back(std::move(s));
    }
    t["subtasks"] = std::move(subtasks);
    tasks.push_back(std::move(t));
  }

  root["tasks"] = std::move(tasks);
  return root;
}

auto DocumentCodec::load_from_string(std::string_view text,
                                     const DecodeOptions& options)
    -> Result<Document> {
  auto root = json::parse(text, nullptr, false);
  if (root.is_discarded()) {
    log::error("Task document is not valid JSON");
    return fail(Error::ParseError);
  }
  return decode(root, options);
}

auto DocumentCodec::to_string(const Document& doc) -> std::string {
  return encode(doc).dump(2) + "\n";
}

auto load_document(const std::filesystem::path& path,
                   const DecodeOptions& options) -> Result<Document> {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    log::error("Task document not found: {}", path.string());
    return fail(Error::FileNotFound);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    log::error("Failed to open task document: {}", path.string());
    return fail(Error::FileOpenFailed);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto doc = DocumentCodec::load_from_string(buffer.str(), options);
  if (doc) {
    log::debug("Loaded {} task(s) from {}", doc->task_count(), path.string());
  }
  return doc;
}

auto save_document(const std::filesystem::path& path, const Document& doc,
                   const SaveOptions& options) -> Result<void> {
  std::string text;
  try {
    text = DocumentCodec::to_string(doc);
  } catch (const json::exception& e) {
    log::error("Failed to serialize task document: {}", e.what());
    return fail(Error::FileWriteFailed);
  }

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      log::error("Failed to create {}: {}", path.parent_path().string(),
                 ec.message());
      return fail(Error::FileWriteFailed);
    }
  }

  if (options.backup && std::filesystem::exists(path, ec)) {
    auto backup = path;
    backup += ".bak";
    std::filesystem::copy_file(
        path, backup, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
      log::error("Failed to write backup {}: {}", backup.string(),
                 ec.message());
      return fail(Error::FileWriteFailed);
    }
  }

  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream file(tmp, std::ios::trunc);
    if (!file.is_open()) {
      log::error("Failed to open file for writing: {}", tmp.string());
      return fail(Error::FileWriteFailed);
    }
    file << text;
    file.flush();
    if (!file) {
      log::error("Failed to write {}", tmp.string());
      file.close();
      std::filesystem::remove(tmp, ec);
      return fail(Error::FileWriteFailed);
    }
  }

  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    log::error("Failed to replace {}: {}", path.string(), ec.message());
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return fail(Error::FileWriteFailed);
  }

  log::debug("Saved {} task(s) to {}", doc.task_count(), path.string());
  return ok();
}

}  // namespace taskweave
