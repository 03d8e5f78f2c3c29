#include "taskweave/graph/task_ref.hpp"

#include <charconv>
#include <format>
#include <limits>

namespace taskweave {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n";

[[nodiscard]] auto trim(std::string_view text) -> std::string_view {
  auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

}  // namespace

auto parse_node_id(std::string_view text) -> Result<NodeId> {
  if (text.empty()) {
    return fail(Error::ParseError);
  }
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return fail(Error::ParseError);
  }
  if (value == 0 || value > std::numeric_limits<NodeId>::max()) {
    return fail(Error::ParseError);
  }
  return ok(static_cast<NodeId>(value));
}

auto TaskRef::parse(std::string_view text) -> Result<TaskRef> {
  text = trim(text);
  if (text.empty()) {
    return fail(Error::ParseError);
  }

  auto dot = text.find('.');
  if (dot == std::string_view::npos) {
    auto id = parse_node_id(text);
    if (!id) {
      return fail(id.error());
    }
    return ok(TaskRef::task(*id));
  }

  auto rest = text.substr(dot + 1);
  if (rest.find('.') != std::string_view::npos) {
    return fail(Error::ParseError);
  }

  auto parent = parse_node_id(text.substr(0, dot));
  auto sub = parse_node_id(rest);
  if (!parent || !sub) {
    return fail(Error::ParseError);
  }
  return ok(TaskRef::subtask(*parent, *sub));
}

auto TaskRef::str() const -> std::string {
  if (is_subtask()) {
    return std::format("{}.{}", task_id(), subtask_id());
  }
  return std::format("{}", task_id());
}

auto parse_ref_list(std::string_view text) -> Result<std::vector<TaskRef>> {
  std::vector<TaskRef> refs;
  if (trim(text).empty()) {
    return fail(Error::ParseError);
  }

  std::size_t start = 0;
  while (start <= text.size()) {
    auto comma = text.find(',', start);
    auto piece = text.substr(start, comma == std::string_view::npos
                                        ? std::string_view::npos
                                        : comma - start);
    auto ref = TaskRef::parse(piece);
    if (!ref) {
      return fail(ref.error());
    }
    refs.push_back(*ref);
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }
  return ok(std::move(refs));
}

}  // namespace taskweave
