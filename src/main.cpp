#include "taskweave/cli/commands.hpp"
#include "taskweave/config/config.hpp"
#include "taskweave/util/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr std::string_view kDefaultConfigFile = ".taskweave.yaml";

void print_usage(const char* prog) {
  std::println("taskweave - task dependency graph maintenance");
  std::println("Usage: {} [OPTIONS] <command> [COMMAND OPTIONS]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (default: {} if present)",
               kDefaultConfigFile);
  std::println("  -f, --file <file>     Task document (default: tasks/tasks.json)");
  std::println("  --log-level <level>   trace|debug|info|warn|error|off");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Commands:");
  std::println("  list [--status S] [--with-subtasks]");
  std::println("  show <id> | show --id <id>");
  std::println("  validate");
  std::println("  fix");
  std::println("  migrate");
  std::println("  add-dependency --id A --depends-on B");
  std::println("  remove-dependency --id A --depends-on B");
  std::println("  set-status --id 1,2.3 --status done");
  std::println("  add-task --title T [--description D] [--details D]");
  std::println("           [--test-strategy S] [--priority P] [--status S]");
  std::println("           [--dependencies 1,2.3]");
  std::println("  add-subtask --parent P (--task-id T | --title T");
  std::println("              [--description D] [--details D] [--status S]");
  std::println("              [--dependencies 1,2.3])");
  std::println("  remove-subtask --id P.S[,P.S...] [--convert]");
  std::println("  clear-subtasks (--id 1,2 | --all)");
  std::println("  remove-task --id 1,2.3");
}

void print_version() {
  std::println("taskweave v0.1.0");
}

struct Options {
  std::string config_file;
  std::string tasks_file;
  std::string log_level;
  std::string command;
  std::vector<std::string_view> args;
};

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  int i = 1;
  for (; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      if (++i >= argc) {
        std::println(stderr, "Error: --config requires an argument");
        std::exit(1);
      }
      opts.config_file = argv[i];
    } else if (arg == "-f" || arg == "--file") {
      if (++i >= argc) {
        std::println(stderr, "Error: --file requires an argument");
        std::exit(1);
      }
      opts.tasks_file = argv[i];
    } else if (arg == "--log-level") {
      if (++i >= argc) {
        std::println(stderr, "Error: --log-level requires an argument");
        std::exit(1);
      }
      opts.log_level = argv[i];
    } else if (arg.starts_with("-")) {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    } else {
      opts.command = arg;
      ++i;
      break;
    }
  }

  for (; i < argc; ++i) {
    opts.args.emplace_back(argv[i]);
  }

  if (opts.command.empty()) {
    print_usage(argv[0]);
    std::exit(1);
  }
  return opts;
}

// Walks a command's own flags. Exits on unknown flags or missing values.
class ArgReader {
public:
  ArgReader(std::string_view command, const std::vector<std::string_view>& args)
      : command_(command), args_(args) {}

  auto next() -> bool {
    if (++pos_ >= args_.size()) {
      return false;
    }
    current_ = args_[pos_];
    return true;
  }

  [[nodiscard]] auto is(std::string_view flag) const -> bool {
    return current_ == flag;
  }

  [[nodiscard]] auto is_flag() const -> bool {
    return current_.starts_with("-");
  }

  [[nodiscard]] auto current() const -> std::string {
    return std::string(current_);
  }

  auto value() -> std::string {
    if (pos_ + 1 >= args_.size()) {
      std::println(stderr, "Error: {} requires an argument", current_);
      std::exit(1);
    }
    return std::string(args_[++pos_]);
  }

  [[noreturn]] auto unknown() const -> void {
    std::println(stderr, "Unknown option for {}: {}", command_, current_);
    std::exit(1);
  }

private:
  std::string_view command_;
  const std::vector<std::string_view>& args_;
  std::size_t pos_{static_cast<std::size_t>(-1)};
  std::string_view current_;
};

auto require(std::string_view command, std::string_view flag,
             const std::string& value) -> void {
  if (value.empty()) {
    std::println(stderr, "Error: {} requires {}", command, flag);
    std::exit(1);
  }
}

auto load_config(const Options& opts) -> taskweave::EngineConfig {
  taskweave::EngineConfig config;

  std::string path = opts.config_file;
  if (path.empty() && std::filesystem::exists(kDefaultConfigFile)) {
    path = kDefaultConfigFile;
  }
  if (!path.empty()) {
    auto result = taskweave::ConfigLoader::load_from_file(path);
    if (!result) {
      std::println(stderr, "Error: Failed to load config {}: {}", path,
                   result.error().message());
      std::exit(1);
    }
    config = std::move(*result);
  }

  if (!opts.tasks_file.empty()) {
    config.document.path = opts.tasks_file;
  }
  if (!opts.log_level.empty()) {
    config.log.level = opts.log_level;
  }
  return config;
}

auto run_command(const Options& opts, const taskweave::EngineConfig& config)
    -> int {
  namespace cli = taskweave::cli;
  const auto& cmd = opts.command;
  ArgReader args(cmd, opts.args);

  if (cmd == "list") {
    cli::ListOptions o;
    while (args.next()) {
      if (args.is("--status") || args.is("-s")) {
        o.status = args.value();
      } else if (args.is("--with-subtasks")) {
        o.with_subtasks = true;
      } else {
        args.unknown();
      }
    }
    return cli::cmd_list(config, o);
  }

  if (cmd == "show") {
    cli::ShowOptions o;
    while (args.next()) {
      if (args.is("--id") || args.is("-i")) {
        o.id = args.value();
      } else if (!args.is_flag() && o.id.empty()) {
        o.id = args.current();
      } else {
        args.unknown();
      }
    }
    require(cmd, "an id", o.id);
    return cli::cmd_show(config, o);
  }

  if (cmd == "validate" || cmd == "fix" || cmd == "migrate") {
    while (args.next()) {
      args.unknown();
    }
    if (cmd == "validate") return cli::cmd_validate(config);
    if (cmd == "fix") return cli::cmd_fix(config);
    return cli::cmd_migrate(config);
  }

  if (cmd == "add-dependency" || cmd == "remove-dependency") {
    cli::DependencyOptions o;
    while (args.next()) {
      if (args.is("--id") || args.is("-i")) {
        o.id = args.value();
      } else if (args.is("--depends-on") || args.is("-d")) {
        o.depends_on = args.value();
      } else {
        args.unknown();
      }
    }
    require(cmd, "--id", o.id);
    require(cmd, "--depends-on", o.depends_on);
    return cmd == "add-dependency" ? cli::cmd_add_dependency(config, o)
                                   : cli::cmd_remove_dependency(config, o);
  }

  if (cmd == "set-status") {
    cli::SetStatusOptions o;
    while (args.next()) {
      if (args.is("--id") || args.is("-i")) {
        o.ids = args.value();
      } else if (args.is("--status") || args.is("-s")) {
        o.status = args.value();
      } else {
        args.unknown();
      }
    }
    require(cmd, "--id", o.ids);
    require(cmd, "--status", o.status);
    return cli::cmd_set_status(config, o);
  }

  if (cmd == "add-task") {
    cli::AddTaskOptions o;
    while (args.next()) {
      if (args.is("--title") || args.is("-t")) {
        o.title = args.value();
      } else if (args.is("--description")) {
        o.description = args.value();
      } else if (args.is("--details")) {
        o.details = args.value();
      } else if (args.is("--test-strategy")) {
        o.test_strategy = args.value();
      } else if (args.is("--priority") || args.is("-p")) {
        o.priority = args.value();
      } else if (args.is("--status") || args.is("-s")) {
        o.status = args.value();
      } else if (args.is("--dependencies")) {
        o.dependencies = args.value();
      } else {
        args.unknown();
      }
    }
    return cli::cmd_add_task(config, o);
  }

  if (cmd == "add-subtask") {
    cli::AddSubtaskOptions o;
    while (args.next()) {
      if (args.is("--parent") || args.is("-p")) {
        o.parent = args.value();
      } else if (args.is("--task-id")) {
        o.task_id = args.value();
      } else if (args.is("--title") || args.is("-t")) {
        o.title = args.value();
      } else if (args.is("--description")) {
        o.description = args.value();
      } else if (args.is("--details")) {
        o.details = args.value();
      } else if (args.is("--status") || args.is("-s")) {
        o.status = args.value();
      } else if (args.is("--dependencies")) {
        o.dependencies = args.value();
      } else {
        args.unknown();
      }
    }
    require(cmd, "--parent", o.parent);
    return cli::cmd_add_subtask(config, o);
  }

  if (cmd == "remove-subtask") {
    cli::RemoveSubtaskOptions o;
    while (args.next()) {
      if (args.is("--id") || args.is("-i")) {
        o.ids = args.value();
      } else if (args.is("--convert") || args.is("-c")) {
        o.convert = true;
      } else {
        args.unknown();
      }
    }
    require(cmd, "--id", o.ids);
    return cli::cmd_remove_subtask(config, o);
  }

  if (cmd == "clear-subtasks") {
    cli::ClearSubtasksOptions o;
    while (args.next()) {
      if (args.is("--id") || args.is("-i")) {
        o.ids = args.value();
      } else if (args.is("--all")) {
        o.all = true;
      } else {
        args.unknown();
      }
    }
    return cli::cmd_clear_subtasks(config, o);
  }

  if (cmd == "remove-task") {
    cli::RemoveTaskOptions o;
    while (args.next()) {
      if (args.is("--id") || args.is("-i")) {
        o.ids = args.value();
      } else {
        args.unknown();
      }
    }
    require(cmd, "--id", o.ids);
    return cli::cmd_remove_task(config, o);
  }

  std::println(stderr, "Unknown command: {}", cmd);
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);
  auto config = load_config(opts);

  taskweave::log::set_level(config.log.level);
  taskweave::log::start();

  int rc = run_command(opts, config);

  taskweave::log::stop();
  return rc;
}
