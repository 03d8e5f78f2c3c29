#pragma once

#include "taskweave/core/lockfree_queue.hpp"

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace taskweave::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info",
                                        "warn",  "error", "off"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m",  // error: red
      "",
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace") return Level::Trace;
  if (name == "debug") return Level::Debug;
  if (name == "warn") return Level::Warn;
  if (name == "error") return Level::Error;
  if (name == "off") return Level::Off;
  return Level::Info;
}

// Thread-local buffer to reduce allocation
struct alignas(64) ThreadBuffer {
  std::string buffer;
  ThreadBuffer() {
    buffer.reserve(1024);
  }
};

inline thread_local ThreadBuffer t_buffer;

// Async logger writing to stderr; stdout belongs to command output.
// Before start() (and after stop()) messages are written synchronously.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 4096;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  // Producers between their accepting_ check and their push
  std::atomic<std::size_t> in_flight_{0};
  bool color_{::isatty(STDERR_FILENO) != 0};
  BoundedMPSCQueue<std::string> queue_{QUEUE_CAPACITY};
  std::thread writer_;

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(64);

    while (running_.load(std::memory_order_acquire)) {
      batch.clear();
      while (batch.size() < 64) {
        if (auto msg = queue_.try_pop()) {
          batch.push_back(std::move(*msg));
        } else {
          break;
        }
      }

      for (const auto& msg : batch) {
        std::fputs(msg.c_str(), stderr);
      }
      if (batch.empty()) {
        std::this_thread::sleep_for(std::chrono::microseconds(200));
      } else {
        std::fflush(stderr);
      }
    }

    // stop() waited for in-flight producers, so the queue only shrinks
    while (auto msg = queue_.try_pop()) {
      std::fputs(msg->c_str(), stderr);
    }
    std::fflush(stderr);
  }

  auto format_line(std::string& buf, Level level, std::string_view text) const
      -> void {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    if (color_) {
      std::format_to(std::back_inserter(buf),
                     "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                     level_color(level), level_name(level), "\033[0m", tid,
                     text);
    } else {
      std::format_to(std::back_inserter(buf),
                     "[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", time,
                     level_name(level), tid, text);
    }
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_seq_cst);
    while (in_flight_.load(std::memory_order_seq_cst) != 0) {
      std::this_thread::yield();
    }

    if (!running_.exchange(false))
      return;

    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_color(bool enabled) noexcept -> void {
    color_ = enabled;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto& buf = t_buffer.buffer;
    buf.clear();
    format_line(buf, level, std::format(fmt, std::forward<Args>(args)...));

    in_flight_.fetch_add(1, std::memory_order_seq_cst);
    bool queued = accepting_.load(std::memory_order_seq_cst) &&
                  queue_.push(std::string(buf));
    in_flight_.fetch_sub(1, std::memory_order_release);

    if (!queued) {
      std::fputs(buf.c_str(), stderr);
      std::fflush(stderr);
    }
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace taskweave::log
