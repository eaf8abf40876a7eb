#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace flowcore::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  constexpr std::array<std::string_view, 5> colors = {
      "\o{33}[90m", "\o{33}[36m", "\o{33}[32m", "\o{33}[33m", "\o{33}[31m"};
  return colors.at(std::to_underlying(level));
}

// Accepts the names used in [log] level and --log-level.
[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

namespace detail {

// Destination for finished lines. Owns the file handle when logging to a file.
struct Sink {
  std::mutex mu;
  FILE *out{stderr};
  FILE *owned{nullptr};
  bool tty{false};

  auto write(std::string_view line) -> void {
    std::fwrite(line.data(), 1, line.size(), out);
  }

  auto reset(FILE *target, FILE *to_own) -> void {
    if (owned != nullptr && owned != to_own) {
      std::fclose(owned);
    }
    out = target;
    owned = to_own;
    tty = ::isatty(::fileno(target)) != 0;
  }

  ~Sink() {
    if (owned != nullptr) {
      std::fclose(owned);
    }
  }
};

} // namespace detail

// Scheduler threads format a line and push it onto a bounded channel; one
// writer thread flushes lines in batches. Before start() and after stop()
// lines are written synchronously.
class Logger {
  static constexpr std::size_t kCapacity = 4096;
  static constexpr std::size_t kBatch = 128;

  using Channel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};
  detail::Sink sink_;
  boost::asio::io_context writer_ctx_{1};
  std::atomic<std::shared_ptr<Channel>> channel_;
  std::jthread writer_;

  // Moves up to `limit` queued lines into `batch` without blocking.
  static auto drain(Channel &channel, std::vector<std::string> &batch,
                    std::size_t limit) -> void {
    while (batch.size() < limit &&
           channel.try_receive(
               [&](const boost::system::error_code &ec, std::string line) {
                 if (!ec) {
                   batch.push_back(std::move(line));
                 }
               })) {
    }
  }

  auto flush(const std::vector<std::string> &batch) -> void {
    if (batch.empty()) {
      return;
    }
    std::scoped_lock lock(sink_.mu);
    for (const auto &line : batch) {
      sink_.write(line);
    }
    std::fflush(sink_.out);
  }

  auto run_writer(const std::shared_ptr<Channel> &channel) -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatch);
    bool closed = false;
    while (!closed) {
      batch.clear();
      // Block for the first line, then take whatever else is already queued.
      channel->async_receive(
          [&](const boost::system::error_code &ec, std::string line) {
            if (ec) {
              closed = true;
              return;
            }
            batch.push_back(std::move(line));
          });
      writer_ctx_.restart();
      writer_ctx_.run_one();
      drain(*channel, batch, kBatch);
      flush(batch);
    }
    batch.clear();
    drain(*channel, batch, static_cast<std::size_t>(-1));
    flush(batch);
  }

  template <typename... Args>
  [[nodiscard]] auto render(Level level, bool tty,
                            std::format_string<Args...> fmt,
                            Args &&...args) const -> std::string {
    const auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    // [2026-01-02 03:04:05.678] [warn] [123456] message
    auto line =
        tty ? std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}\o{33}[0m] [{}] ", now,
                          level_color(level), level_name(level), tid)
            : std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] ", now,
                          level_name(level), tid);
    std::format_to(std::back_inserter(line), fmt, std::forward<Args>(args)...);
    line.push_back('\n');
    return line;
  }

  auto write_now(std::string_view line) -> void {
    std::scoped_lock lock(sink_.mu);
    sink_.write(line);
    std::fflush(sink_.out);
  }

public:
  Logger() { sink_.reset(stderr, nullptr); }
  ~Logger() { stop(); }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    auto channel =
        std::make_shared<Channel>(writer_ctx_.get_executor(), kCapacity);
    channel_.store(channel, std::memory_order_release);
    writer_ = std::jthread([this, channel] { run_writer(channel); });
  }

  // Closes the channel and waits for the writer to flush every queued line.
  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    if (auto channel = channel_.exchange(nullptr, std::memory_order_acq_rel)) {
      channel->close();
    }
    if (writer_.joinable()) {
      writer_.join();
    }
    if (const auto lost = dropped_.exchange(0); lost > 0) {
      write_now(std::format("log: {} lines dropped while the queue was full\n",
                            lost));
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() -> void {
    std::scoped_lock lock(sink_.mu);
    sink_.reset(stderr, nullptr);
  }

  // Appends to `path`; an empty path goes back to stderr.
  auto set_output_file(std::string_view path) -> bool {
    if (path.empty()) {
      set_output_stderr();
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    std::scoped_lock lock(sink_.mu);
    sink_.reset(f, f);
    return true;
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }
    bool tty = false;
    {
      std::scoped_lock lock(sink_.mu);
      tty = sink_.tty;
    }
    auto line = render(level, tty, fmt, std::forward<Args>(args)...);
    auto channel = channel_.load(std::memory_order_acquire);
    if (!channel) {
      write_now(line);
      return;
    }
    // A full queue drops the line instead of stalling the caller.
    if (!channel->try_send(boost::system::error_code{}, std::move(line))) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
  }
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace flowcore::log
