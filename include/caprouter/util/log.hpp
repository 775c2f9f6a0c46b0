#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace caprouter::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m", "\o{33}[33m", "\o{33}[31m"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> Level {
  const auto *it = std::ranges::find(level_names, name);
  return it != level_names.end()
             ? static_cast<Level>(std::distance(level_names.begin(), it))
             : Level::Info;
}

// Records are formatted on the calling thread and handed to a single writer
// thread through a bounded channel. When the channel is full the record is
// written inline on a TTY and dropped otherwise, so a stalled pipe never
// blocks the dispatch loop.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatch = 64;
  using Channel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

public:
  Logger() = default;
  ~Logger() {
    stop();
    close_file();
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    queue_ctx_.restart();
    auto channel =
        std::make_shared<Channel>(queue_ctx_.get_executor(), kQueueCapacity);
    channel_.store(channel, std::memory_order_release);
    writer_ = std::jthread([this, channel] { drain(channel); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    if (auto channel = channel_.exchange(nullptr, std::memory_order_acq_rel)) {
      channel->close();
    }
    queue_ctx_.stop();
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

  auto set_output_stderr() noexcept -> void {
    output_.store(stderr, std::memory_order_release);
  }

  // Only honoured before start(); the writer thread owns the stream after.
  auto set_output_file(std::string_view path) -> bool {
    if (running_.load(std::memory_order_acquire)) {
      return false;
    }
    if (path.empty()) {
      close_file();
      output_.store(stdout, std::memory_order_release);
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    close_file();
    file_ = f;
    output_.store(f, std::memory_order_release);
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
    auto record = format_record(level, std::format(fmt, std::forward<Args>(args)...));

    auto channel = channel_.load(std::memory_order_acquire);
    if (channel && channel->try_send(boost::system::error_code{}, record)) {
      return;
    }
    auto *out = stream();
    if (channel && !is_tty(out)) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    std::fwrite(record.data(), 1, record.size(), out);
    std::fflush(out);
  }

private:
  [[nodiscard]] static auto format_record(Level level, std::string message)
      -> std::string {
    const auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    std::string out;
    out.reserve(message.size() + 64);
    std::format_to(std::back_inserter(out),
                   "[{:%Y-%m-%d %H:%M:%S}] [{}{}\o{33}[0m] [{}] {}\n", now,
                   level_colors.at(std::to_underlying(level)),
                   level_name(level), tid, message);
    return out;
  }

  [[nodiscard]] static auto is_tty(FILE *out) noexcept -> bool {
    if (out == nullptr) {
      return false;
    }
    const int fd = ::fileno(out);
    return fd >= 0 && ::isatty(fd) != 0;
  }

  [[nodiscard]] auto stream() const noexcept -> FILE * {
    auto *out = output_.load(std::memory_order_acquire);
    return out != nullptr ? out : stdout;
  }

  auto close_file() -> void {
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
  }

  auto drain(std::shared_ptr<Channel> channel) -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatch);

    while (running_.load(std::memory_order_acquire)) {
      boost::system::error_code recv_ec;
      std::optional<std::string> first;
      channel->async_receive(
          [&](const boost::system::error_code &ec, std::string item) {
            recv_ec = ec;
            if (!ec) {
              first = std::move(item);
            }
          });
      queue_ctx_.restart();
      (void)queue_ctx_.run_one();
      if (recv_ec || !first) {
        if (recv_ec) {
          break;
        }
        continue;
      }

      batch.clear();
      batch.push_back(std::move(*first));
      while (batch.size() < kBatch &&
             channel->try_receive(
                 [&](const boost::system::error_code &ec, std::string item) {
                   if (!ec) {
                     batch.push_back(std::move(item));
                   }
                 })) {
      }
      write_batch(batch);
    }

    batch.clear();
    while (channel->try_receive(
        [&](const boost::system::error_code &ec, std::string item) {
          if (!ec) {
            batch.push_back(std::move(item));
          }
        })) {
    }
    write_batch(batch);
  }

  auto write_batch(const std::vector<std::string> &batch) -> void {
    if (batch.empty()) {
      return;
    }
    auto *out = stream();
    for (const auto &record : batch) {
      std::fwrite(record.data(), 1, record.size(), out);
    }
    std::fflush(out);
  }

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stdout};
  std::atomic<std::uint64_t> dropped_{0};
  FILE *file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<Channel>> channel_;
  std::jthread writer_;
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

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

} // namespace caprouter::log
