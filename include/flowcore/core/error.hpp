#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace flowcore {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  ParseError,
  InvalidArgument,
  NotFound,
  DuplicateId,
  MissingReference,
  CycleDetected,
  RunnerFailed,
  RunnerNotFound,
  Timeout,
  DeadlineExceeded,
  ResourceExhausted,
  Conflict,
  InvalidState,
  Cancelled,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 17> messages = {
      "success",
      "file not found",
      "parse error",
      "invalid argument",
      "not found",
      "duplicate id",
      "missing referenced step",
      "cycle detected in dependency graph",
      "task runner failed",
      "no task runner registered for type",
      "timeout",
      "deadline exceeded",
      "resource exhausted",
      "stale state transition",
      "invalid state transition",
      "cancelled",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "flowcore";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

// Graph-shape errors rejected at creation time; they never reach execution.
[[nodiscard]] inline auto is_validation_error(std::error_code ec) noexcept
    -> bool {
  return ec == make_error_code(Error::InvalidArgument) ||
         ec == make_error_code(Error::DuplicateId) ||
         ec == make_error_code(Error::MissingReference) ||
         ec == make_error_code(Error::CycleDetected);
}

} // namespace flowcore

template <> struct std::is_error_code_enum<flowcore::Error> : std::true_type {};
