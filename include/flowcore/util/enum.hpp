#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace flowcore::util {

// "DeadlineExceeded" -> "deadline_exceeded"
[[nodiscard]] inline auto snake_case(std::string_view name) -> std::string {
  std::string out;
  out.reserve(name.size() + 4);
  for (std::size_t i = 0; i < name.size(); ++i) {
    const auto ch = static_cast<unsigned char>(name[i]);
    if (std::isupper(ch) != 0 && i > 0) {
      out.push_back('_');
    }
    out.push_back(static_cast<char>(std::tolower(ch)));
  }
  return out;
}

// Wire names of a described enum, in declaration order. Status strings in the
// audit trail and in workflow files use these names.
template <typename E>
[[nodiscard]] auto enum_table() -> const auto & {
  using descriptors = boost::describe::describe_enumerators<E>;
  constexpr std::size_t kCount = boost::mp11::mp_size<descriptors>::value;
  static const auto table = [] {
    std::array<std::pair<E, std::string>, kCount> out{};
    std::size_t i = 0;
    boost::mp11::mp_for_each<descriptors>([&](auto d) {
      out[i++] = {d.value, snake_case(d.name)};
    });
    return out;
  }();
  return table;
}

template <typename E>
[[nodiscard]] auto enum_name(E value) noexcept -> std::string_view {
  for (const auto &[v, name] : enum_table<E>()) {
    if (v == value) {
      return name;
    }
  }
  return "unknown";
}

// Exact match on the wire name.
template <typename E>
[[nodiscard]] auto try_parse_enum(std::string_view input) noexcept
    -> std::optional<E> {
  for (const auto &[v, name] : enum_table<E>()) {
    if (name == input) {
      return v;
    }
  }
  return std::nullopt;
}

// "low|standard|high", for diagnostics.
template <typename E> [[nodiscard]] auto enum_choices() -> std::string {
  std::string out;
  for (const auto &[v, name] : enum_table<E>()) {
    if (!out.empty()) {
      out.push_back('|');
    }
    out += name;
  }
  return out;
}

} // namespace flowcore::util

#define FLOWCORE_DEFINE_ENUM_SERDE(EnumType)                                   \
  [[nodiscard]] inline auto to_string_view(EnumType value) noexcept            \
      -> std::string_view {                                                    \
    return ::flowcore::util::enum_name(value);                                 \
  }
