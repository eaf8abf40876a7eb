#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/util/log.hpp"

#include <glaze/toml.hpp>

#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace flowcore::toml_util {

namespace detail {

inline auto report(std::string *diagnostic, std::string text) -> void {
  log::error("{}", text);
  if (diagnostic) {
    *diagnostic = std::move(text);
  }
}

} // namespace detail

// Decodes `text` into the raw mirror struct T. Unknown keys are ignored so
// that files written for newer builds still load. `source` names the input in
// diagnostics.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text, std::string_view source,
                              std::string *diagnostic = nullptr) -> Result<T> {
  T raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    detail::report(diagnostic, std::format("{}: {}", source,
                                           glz::format_error(ec, text)));
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

template <typename T>
[[nodiscard]] auto parse_toml_file(std::string_view path,
                                   std::string *diagnostic = nullptr)
    -> Result<T> {
  std::ifstream in(std::string(path), std::ios::binary);
  if (!in) {
    detail::report(diagnostic, std::format("cannot open {}", path));
    return fail(Error::FileNotFound);
  }
  const std::string text((std::istreambuf_iterator<char>(in)),
                         std::istreambuf_iterator<char>());
  return parse_toml<T>(text, path, diagnostic);
}

} // namespace flowcore::toml_util
