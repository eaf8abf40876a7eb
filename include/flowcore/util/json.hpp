#pragma once

#include "flowcore/core/error.hpp"

#include <glaze/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flowcore {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

[[nodiscard]] inline auto make_json_object() -> JsonValue {
  return JsonValue::object_t{};
}

[[nodiscard]] inline auto make_json_array() -> JsonValue {
  return std::vector<JsonValue>{};
}

namespace json {

// Dotted lookup ("steps.fetch.rows[0]"); nullptr when any segment is missing.
[[nodiscard]] auto find_path(const JsonValue &root, std::string_view path)
    -> const JsonValue *;

// Numbers are compared as double regardless of the integer/float storage.
[[nodiscard]] auto as_number(const JsonValue &value) -> std::optional<double>;

[[nodiscard]] auto truthy(const JsonValue &value) -> bool;

// Shallow merge; keys from `overlay` win. Non-object overlays are ignored.
auto merge_into(JsonValue &target, const JsonValue &overlay) -> void;

[[nodiscard]] auto stringify(const JsonValue &value) -> std::string;

} // namespace json

} // namespace flowcore
