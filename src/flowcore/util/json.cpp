#include "flowcore/util/json.hpp"

#include <charconv>
#include <ranges>
#include <system_error>

namespace flowcore::json {

auto find_path(const JsonValue &root, std::string_view path)
    -> const JsonValue * {
  const JsonValue *cur = &root;
  if (!path.empty() && path.front() == '.') {
    path.remove_prefix(1);
  }

  for (auto part : path | std::views::split('.')) {
    std::string_view token(part.begin(), part.end());
    if (token.empty()) {
      continue;
    }
    auto bracket = token.find('[');
    std::string_view key = token.substr(0, bracket);

    if (!key.empty()) {
      if (!cur->is_object() || !cur->contains(key)) {
        return nullptr;
      }
      cur = &(*cur)[key];
    }

    while (bracket != std::string_view::npos) {
      auto close = token.find(']', bracket);
      if (close == std::string_view::npos) {
        return nullptr;
      }
      auto index_sv = token.substr(bracket + 1, close - bracket - 1);
      std::size_t index{};
      auto [p, ec] = std::from_chars(index_sv.data(),
                                     index_sv.data() + index_sv.size(), index);
      if (ec != std::errc{} || !cur->is_array() || index >= cur->size()) {
        return nullptr;
      }
      cur = &cur->get_array()[index];
      bracket = token.find('[', close + 1);
    }
  }
  return cur;
}

auto as_number(const JsonValue &value) -> std::optional<double> {
  if (!value.is_number()) {
    return std::nullopt;
  }
  const auto text = dump_json(value);
  double out{};
  auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  if (ec != std::errc{}) {
    return std::nullopt;
  }
  return out;
}

auto truthy(const JsonValue &value) -> bool {
  if (value.is_null()) {
    return false;
  }
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (auto n = as_number(value)) {
    return *n != 0.0;
  }
  if (value.is_string()) {
    return !value.get<std::string>().empty();
  }
  if (value.is_array() || value.is_object()) {
    return value.size() > 0;
  }
  return false;
}

auto merge_into(JsonValue &target, const JsonValue &overlay) -> void {
  if (!overlay.is_object()) {
    return;
  }
  if (!target.is_object()) {
    target = make_json_object();
  }
  auto &dst = target.get_object();
  for (const auto &[key, value] : overlay.get_object()) {
    dst.insert_or_assign(key, value);
  }
}

auto stringify(const JsonValue &value) -> std::string {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return dump_json(value);
}

} // namespace flowcore::json
