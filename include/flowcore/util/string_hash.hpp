#pragma once

#include <ankerl/unordered_dense.h>

#include <functional>
#include <string>
#include <string_view>

namespace flowcore {

// Transparent string hash so maps keyed by std::string accept string_view
// lookups without allocating.
struct StringHash {
  using is_transparent = void;

  [[nodiscard]] auto operator()(std::string_view sv) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(sv);
  }
};

using StringEqual = std::equal_to<>;

template <typename V>
using StringMap =
    ankerl::unordered_dense::map<std::string, V, StringHash, StringEqual>;

using StringSet =
    ankerl::unordered_dense::set<std::string, StringHash, StringEqual>;

} // namespace flowcore
