#include "flowcore/model/workflow.hpp"

#include "flowcore/util/time.hpp"

#include <algorithm>

namespace flowcore {

auto ErrorInfo::to_json() const -> JsonValue {
  return JsonValue{{"type", std::string(to_string_view(kind))},
                   {"message", message},
                   {"at", util::format_iso8601(at)}};
}

auto WorkflowGraph::find_step(const StepId &id) const -> const WorkflowStep * {
  auto it = std::ranges::find(steps, id, &WorkflowStep::id);
  return it != steps.end() ? &*it : nullptr;
}

auto WorkflowGraph::find_step(const StepId &id) -> WorkflowStep * {
  auto it = std::ranges::find(steps, id, &WorkflowStep::id);
  return it != steps.end() ? &*it : nullptr;
}

} // namespace flowcore
