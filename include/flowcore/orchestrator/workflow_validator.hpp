#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/model/workflow.hpp"

#include <string>
#include <vector>

namespace flowcore {

struct ValidationIssue {
  Error code{Error::InvalidArgument};
  StepId step; // empty for workflow-level issues
  std::string message;
};

// Every structural problem of `graph`, in discovery order.
[[nodiscard]] auto collect_issues(const WorkflowGraph &graph)
    -> std::vector<ValidationIssue>;

// Fails with the code of the first issue; each issue is logged.
[[nodiscard]] auto validate_workflow(const WorkflowGraph &graph)
    -> Result<void>;

} // namespace flowcore
