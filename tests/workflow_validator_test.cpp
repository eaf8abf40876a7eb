#include "flowcore/orchestrator/workflow_validator.hpp"

#include "test_utils.hpp"

#include <algorithm>

#include "gtest/gtest.h"

using namespace flowcore;
using namespace flowcore::test;

namespace {

[[nodiscard]] auto has_issue(const std::vector<ValidationIssue> &issues,
                             Error code, std::string_view step = {}) -> bool {
  return std::ranges::any_of(issues, [&](const ValidationIssue &i) {
    return i.code == code && (step.empty() || i.step == step);
  });
}

} // namespace

TEST(WorkflowValidatorTest, WellFormedGraphPasses) {
  auto graph = make_graph(
      "ok",
      {task_step("a"), task_step("b"),
       control_step("gate", ConditionStepConfig{.predicate = "x > 1",
                                                .true_path_steps = ids({"b"})})},
      {depend("gate", "a")});
  EXPECT_TRUE(collect_issues(graph).empty());
  EXPECT_TRUE(validate_workflow(graph).has_value());
}

TEST(WorkflowValidatorTest, DuplicateAndEmptyIds) {
  auto graph = make_graph("dup", {task_step("a"), task_step("a"), task_step("")});
  auto issues = collect_issues(graph);
  EXPECT_TRUE(has_issue(issues, Error::DuplicateId, "a"));
  EXPECT_TRUE(has_issue(issues, Error::InvalidArgument));

  auto res = validate_workflow(graph);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), make_error_code(Error::DuplicateId));
}

TEST(WorkflowValidatorTest, DanglingReferences) {
  auto graph = make_graph(
      "dangling",
      {task_step("a"),
       control_step("group", ParallelStepConfig{.child_step_ids = ids({"a", "ghost"})})},
      {depend("a", "phantom")});
  auto issues = collect_issues(graph);
  EXPECT_TRUE(has_issue(issues, Error::MissingReference, "group"));
  EXPECT_TRUE(has_issue(issues, Error::MissingReference, "a"));
}

TEST(WorkflowValidatorTest, CyclesAreDetected) {
  auto graph = make_graph("cycle", {task_step("a"), task_step("b"), task_step("c")},
                          {depend("b", "a"), depend("c", "b"), depend("a", "c")});
  auto res = validate_workflow(graph);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), make_error_code(Error::CycleDetected));

  auto self = make_graph("self", {task_step("a")}, {depend("a", "a")});
  EXPECT_TRUE(has_issue(collect_issues(self), Error::CycleDetected, "a"));
}

TEST(WorkflowValidatorTest, StepFieldRanges) {
  auto low = task_step("low");
  low.priority = 0;
  auto retries = task_step("retries");
  retries.lifecycle.max_retries = -1;
  auto started = task_step("started");
  started.lifecycle.status = NodeStatus::Running;
  auto untyped = task_step("untyped", "");

  auto issues = collect_issues(
      make_graph("ranges", {low, retries, started, untyped}));
  for (std::string_view id : {"low", "retries", "started", "untyped"}) {
    EXPECT_TRUE(has_issue(issues, Error::InvalidArgument, id)) << id;
  }
}

TEST(WorkflowValidatorTest, WorkflowFieldRanges) {
  auto graph = make_graph("wf", {task_step("a")});
  graph.workflow.max_parallel_steps = 0;
  graph.workflow.context = make_json_array();
  auto issues = collect_issues(graph);
  EXPECT_EQ(std::ranges::count_if(issues,
                                  [](const auto &i) { return i.step.empty(); }),
            2);
}

TEST(WorkflowValidatorTest, ConditionRules) {
  auto graph = make_graph(
      "cond",
      {task_step("a"),
       control_step("gate", ConditionStepConfig{.true_path_steps = ids({"a"}),
                                                .false_path_steps = ids({"a"})})});
  auto issues = collect_issues(graph);
  EXPECT_TRUE(has_issue(issues, Error::InvalidArgument, "gate"));
  EXPECT_GE(std::ranges::count_if(
                issues, [](const auto &i) { return i.step == "gate"; }),
            2);
}

TEST(WorkflowValidatorTest, LoopRules) {
  auto nested = make_graph(
      "loop",
      {task_step("body"), task_step("other"),
       control_step("wait", WaitStepConfig{.duration = Duration{10}}),
       control_step("loop", LoopStepConfig{.predicate = "x < 3",
                                           .body_step_ids = ids({"body", "wait"}),
                                           .max_iterations = 0})},
      {depend("body", "other")});
  auto issues = collect_issues(nested);
  EXPECT_GE(std::ranges::count_if(
                issues, [](const auto &i) { return i.step == "loop"; }),
            3);
}

TEST(WorkflowValidatorTest, WaitAndWebhookNeedConfiguration) {
  auto graph = make_graph("misc", {control_step("wait", WaitStepConfig{}),
                                   control_step("hook", WebhookStepConfig{})});
  auto issues = collect_issues(graph);
  EXPECT_TRUE(has_issue(issues, Error::InvalidArgument, "wait"));
  EXPECT_TRUE(has_issue(issues, Error::InvalidArgument, "hook"));
}

TEST(WorkflowValidatorTest, ConditionalEdgeNeedsExpression) {
  auto graph = make_graph("edge", {task_step("a"), task_step("b")},
                          {depend("b", "a", DependencyType::Conditional)});
  EXPECT_TRUE(has_issue(collect_issues(graph), Error::InvalidArgument, "b"));
}

TEST(WorkflowValidatorTest, ChildInTwoContainersIsRejected) {
  auto graph = make_graph(
      "shared",
      {task_step("a"),
       control_step("p1", ParallelStepConfig{.child_step_ids = ids({"a"})}),
       control_step("p2", SequentialStepConfig{.child_step_ids = ids({"a"})})});
  auto res = validate_workflow(graph);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), make_error_code(Error::InvalidArgument));
}
