#include "flowcore/orchestrator/workflow_orchestrator.hpp"
#include "flowcore/storage/memory_graph_store.hpp"

#include "test_utils.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace flowcore;
using namespace flowcore::test;
using namespace std::chrono_literals;

class StandaloneTaskTest : public ::testing::Test {
protected:
  void SetUp() override {
    registry_.add("scripted", runner_);
    orchestrator_ = std::make_unique<WorkflowOrchestrator>(
        io_, store_, registry_,
        OrchestratorOptions{
            .tick_interval = 10ms,
            .budget = ResourceBudget{.cpu_cores = 1.0, .memory_mb = 1024},
            .retry = RetryManager::Policy{.base_delay = 5ms,
                                          .max_delay = 50ms}});
  }

  void TearDown() override {
    orchestrator_->stop();
    drive_for(io_, 20ms);
  }

  static auto make_task(std::string_view id, int max_retries = 0) -> Task {
    Task task{.id = TaskId{id}, .name = std::string(id), .task_type = "scripted"};
    task.lifecycle.max_retries = max_retries;
    return task;
  }

  auto submit(Task task) -> TaskId {
    auto id = orchestrator_->submit_task(std::move(task));
    EXPECT_TRUE(id.has_value()) << id.error().message();
    return id.value_or(TaskId{});
  }

  auto depend(std::string_view task, std::string_view on,
              DependencyType type = DependencyType::Completion,
              bool optional = false, std::string condition = {})
      -> Result<void> {
    return orchestrator_->add_task_dependency(
        TaskDependency{.task_id = TaskId{task},
                       .depends_on = TaskId{on},
                       .type = type,
                       .condition_expression = std::move(condition),
                       .optional = optional});
  }

  auto task_status(std::string_view id) const -> NodeStatus {
    auto task = orchestrator_->get_task_status(TaskId{id});
    return task ? task->lifecycle.status : NodeStatus::Pending;
  }

  auto wait_status(std::string_view id, NodeStatus status,
                   std::chrono::milliseconds timeout = 5s) -> bool {
    return drive_until(io_, [&] { return task_status(id) == status; },
                       timeout);
  }

  auto wait_terminal(std::string_view id,
                     std::chrono::milliseconds timeout = 5s) -> bool {
    return drive_until(io_, [&] { return is_terminal(task_status(id)); },
                       timeout);
  }

  boost::asio::io_context io_;
  MemoryGraphStore store_;
  std::shared_ptr<ScriptedRunner> runner_ = std::make_shared<ScriptedRunner>();
  RunnerRegistry registry_;
  std::unique_ptr<WorkflowOrchestrator> orchestrator_;
};

TEST_F(StandaloneTaskTest, SubmittedTaskRunsToCompletion) {
  auto task = make_task("");
  task.input_data = json_of(R"({"table": "orders"})");
  auto id = submit(std::move(task));
  ASSERT_FALSE(id.empty());
  ASSERT_TRUE(wait_terminal(id.value()));

  auto stored = orchestrator_->get_task_status(id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->lifecycle.status, NodeStatus::Completed);
  EXPECT_TRUE(stored->lifecycle.started_at && stored->lifecycle.completed_at);
  EXPECT_FALSE(stored->workflow_id.has_value());

  const auto calls = runner_->calls();
  ASSERT_EQ(calls.size(), 1);
  EXPECT_EQ(calls[0].ctx.step_id, id.value());
  EXPECT_TRUE(calls[0].ctx.workflow_id.empty());
  const auto *table = json::find_path(calls[0].input, "table");
  ASSERT_NE(table, nullptr);
  EXPECT_EQ(json::stringify(*table), "orders");
}

TEST_F(StandaloneTaskTest, DependencyChainRunsInOrderAndPassesOutputs) {
  runner_->script("extract", Script{.delay = 30ms,
                                    .output = [](const RunContext &,
                                                 const JsonValue &) {
                                      return json_of(R"({"rows": 3})");
                                    }});
  submit(make_task("extract"));
  submit(make_task("load"));
  submit(make_task("report"));
  ASSERT_TRUE(depend("load", "extract", DependencyType::Data));
  ASSERT_TRUE(depend("report", "load", DependencyType::Conditional, false,
                     "upstream.attempt >= 1"));
  ASSERT_TRUE(wait_terminal("report"));

  EXPECT_EQ(task_status("extract"), NodeStatus::Completed);
  EXPECT_EQ(task_status("load"), NodeStatus::Completed);
  EXPECT_EQ(task_status("report"), NodeStatus::Completed);
  EXPECT_EQ(runner_->order(),
            (std::vector<std::string>{"extract", "load", "report"}));

  const auto calls = runner_->calls();
  const auto *rows = json::find_path(calls[1].input, "upstream.extract.rows");
  ASSERT_NE(rows, nullptr);
  EXPECT_EQ(json::as_number(*rows), 3.0);

  auto deps = store_.task_dependencies(TaskId{"load"});
  ASSERT_EQ(deps.size(), 1);
  EXPECT_EQ(deps[0].depends_on, TaskId{"extract"});
}

TEST_F(StandaloneTaskTest, FailedUpstreamCancelsDependent) {
  runner_->script("a", Script{.fail_first = 1});
  submit(make_task("a"));
  submit(make_task("b"));
  ASSERT_TRUE(depend("b", "a"));
  ASSERT_TRUE(wait_terminal("b"));

  EXPECT_EQ(task_status("a"), NodeStatus::Failed);
  auto b = orchestrator_->get_task_status(TaskId{"b"});
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(b->lifecycle.status, NodeStatus::Cancelled);
  ASSERT_TRUE(b->lifecycle.error_info.has_value());
  EXPECT_EQ(b->lifecycle.error_info->kind, ErrorKind::UpstreamFailed);
  EXPECT_EQ(runner_->call_count("b"), 0);
}

TEST_F(StandaloneTaskTest, OptionalDependencyToleratesFailure) {
  runner_->script("a", Script{.fail_first = 1});
  submit(make_task("a"));
  submit(make_task("b"));
  ASSERT_TRUE(depend("b", "a", DependencyType::Completion, true));
  ASSERT_TRUE(wait_terminal("b"));
  EXPECT_EQ(task_status("a"), NodeStatus::Failed);
  EXPECT_EQ(task_status("b"), NodeStatus::Completed);
}

TEST_F(StandaloneTaskTest, FailedTaskRetriesWithinBudget) {
  runner_->script("flaky", Script{.fail_first = 1});
  submit(make_task("flaky", 1));
  ASSERT_TRUE(wait_terminal("flaky"));

  auto task = orchestrator_->get_task_status(TaskId{"flaky"});
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->lifecycle.status, NodeStatus::Completed);
  EXPECT_EQ(task->lifecycle.retry_count, 1);
  EXPECT_EQ(runner_->call_count("flaky"), 2);
}

TEST_F(StandaloneTaskTest, HangingTaskTimesOut) {
  runner_->script("slow", Script{.hang_first = 1});
  auto slow = make_task("slow");
  slow.lifecycle.timeout = 50ms;
  submit(std::move(slow));
  ASSERT_TRUE(wait_terminal("slow"));

  auto task = orchestrator_->get_task_status(TaskId{"slow"});
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->lifecycle.status, NodeStatus::Failed);
  ASSERT_TRUE(task->lifecycle.error_info.has_value());
  EXPECT_EQ(task->lifecycle.error_info->kind, ErrorKind::Timeout);
  ASSERT_TRUE(drive_until(io_, [&] { return runner_->active() == 0; }));
}

TEST_F(StandaloneTaskTest, SubtaskWaitsForParent) {
  runner_->script("parent", Script{.delay = 30ms});
  submit(make_task("parent"));
  auto child = make_task("child");
  child.parent_task_id = TaskId{"parent"};
  submit(std::move(child));
  ASSERT_TRUE(wait_terminal("child"));

  EXPECT_EQ(task_status("child"), NodeStatus::Completed);
  EXPECT_EQ(runner_->order(), (std::vector<std::string>{"parent", "child"}));
  // The parent edge is a regular dependency, so it takes part in cycle checks.
  EXPECT_EQ(store_.task_dependencies(TaskId{"child"}).size(), 1);
}

TEST_F(StandaloneTaskTest, HigherPriorityTaskDispatchesFirst) {
  runner_->script("blocker", Script{.delay = 30ms});
  auto blocker = make_task("blocker");
  blocker.resources = ResourceRequirement{.cpu_cores = 1.0};
  submit(std::move(blocker));
  ASSERT_TRUE(wait_status("blocker", NodeStatus::Running));

  auto low = make_task("low");
  low.priority = 1;
  low.resources = ResourceRequirement{.cpu_cores = 1.0};
  auto high = make_task("high");
  high.priority = 5;
  high.resources = ResourceRequirement{.cpu_cores = 1.0};
  submit(std::move(low));
  submit(std::move(high));
  ASSERT_TRUE(wait_terminal("low"));
  EXPECT_EQ(runner_->order(),
            (std::vector<std::string>{"blocker", "high", "low"}));
  EXPECT_EQ(runner_->max_active(), 1);
}

TEST_F(StandaloneTaskTest, DependencyRulesAreEnforced) {
  runner_->script("a", Script{.hang_first = 1});
  submit(make_task("a"));
  submit(make_task("b"));
  ASSERT_TRUE(depend("b", "a"));
  EXPECT_EQ(depend("a", "b").error(), make_error_code(Error::CycleDetected));
  EXPECT_EQ(depend("b", "a").error(), make_error_code(Error::DuplicateId));
  EXPECT_EQ(depend("b", "ghost").error(),
            make_error_code(Error::MissingReference));
  ASSERT_TRUE(wait_status("a", NodeStatus::Running));
  EXPECT_EQ(depend("a", "b").error(), make_error_code(Error::InvalidState));

  EXPECT_EQ(orchestrator_->submit_task(make_task("a")).error(),
            make_error_code(Error::DuplicateId));
  auto owned = make_task("owned");
  owned.workflow_id = WorkflowId{"wf"};
  EXPECT_EQ(orchestrator_->submit_task(std::move(owned)).error(),
            make_error_code(Error::InvalidArgument));
}

TEST_F(StandaloneTaskTest, CancelStopsRunningTaskAndDependents) {
  runner_->script("a", Script{.hang_first = 1});
  submit(make_task("a"));
  submit(make_task("b"));
  ASSERT_TRUE(depend("b", "a"));
  ASSERT_TRUE(wait_status("a", NodeStatus::Running));

  ASSERT_TRUE(orchestrator_->cancel_task(TaskId{"a"}).has_value());
  ASSERT_TRUE(wait_terminal("b"));
  EXPECT_EQ(task_status("a"), NodeStatus::Cancelled);
  EXPECT_EQ(task_status("b"), NodeStatus::Cancelled);
  ASSERT_TRUE(drive_until(io_, [&] { return runner_->active() == 0; }));
  EXPECT_EQ(runner_->call_count("b"), 0);

  EXPECT_EQ(orchestrator_->cancel_task(TaskId{"a"}).error(),
            make_error_code(Error::InvalidState));
  EXPECT_EQ(orchestrator_->cancel_task(TaskId{"ghost"}).error(),
            make_error_code(Error::NotFound));
}

TEST_F(StandaloneTaskTest, SettledTasksCanStillBeDependedOn) {
  submit(make_task("a"));
  ASSERT_TRUE(wait_terminal("a"));
  // Let a pass drop the settled pool.
  drive_for(io_, 30ms);

  submit(make_task("b"));
  ASSERT_TRUE(depend("b", "a"));
  ASSERT_TRUE(wait_terminal("b"));
  EXPECT_EQ(task_status("b"), NodeStatus::Completed);
  const auto calls = runner_->calls();
  ASSERT_EQ(calls.size(), 2);
  EXPECT_NE(json::find_path(calls[1].input, "upstream.a.step"), nullptr);
}
