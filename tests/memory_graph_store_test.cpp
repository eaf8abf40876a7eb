#include "flowcore/storage/memory_graph_store.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace flowcore;
using namespace flowcore::test;

class MemoryGraphStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(
        store_.save_graph(make_graph("wf", {task_step("a"), task_step("b")}))
            .has_value());
  }

  auto node(std::string_view step) const -> NodeRef {
    return NodeRef{.id = step_node_id(WorkflowId{"wf"}, StepId{step}),
                   .workflow_id = WorkflowId{"wf"}};
  }

  static auto make_task(std::string_view id,
                        std::optional<TaskId> parent = std::nullopt) -> Task {
    return Task{.id = TaskId{id},
                .name = std::string(id),
                .task_type = "noop",
                .parent_task_id = std::move(parent)};
  }

  MemoryGraphStore store_;
};

TEST_F(MemoryGraphStoreTest, SaveAndLoadGraph) {
  auto graph = store_.load_graph(WorkflowId{"wf"});
  ASSERT_TRUE(graph.has_value());
  EXPECT_EQ(graph->steps.size(), 2);
  EXPECT_EQ(graph->steps[1].id, StepId{"b"});

  auto missing = store_.load_graph(WorkflowId{"nope"});
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::NotFound));
}

TEST_F(MemoryGraphStoreTest, GraphWithoutIdIsRejected) {
  auto res = store_.save_graph(make_graph("", {task_step("a")}));
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(MemoryGraphStoreTest, TransitionUpdatesPersistedStep) {
  ASSERT_TRUE(store_.save_transition(node("a"), NodeStatus::Pending,
                                     NodeStatus::Queued, {})
                  .has_value());
  EXPECT_EQ(store_.node_status(node("a").id), NodeStatus::Queued);

  auto graph = store_.load_graph(WorkflowId{"wf"});
  ASSERT_TRUE(graph.has_value());
  EXPECT_EQ(graph->steps[0].lifecycle.status, NodeStatus::Queued);
  EXPECT_EQ(graph->steps[1].lifecycle.status, NodeStatus::Pending);
}

TEST_F(MemoryGraphStoreTest, ReplayedTransitionIsConflictWithoutAudit) {
  ASSERT_TRUE(store_.save_transition(node("a"), NodeStatus::Pending,
                                     NodeStatus::Queued,
                                     TransitionPayload{.detail = "first"})
                  .has_value());
  const auto audit_before = store_.audit_size();

  auto replay = store_.save_transition(node("a"), NodeStatus::Pending,
                                       NodeStatus::Queued,
                                       TransitionPayload{.detail = "first"});
  ASSERT_FALSE(replay.has_value());
  EXPECT_EQ(replay.error(), make_error_code(Error::Conflict));
  EXPECT_EQ(store_.audit_size(), audit_before);
  EXPECT_EQ(store_.node_status(node("a").id), NodeStatus::Queued);

  const auto trail = store_.audit_trail(WorkflowId{"wf"});
  EXPECT_EQ(trace_of(trail, WorkflowId{"wf"}, "a"),
            (std::vector<std::string>{"queued"}));
}

TEST_F(MemoryGraphStoreTest, AuditEntriesAreOrderedAndDescribed) {
  ASSERT_TRUE(store_.save_transition(node("a"), NodeStatus::Pending,
                                     NodeStatus::Queued, {}));
  ASSERT_TRUE(store_.save_transition(node("a"), NodeStatus::Queued,
                                     NodeStatus::Running, {}));
  ASSERT_TRUE(store_.save_transition(
      node("a"), NodeStatus::Running, NodeStatus::Failed,
      TransitionPayload{.error = ErrorInfo{.kind = ErrorKind::Timeout,
                                           .message = "too slow"}}));

  const auto trail = store_.audit_trail(WorkflowId{"wf"});
  ASSERT_GE(trail.size(), 4);
  for (std::size_t i = 1; i < trail.size(); ++i) {
    EXPECT_LT(trail[i - 1].seq, trail[i].seq);
  }
  const auto *failed = find_entry(trail, WorkflowId{"wf"}, "a", "failed");
  ASSERT_NE(failed, nullptr);
  EXPECT_EQ(failed->from, "running");
  EXPECT_EQ(failed->detail, "timeout: too slow");

  auto graph = store_.load_graph(WorkflowId{"wf"});
  ASSERT_TRUE(graph.has_value());
  ASSERT_TRUE(graph->steps[0].lifecycle.error_info.has_value());
  EXPECT_EQ(graph->steps[0].lifecycle.error_info->kind, ErrorKind::Timeout);
}

TEST_F(MemoryGraphStoreTest, WorkflowTransitionIsCompareAndSwap) {
  auto next = store_.load_graph(WorkflowId{"wf"})->workflow;
  next.status = WorkflowStatus::Ready;
  ASSERT_TRUE(store_.save_workflow_transition(next, WorkflowStatus::Draft, "ok"));
  auto stale = store_.save_workflow_transition(next, WorkflowStatus::Draft, "ok");
  ASSERT_FALSE(stale.has_value());
  EXPECT_EQ(stale.error(), make_error_code(Error::Conflict));
  EXPECT_EQ(store_.load_graph(WorkflowId{"wf"})->workflow.status,
            WorkflowStatus::Ready);
}

TEST_F(MemoryGraphStoreTest, WorkflowTransitionKeepsResultsAndRootCause) {
  auto next = store_.load_graph(WorkflowId{"wf"})->workflow;
  next.status = WorkflowStatus::Ready;
  next.completed_at = Clock::now();
  next.results = json_of(R"({"a": {"rows": 3}})");
  next.root_cause = RootCause{.step_id = StepId{"a"},
                              .error = ErrorInfo{.kind = ErrorKind::Timeout,
                                                 .message = "too slow"}};
  ASSERT_TRUE(store_.save_workflow_transition(next, WorkflowStatus::Draft, "ok"));

  const auto stored = store_.load_graph(WorkflowId{"wf"})->workflow;
  EXPECT_EQ(stored.completed_at, next.completed_at);
  ASSERT_NE(json::find_path(stored.results, "a.rows"), nullptr);
  ASSERT_TRUE(stored.root_cause.has_value());
  EXPECT_EQ(stored.root_cause->step_id, StepId{"a"});
}

TEST_F(MemoryGraphStoreTest, TransitionStoresFullLifecycle) {
  NodeLifecycle next;
  next.status = NodeStatus::Queued;
  next.retry_count = 2;
  next.max_retries = 3;
  next.started_at = Clock::now();
  ASSERT_TRUE(store_.save_transition(node("a"), NodeStatus::Pending,
                                     NodeStatus::Queued,
                                     TransitionPayload{.lifecycle = next})
                  .has_value());
  const auto lc = store_.load_graph(WorkflowId{"wf"})->steps[0].lifecycle;
  EXPECT_EQ(lc.status, NodeStatus::Queued);
  EXPECT_EQ(lc.retry_count, 2);
  EXPECT_EQ(lc.started_at, next.started_at);
}

TEST_F(MemoryGraphStoreTest, UnknownNodeIsNotFound) {
  auto res = store_.save_transition(node("ghost"), NodeStatus::Pending,
                                    NodeStatus::Queued, {});
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), make_error_code(Error::NotFound));
}

TEST_F(MemoryGraphStoreTest, TaskRoundTripAndStatusRecord) {
  auto task = make_task("t1");
  task.lifecycle.max_retries = 2;
  ASSERT_TRUE(store_.save_task(task).has_value());

  auto loaded = store_.load_task(TaskId{"t1"});
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->task_type, "noop");
  EXPECT_EQ(loaded->lifecycle.max_retries, 2);

  const NodeRef ref{.id = task_node_id(TaskId{"t1"})};
  ASSERT_TRUE(store_.save_transition(ref, NodeStatus::Pending,
                                     NodeStatus::Queued, {}));
  EXPECT_EQ(store_.load_task(TaskId{"t1"})->lifecycle.status,
            NodeStatus::Queued);
}

TEST_F(MemoryGraphStoreTest, TaskOverRetryBudgetIsRejected) {
  auto task = make_task("t1");
  task.lifecycle.max_retries = 1;
  task.lifecycle.retry_count = 2;
  auto res = store_.save_task(task);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(MemoryGraphStoreTest, TaskDependencyCycleIsRejected) {
  for (auto id : {"t1", "t2", "t3"}) {
    ASSERT_TRUE(store_.save_task(make_task(id)).has_value());
  }
  ASSERT_TRUE(store_.add_task_dependency(
      TaskDependency{.task_id = TaskId{"t2"}, .depends_on = TaskId{"t1"}}));
  ASSERT_TRUE(store_.add_task_dependency(
      TaskDependency{.task_id = TaskId{"t3"}, .depends_on = TaskId{"t2"}}));

  auto cycle = store_.add_task_dependency(
      TaskDependency{.task_id = TaskId{"t1"}, .depends_on = TaskId{"t3"}});
  ASSERT_FALSE(cycle.has_value());
  EXPECT_EQ(cycle.error(), make_error_code(Error::CycleDetected));
  EXPECT_TRUE(store_.task_dependencies(TaskId{"t1"}).empty());
  EXPECT_EQ(store_.task_dependencies(TaskId{"t3"}).size(), 1);

  auto dangling = store_.add_task_dependency(
      TaskDependency{.task_id = TaskId{"t1"}, .depends_on = TaskId{"ghost"}});
  EXPECT_EQ(dangling.error(), make_error_code(Error::MissingReference));
}

TEST_F(MemoryGraphStoreTest, DeleteTaskRemovesSubtasksAndEdges) {
  ASSERT_TRUE(store_.save_task(make_task("parent")));
  ASSERT_TRUE(store_.save_task(make_task("child", TaskId{"parent"})));
  ASSERT_TRUE(store_.save_task(make_task("grandchild", TaskId{"child"})));
  ASSERT_TRUE(store_.save_task(make_task("other")));
  ASSERT_TRUE(store_.add_task_dependency(
      TaskDependency{.task_id = TaskId{"other"}, .depends_on = TaskId{"child"}}));

  auto removed = store_.delete_task(TaskId{"parent"});
  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(*removed, 3);
  EXPECT_FALSE(store_.load_task(TaskId{"grandchild"}).has_value());
  EXPECT_TRUE(store_.load_task(TaskId{"other"}).has_value());
  EXPECT_TRUE(store_.task_dependencies(TaskId{"other"}).empty());

  EXPECT_EQ(store_.delete_task(TaskId{"parent"}).error(),
            make_error_code(Error::NotFound));
}
