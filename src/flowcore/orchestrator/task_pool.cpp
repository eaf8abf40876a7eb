#include "flowcore/orchestrator/task_pool.hpp"

#include "flowcore/util/log.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <utility>

namespace flowcore {

TaskPool::TaskPool(EngineServices &services)
    : services_(services),
      strand_(boost::asio::make_strand(services.executor)) {}

auto TaskPool::ref(NodeIndex idx) const -> NodeRef {
  return NodeRef{.id = task_node_id(tasks_[idx].id), .workflow_id = {}};
}

auto TaskPool::add(Task task, std::uint64_t submit_seq) -> Result<NodeIndex> {
  if (auto known = index_of(task.id); known != kInvalidNode) {
    return ok(known);
  }
  auto idx = resolver_.add_node(task.id.value());
  if (!idx) {
    return fail(idx.error());
  }
  tasks_.push_back(std::move(task));
  runtime_.push_back(TaskRuntime{.submit_seq = submit_seq});
  return idx;
}

auto TaskPool::add_dependency(const TaskDependency &dep) -> Result<void> {
  const auto up = index_of(dep.depends_on);
  const auto down = index_of(dep.task_id);
  if (up == kInvalidNode || down == kInvalidNode) {
    return fail(Error::MissingReference);
  }
  return resolver_.add_dependency(
      up, down,
      EdgeInfo{.type = dep.type,
               .optional = dep.optional,
               .condition = dep.condition_expression});
}

auto TaskPool::resolve() const -> Resolution {
  return resolver_.resolve(TaskResolveContext{.tasks = tasks_,
                                              .evaluator =
                                                  services_.evaluator});
}

auto TaskPool::transition(NodeIndex idx, NodeStatus from, NodeStatus to,
                          TransitionPayload payload, TimePoint now)
    -> Result<void> {
  if (auto res = services_.states.transition(tasks_[idx].lifecycle, ref(idx),
                                             from, to, std::move(payload), now);
      !res) {
    return res;
  }
  if (from == NodeStatus::Running) {
    release(idx);
  }
  return ok();
}

auto TaskPool::complete(NodeIndex idx, JsonValue output, TimePoint now)
    -> Result<void> {
  return transition(idx, NodeStatus::Running, NodeStatus::Completed,
                    TransitionPayload{.output = std::move(output),
                                      .attempt = runtime_[idx].attempt},
                    now);
}

auto TaskPool::fail(NodeIndex idx, ErrorInfo error, bool retryable,
                    TimePoint now) -> Result<NodeStatus> {
  auto &lc = tasks_[idx].lifecycle;
  std::optional<Duration> delay;
  if (retryable) {
    delay = services_.retry.retry_delay(lc, true);
  }
  auto res = services_.states.fail(lc, ref(idx), lc.status, std::move(error),
                                   delay, now);
  if (res) {
    release(idx);
  }
  return res;
}

auto TaskPool::cancel(NodeIndex idx, ErrorInfo error, TimePoint now)
    -> Result<void> {
  if (auto res = services_.states.cancel(tasks_[idx].lifecycle, ref(idx),
                                         std::move(error), now);
      !res) {
    return res;
  }
  release(idx);
  return ok();
}

auto TaskPool::build_input(NodeIndex idx) const -> JsonValue {
  const auto &task = tasks_[idx];
  JsonValue input = task.execution_context.is_object() ? task.execution_context
                                                       : make_json_object();
  if (task.input_data.is_object()) {
    json::merge_into(input, task.input_data);
  } else if (!task.input_data.is_null()) {
    input.get_object().insert_or_assign("input", task.input_data);
  }
  auto upstream = make_json_object();
  for (auto up : resolver_.upstream_of(idx)) {
    const auto &t = tasks_[up];
    if (t.lifecycle.status == NodeStatus::Completed) {
      upstream.get_object().insert_or_assign(t.id.str(),
                                             t.lifecycle.output_data);
    }
  }
  input.get_object().insert_or_assign("upstream", std::move(upstream));
  return input;
}

auto TaskPool::clear_if_settled() -> bool {
  if (tasks_.empty()) {
    return false;
  }
  const bool settled = std::ranges::all_of(tasks_, [](const Task &t) {
    return is_terminal(t.lifecycle.status);
  });
  if (!settled) {
    return false;
  }
  log::debug("task pool settled; dropping {} tasks", tasks_.size());
  tasks_.clear();
  runtime_.clear();
  resolver_ = DependencyResolver{};
  return true;
}

auto TaskPool::release(NodeIndex idx) -> void {
  auto &rt = runtime_[idx];
  if (rt.admission) {
    if (auto res = services_.allocator.release(*rt.admission); !res) {
      log::error("releasing admission of task {} failed: {}", tasks_[idx].id,
                 res.error().message());
    }
    rt.admission.reset();
  }
  if (auto signal = std::exchange(rt.cancel, nullptr)) {
    boost::asio::post(strand_, [signal] {
      signal->emit(boost::asio::cancellation_type::terminal);
    });
  }
}

} // namespace flowcore
