// IA-CollectionLoader; C++ 20 Paged Collection Loading.
// Copyright (C) 2026 IAS (ias@iasoft.dev)
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <collection_loader/main_queue.hpp>
#include <collection_loader/operation.hpp>
#include <collection_loader/worker_pool.hpp>

#include <iatest/iatest.hpp>

using namespace ia;
using namespace ia::collection_loader;

IAT_BEGIN_BLOCK(Core, Operation)

auto test_runs_when_enqueued() -> bool
{
  const std::shared_ptr<MainQueue> queue = std::make_shared<MainQueue>();
  Mut<i32> runs = 0;

  const std::shared_ptr<Operation> operation = Operation::create("single", [&runs](Ref<CancellationCheck>) { runs++; });
  IAT_CHECK(operation->get_state() == Operation::State::Created);

  operation->enqueue(queue);
  IAT_CHECK(operation->get_state() == Operation::State::Scheduled);

  IAT_CHECK_EQ(queue->run_pending(), static_cast<usize>(1));
  IAT_CHECK_EQ(runs, 1);
  IAT_CHECK(operation->is_finished());
  IAT_CHECK(operation->did_run_body());

  return true;
}

auto test_dependencies_order_execution() -> bool
{
  const std::shared_ptr<MainQueue> queue = std::make_shared<MainQueue>();
  Mut<Vec<i32>> order;

  const std::shared_ptr<Operation> first = Operation::create("first", [&order](Ref<CancellationCheck>) { order.push_back(1); });
  const std::shared_ptr<Operation> second =
      Operation::create("second", [&order](Ref<CancellationCheck>) { order.push_back(2); });
  const std::shared_ptr<Operation> third = Operation::create("third", [&order](Ref<CancellationCheck>) { order.push_back(3); });

  third->add_dependency(second);
  second->add_dependency(first);

  // Enqueued in reverse: the graph decides, not the posting order.
  third->enqueue(queue);
  second->enqueue(queue);
  IAT_CHECK_EQ(queue->run_pending(), static_cast<usize>(0));
  IAT_CHECK(third->get_state() == Operation::State::Waiting);

  first->enqueue(queue);
  IAT_CHECK_EQ(queue->run_pending(), static_cast<usize>(3));

  IAT_CHECK(order == (Vec<i32>{1, 2, 3}));

  return true;
}

auto test_dependency_on_finished_operation() -> bool
{
  const std::shared_ptr<MainQueue> queue = std::make_shared<MainQueue>();

  const std::shared_ptr<Operation> done = Operation::create("done", [](Ref<CancellationCheck>) {});
  done->enqueue(queue);
  queue->run_pending();
  IAT_CHECK(done->is_finished());

  Mut<bool> ran = false;
  const std::shared_ptr<Operation> later = Operation::create("later", [&ran](Ref<CancellationCheck>) { ran = true; });
  later->add_dependency(done);
  later->enqueue(queue);
  queue->run_pending();

  IAT_CHECK(ran);

  return true;
}

auto test_cancelled_operation_skips_body_but_releases_dependents() -> bool
{
  const std::shared_ptr<MainQueue> queue = std::make_shared<MainQueue>();
  Mut<bool> body_ran = false;
  Mut<bool> dependent_ran = false;

  const std::shared_ptr<Operation> cancelled =
      Operation::create("cancelled", [&body_ran](Ref<CancellationCheck>) { body_ran = true; });
  const std::shared_ptr<Operation> dependent =
      Operation::create("dependent", [&dependent_ran](Ref<CancellationCheck>) { dependent_ran = true; });
  dependent->add_dependency(cancelled);

  cancelled->cancel();
  cancelled->enqueue(queue);
  dependent->enqueue(queue);
  queue->run_pending();

  IAT_CHECK_NOT(body_ran);
  IAT_CHECK(cancelled->is_finished());
  IAT_CHECK(cancelled->is_cancelled());
  IAT_CHECK_NOT(cancelled->did_run_body());
  IAT_CHECK(dependent_ran);

  return true;
}

auto test_cancelled_operation_still_waits_for_dependencies() -> bool
{
  const std::shared_ptr<MainQueue> queue = std::make_shared<MainQueue>();
  Mut<Vec<String>> order;

  const std::shared_ptr<Operation> before =
      Operation::create("before", [&order](Ref<CancellationCheck>) { order.push_back("before"); });
  const std::shared_ptr<Operation> cancelled =
      Operation::create("cancelled", [&order](Ref<CancellationCheck>) { order.push_back("cancelled"); });
  const std::shared_ptr<Operation> after =
      Operation::create("after", [&order](Ref<CancellationCheck>) { order.push_back("after"); });

  cancelled->add_dependency(before);
  after->add_dependency(cancelled);
  cancelled->cancel();

  after->enqueue(queue);
  cancelled->enqueue(queue);
  IAT_CHECK_EQ(queue->run_pending(), static_cast<usize>(0));
  IAT_CHECK_NOT(cancelled->is_finished());

  before->enqueue(queue);
  queue->run_pending();

  IAT_CHECK(order == (Vec<String>{"before", "after"}));

  return true;
}

auto test_cancellation_check_trips() -> bool
{
  const std::shared_ptr<Operation> operation = Operation::create("check", [](Ref<CancellationCheck>) {});
  const CancellationCheck check = operation->get_cancellation_check();

  IAT_CHECK(check().has_value());
  IAT_CHECK_NOT(check.is_cancelled());

  operation->cancel();
  operation->cancel();

  IAT_CHECK(check.is_cancelled());
  IAT_CHECK_NOT(check().has_value());

  return true;
}

auto test_cross_executor_chain() -> bool
{
  const std::shared_ptr<MainQueue> main_queue = std::make_shared<MainQueue>();
  const std::shared_ptr<WorkerPool> pool = std::make_shared<WorkerPool>();
  IAT_CHECK(pool->initialize(2).has_value());

  const std::thread::id main_thread = std::this_thread::get_id();
  Mut<std::atomic<bool>> ran_on_worker{false};
  Mut<bool> ran_on_main = false;

  const std::shared_ptr<Operation> work = Operation::create("work", [&](Ref<CancellationCheck>) {
    ran_on_worker = std::this_thread::get_id() != main_thread;
  });
  const std::shared_ptr<Operation> done = Operation::create("done", [&](Ref<CancellationCheck>) {
    ran_on_main = std::this_thread::get_id() == main_thread;
  });
  done->add_dependency(work);

  done->enqueue(main_queue);
  work->enqueue(pool);

  IAT_CHECK(main_queue->run_until([&] { return done->is_finished(); }, std::chrono::seconds(5)));
  IAT_CHECK(ran_on_worker.load());
  IAT_CHECK(ran_on_main);

  pool->terminate();
  return true;
}

auto test_wait_until_finished() -> bool
{
  const std::shared_ptr<WorkerPool> pool = std::make_shared<WorkerPool>();
  IAT_CHECK(pool->initialize(1).has_value());

  Mut<std::atomic<i32>> value{0};
  const std::shared_ptr<Operation> operation = Operation::create("slow", [&value](Ref<CancellationCheck>) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    value = 42;
  });
  operation->enqueue(pool);
  operation->wait_until_finished();

  IAT_CHECK_EQ(value.load(), 42);

  pool->terminate();
  return true;
}

auto test_body_released_after_run() -> bool
{
  const std::shared_ptr<MainQueue> queue = std::make_shared<MainQueue>();

  Mut<std::shared_ptr<i32>> captured = std::make_shared<i32>(7);
  const std::weak_ptr<i32> weak_captured = captured;
  const std::shared_ptr<Operation> operation =
      Operation::create("holder", [captured](Ref<CancellationCheck>) { AU_UNUSED(captured); });
  captured.reset();

  IAT_CHECK_NOT(weak_captured.expired());

  operation->enqueue(queue);
  queue->run_pending();

  IAT_CHECK(operation->is_finished());
  IAT_CHECK(weak_captured.expired());

  return true;
}

auto test_graph_freed_with_its_executor() -> bool
{
  Mut<std::shared_ptr<MainQueue>> queue = std::make_shared<MainQueue>();

  Mut<std::shared_ptr<Operation>> first = Operation::create("first", [](Ref<CancellationCheck>) {});
  Mut<std::shared_ptr<Operation>> second = Operation::create("second", [](Ref<CancellationCheck>) {});
  second->add_dependency(first);
  second->enqueue(queue);
  first->enqueue(queue);

  const std::weak_ptr<Operation> weak_first = first;
  const std::weak_ptr<Operation> weak_second = second;
  first.reset();
  second.reset();

  // The posted first operation holds the rest of the graph.
  IAT_CHECK_NOT(weak_first.expired());
  IAT_CHECK_NOT(weak_second.expired());

  queue.reset();

  IAT_CHECK(weak_first.expired());
  IAT_CHECK(weak_second.expired());

  return true;
}

auto test_operation_dropped_when_executor_gone() -> bool
{
  const std::shared_ptr<MainQueue> queue = std::make_shared<MainQueue>();
  Mut<std::shared_ptr<MainQueue>> other_queue = std::make_shared<MainQueue>();
  Mut<bool> ran = false;

  const std::shared_ptr<Operation> first = Operation::create("first", [](Ref<CancellationCheck>) {});
  const std::shared_ptr<Operation> second = Operation::create("second", [&ran](Ref<CancellationCheck>) { ran = true; });
  second->add_dependency(first);
  second->enqueue(other_queue);
  first->enqueue(queue);

  other_queue.reset();
  IAT_CHECK_EQ(queue->run_pending(), static_cast<usize>(1));

  IAT_CHECK(first->is_finished());
  IAT_CHECK_NOT(ran);
  IAT_CHECK_NOT(second->is_finished());
  IAT_CHECK(second->get_state() == Operation::State::Waiting);

  return true;
}

IAT_BEGIN_TEST_LIST()
IAT_ADD_TEST(test_runs_when_enqueued);
IAT_ADD_TEST(test_dependencies_order_execution);
IAT_ADD_TEST(test_dependency_on_finished_operation);
IAT_ADD_TEST(test_cancelled_operation_skips_body_but_releases_dependents);
IAT_ADD_TEST(test_cancelled_operation_still_waits_for_dependencies);
IAT_ADD_TEST(test_cancellation_check_trips);
IAT_ADD_TEST(test_cross_executor_chain);
IAT_ADD_TEST(test_wait_until_finished);
IAT_ADD_TEST(test_body_released_after_run);
IAT_ADD_TEST(test_graph_freed_with_its_executor);
IAT_ADD_TEST(test_operation_dropped_when_executor_gone);
IAT_END_TEST_LIST()

IAT_END_BLOCK()

IAT_REGISTER_ENTRY(Core, Operation)
