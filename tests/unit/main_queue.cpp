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

#include <iatest/iatest.hpp>

using namespace ia;
using namespace ia::collection_loader;

IAT_BEGIN_BLOCK(Core, MainQueue)

auto test_runs_in_posting_order() -> bool
{
  MainQueue queue;
  Mut<Vec<i32>> order;

  for (Mut<i32> i = 0; i < 5; ++i)
  {
    queue.post([&order, i]() { order.push_back(i); });
  }
  IAT_CHECK_EQ(queue.get_pending_count(), static_cast<usize>(5));

  IAT_CHECK_EQ(queue.run_pending(), static_cast<usize>(5));
  IAT_CHECK(order == (Vec<i32>{0, 1, 2, 3, 4}));
  IAT_CHECK_EQ(queue.get_pending_count(), static_cast<usize>(0));

  return true;
}

auto test_run_pending_includes_reposted_tasks() -> bool
{
  MainQueue queue;
  Mut<i32> runs = 0;

  queue.post([&]() {
    runs++;
    queue.post([&]() { runs++; });
  });

  IAT_CHECK_EQ(queue.run_pending(), static_cast<usize>(2));
  IAT_CHECK_EQ(runs, 2);

  return true;
}

auto test_tasks_posted_from_other_threads() -> bool
{
  MainQueue queue;
  Mut<i32> received = 0;
  const std::thread::id owner = std::this_thread::get_id();
  Mut<bool> always_on_owner = true;

  Mut<Vec<std::jthread>> producers;
  for (Mut<i32> i = 0; i < 4; ++i)
  {
    producers.emplace_back([&]() {
      for (Mut<i32> j = 0; j < 25; ++j)
      {
        queue.post([&]() {
          received++;
          always_on_owner = always_on_owner && std::this_thread::get_id() == owner;
        });
      }
    });
  }

  IAT_CHECK(queue.run_until([&] { return received == 100; }, std::chrono::seconds(5)));
  IAT_CHECK(always_on_owner);
  IAT_CHECK(queue.is_owner_thread());

  return true;
}

auto test_wait_times_out() -> bool
{
  MainQueue queue;

  IAT_CHECK_NOT(queue.wait_and_run_one(std::chrono::milliseconds(10)));
  IAT_CHECK_NOT(queue.run_until([] { return false; }, std::chrono::milliseconds(20)));

  Mut<bool> ran = false;
  queue.post([&]() { ran = true; });
  IAT_CHECK(queue.wait_and_run_one(std::chrono::milliseconds(10)));
  IAT_CHECK(ran);

  return true;
}

IAT_BEGIN_TEST_LIST()
IAT_ADD_TEST(test_runs_in_posting_order);
IAT_ADD_TEST(test_run_pending_includes_reposted_tasks);
IAT_ADD_TEST(test_tasks_posted_from_other_threads);
IAT_ADD_TEST(test_wait_times_out);
IAT_END_TEST_LIST()

IAT_END_BLOCK()

IAT_REGISTER_ENTRY(Core, MainQueue)
