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

#pragma once

#include <collection_loader/executor.hpp>

#include <chrono>
#include <deque>
#include <mutex>
#include <thread>
#include <condition_variable>

namespace ia::collection_loader
{
  // The coordination context. Any thread may post; only the owner thread (the one that constructed the queue) runs
  // the tasks, in posting order, when it pumps the queue.
  class MainQueue final : public Executor
  {
public:
    MainQueue();

    MainQueue(Ref<MainQueue>) = delete;
    auto operator=(Ref<MainQueue>) -> MainQueue & = delete;

    auto post(Mut<Task> task) -> void override;

    // Runs tasks until the queue is empty, including tasks posted by the tasks being run.
    // @return the number of tasks that ran.
    auto run_pending() -> usize;

    // Waits up to `timeout` for a task and runs it. @return false on timeout.
    auto wait_and_run_one(const std::chrono::milliseconds timeout) -> bool;

    // Pumps the queue until `predicate` holds or `timeout` elapses. @return the last value of `predicate`.
    auto run_until(Ref<std::function<bool()>> predicate, const std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto get_pending_count() const -> usize;

    [[nodiscard]] auto is_owner_thread() const -> bool
    {
      return std::this_thread::get_id() == m_owner_thread;
    }

private:
    auto pop_task(MutRef<Task> task) -> bool;

private:
    const std::thread::id m_owner_thread;

    mutable Mut<std::mutex> m_queue_mutex;
    Mut<std::condition_variable> m_wake_condition;
    Mut<std::deque<Task>> m_tasks;
  };
} // namespace ia::collection_loader
