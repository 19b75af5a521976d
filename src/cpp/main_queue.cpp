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

namespace ia::collection_loader
{
  MainQueue::MainQueue() : m_owner_thread(std::this_thread::get_id())
  {
  }

  auto MainQueue::post(Mut<Task> task) -> void
  {
    {
      const std::lock_guard<std::mutex> lock(m_queue_mutex);
      m_tasks.emplace_back(std::move(task));
    }
    m_wake_condition.notify_all();
  }

  auto MainQueue::pop_task(MutRef<Task> task) -> bool
  {
    const std::lock_guard<std::mutex> lock(m_queue_mutex);
    if (m_tasks.empty())
    {
      return false;
    }

    task = std::move(m_tasks.front());
    m_tasks.pop_front();
    return true;
  }

  auto MainQueue::run_pending() -> usize
  {
    ensure(is_owner_thread(), "MainQueue can only be pumped from its owner thread");

    Mut<usize> ran = 0;
    Mut<Task> task;
    while (pop_task(task))
    {
      task();
      ++ran;
    }
    return ran;
  }

  auto MainQueue::wait_and_run_one(const std::chrono::milliseconds timeout) -> bool
  {
    ensure(is_owner_thread(), "MainQueue can only be pumped from its owner thread");

    Mut<Task> task;
    {
      Mut<std::unique_lock<std::mutex>> lock(m_queue_mutex);
      if (!m_wake_condition.wait_for(lock, timeout, [this] { return !m_tasks.empty(); }))
      {
        return false;
      }

      task = std::move(m_tasks.front());
      m_tasks.pop_front();
    }

    task();
    return true;
  }

  auto MainQueue::run_until(Ref<std::function<bool()>> predicate, const std::chrono::milliseconds timeout) -> bool
  {
    const std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + timeout;

    while (!predicate())
    {
      const std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
      if (now >= deadline)
      {
        return predicate();
      }

      wait_and_run_one(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    }
    return true;
  }

  auto MainQueue::get_pending_count() const -> usize
  {
    const std::lock_guard<std::mutex> lock(m_queue_mutex);
    return m_tasks.size();
  }
} // namespace ia::collection_loader
