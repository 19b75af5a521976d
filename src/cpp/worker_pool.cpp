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

#include <collection_loader/worker_pool.hpp>
#include <collection_loader/logger.hpp>

namespace ia::collection_loader
{
  WorkerPool::~WorkerPool()
  {
    terminate();
  }

  auto WorkerPool::initialize(Mut<u8> worker_count) -> Result<void>
  {
    const std::lock_guard<std::mutex> lock(m_queue_mutex);
    if (m_running)
    {
      return fail("Worker pool is already running with {} workers", m_workers.size());
    }

    if (worker_count == 0)
    {
      const u32 hw_concurrency = std::thread::hardware_concurrency();
      Mut<u32> threads = 2;
      if (hw_concurrency > 2)
      {
        threads = hw_concurrency - 2;
      }

      if (threads > 255)
      {
        threads = 255;
      }
      worker_count = static_cast<u8>(threads);
    }

    for (Mut<u32> i = 0; i < worker_count; ++i)
    {
      spawn_worker();
    }
    m_running = true;

    Logger::debug("Worker pool started with {} workers", worker_count);
    return {};
  }

  auto WorkerPool::terminate() -> void
  {
    Mut<Vec<std::jthread>> workers;
    {
      const std::lock_guard<std::mutex> lock(m_queue_mutex);
      if (!m_running)
      {
        return;
      }
      m_running = false;

      // Under the lock, so no worker can miss the stop between its predicate check and its wait.
      for (MutRef<std::jthread> worker : m_workers)
      {
        worker.request_stop();
      }
      workers.swap(m_workers);
    }

    m_wake_condition.notify_all();

    for (MutRef<std::jthread> worker : workers)
    {
      if (worker.joinable())
      {
        worker.join();
      }
    }

    Logger::debug("Worker pool stopped, {} workers joined", workers.size());
  }

  auto WorkerPool::post(Mut<Task> task) -> void
  {
    {
      const std::lock_guard<std::mutex> lock(m_queue_mutex);
      ensure(m_running, "Worker pool must be initialized before posting tasks");

      m_outstanding.fetch_add(1);
      m_queue.emplace_back(std::move(task));
      if (m_idle_workers < m_queue.size())
      {
        spawn_worker();
        Logger::trace("Worker pool grew to {} workers", m_workers.size());
      }
    }
    m_wake_condition.notify_one();
  }

  auto WorkerPool::wait_until_idle() -> void
  {
    Mut<i32> current_val = m_outstanding.load();
    while (current_val > 0)
    {
      m_outstanding.wait(current_val);
      current_val = m_outstanding.load();
    }
  }

  auto WorkerPool::get_worker_count() const -> WorkerId
  {
    const std::lock_guard<std::mutex> lock(m_queue_mutex);
    return static_cast<WorkerId>(m_workers.size());
  }

  auto WorkerPool::spawn_worker() -> void
  {
    const WorkerId worker_id = static_cast<WorkerId>(m_workers.size() + 1);
    ++m_idle_workers;
    m_workers.emplace_back([this](Mut<std::stop_token> stop_token, const WorkerId id) {
      worker_loop(std::move(stop_token), id);
    }, worker_id);
  }

  auto WorkerPool::finish_task() -> void
  {
    if (m_outstanding.fetch_sub(1) == 1)
    {
      m_outstanding.notify_all();
    }
  }

  auto WorkerPool::worker_loop(const std::stop_token stop_token, const WorkerId worker_id) -> void
  {
    Logger::trace("Worker {} running", worker_id);

    Mut<std::unique_lock<std::mutex>> lock(m_queue_mutex);
    while (true)
    {
      m_wake_condition.wait(lock, [this, &stop_token] { return !m_queue.empty() || stop_token.stop_requested(); });

      if (m_queue.empty())
      {
        // Stop was requested and the queue is drained.
        --m_idle_workers;
        return;
      }

      Mut<Task> task = std::move(m_queue.front());
      m_queue.pop_front();
      --m_idle_workers;
      lock.unlock();

      task();
      task = nullptr;
      finish_task();

      lock.lock();
      ++m_idle_workers;
    }
  }
} // namespace ia::collection_loader
